#include "POSIX.hpp"

#include <cstring>

#include <sys/socket.h>

#include <glog/logging.h>

int main(int argc, char* argv[])
{
  int fds[2];
  PCHECK(socketpair(AF_UNIX, SOCK_DGRAM, 0, fds) == 0);

  POSIX::set_nonblocking(fds[0]);
  POSIX::set_nonblocking(fds[1]);

  CHECK(!POSIX::input_ready(fds[0], std::chrono::milliseconds(1)));

  char bfr[512];
  auto t_o{false};
  CHECK_EQ(POSIX::recv(fds[0], bfr, sizeof(bfr), std::chrono::milliseconds(10),
                       t_o),
           -1);
  CHECK(t_o);

  char const msg[] = "datagram";
  PCHECK(send(fds[1], msg, sizeof(msg), 0) == ssize_t(sizeof(msg)));
  CHECK(POSIX::input_ready(fds[0], std::chrono::milliseconds(100)));

  t_o = false;
  auto const n = POSIX::recv(fds[0], bfr, sizeof(bfr),
                             std::chrono::milliseconds(100), t_o);
  CHECK(!t_o);
  CHECK_EQ(n, std::streamsize(sizeof(msg)));
  CHECK_EQ(std::memcmp(bfr, msg, sizeof(msg)), 0);

  close(fds[0]);
  close(fds[1]);
}
