#include "POSIX.hpp"

#include <glog/logging.h>

#include <cerrno>

#include <fcntl.h>
#include <sys/select.h>
#include <sys/socket.h>

using std::chrono::duration_cast;
using std::chrono::milliseconds;
using std::chrono::seconds;
using std::chrono::steady_clock;

void POSIX::set_nonblocking(int fd)
{
  int flags;
  PCHECK((flags = fcntl(fd, F_GETFL, 0)) != -1);
  if (0 == (flags & O_NONBLOCK)) {
    PCHECK(fcntl(fd, F_SETFL, flags | O_NONBLOCK) != -1);
  }
}

bool POSIX::input_ready(int fd_in, milliseconds wait)
{
  auto fds{fd_set{}};
  FD_ZERO(&fds);
  FD_SET(fd_in, &fds);

  auto tv{timeval{}};
  tv.tv_sec  = duration_cast<seconds>(wait).count();
  tv.tv_usec = (wait.count() % 1000) * 1000;

  int puts;
  while ((puts = select(fd_in + 1, &fds, nullptr, nullptr, &tv)) == -1) {
    PCHECK(errno == EINTR) << "error from select(2)";
  }

  return 0 != puts;
}

std::streamsize POSIX::recv(int                       fd,
                            char*                     s,
                            std::streamsize           n,
                            std::chrono::milliseconds timeout,
                            bool&                     t_o)
{
  auto const end_time = steady_clock::now() + timeout;

  for (;;) {
    auto const n_ret = ::recv(fd, static_cast<void*>(s), n, 0);

    if (n_ret >= 0)
      return n_ret;

    switch (errno) {
    case EINTR: break; // try recv again

    case EWOULDBLOCK:
#if EAGAIN != EWOULDBLOCK
    case EAGAIN:
#endif
      break;

    // ICMP errors come back on the next call on a connected UDP socket.
    case ECONNREFUSED:
    case ECONNRESET:
    case EHOSTUNREACH:
    case ENETUNREACH:
      PLOG(WARNING) << "recv(2) failed";
      return -1;

    default: PLOG(FATAL) << "error from recv(2)";
    }

    auto const now = steady_clock::now();
    if (now < end_time) {
      auto const time_left = duration_cast<milliseconds>(end_time - now);
      if (input_ready(fd, time_left))
        continue; // try recv again
      if (steady_clock::now() < end_time)
        continue; // select(2) woke early
    }
    t_o = true;
    return -1;
  }
}
