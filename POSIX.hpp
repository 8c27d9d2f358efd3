#ifndef POSIX_DOT_HPP
#define POSIX_DOT_HPP

#include <chrono>
#include <ios>

#include <unistd.h>

class POSIX {
public:
  POSIX()             = delete;
  POSIX(POSIX const&) = delete;

  static void set_nonblocking(int fd);

  static bool input_ready(int fd_in, std::chrono::milliseconds wait);

  // Read one datagram from a connected, non-blocking socket.  Returns
  // -1 on failure; t_o is set if that failure was a timeout.
  static std::streamsize recv(int                       fd,
                              char*                     s,
                              std::streamsize           n,
                              std::chrono::milliseconds timeout,
                              bool&                     t_o);
};

#endif // POSIX_DOT_HPP
