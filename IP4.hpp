#ifndef IP4_DOT_HPP
#define IP4_DOT_HPP

#include <string_view>

#include <netinet/in.h>

namespace IP4 {
auto is_address(std::string_view addr) -> bool;

// Socket address for addr on port; false if addr isn't one inet_pton(3)
// takes.
auto to_sockaddr(std::string_view addr, uint16_t port, sockaddr_in& in4)
    -> bool;
} // namespace IP4

#endif // IP4_DOT_HPP
