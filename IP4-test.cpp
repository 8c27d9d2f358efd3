#include "IP4.hpp"

#include <arpa/inet.h>

#include <glog/logging.h>

int main(int argc, char const* argv[])
{
  using IP4::is_address;
  using IP4::to_sockaddr;

  CHECK(is_address("0.0.0.0"));
  CHECK(is_address("69.0.0.0"));
  CHECK(is_address("160.0.0.0"));
  CHECK(is_address("250.0.0.0"));
  CHECK(is_address("255.0.0.1"));
  CHECK(is_address("127.0.0.1"));
  CHECK(is_address("9.9.9.9"));
  CHECK(is_address("99.99.99.99"));

  CHECK(!is_address("127.0.0.1."));
  CHECK(!is_address("foo.bar"));
  CHECK(!is_address(""));
  CHECK(!is_address("[69.0.0.0]"));
  CHECK(!is_address("2001:db8::1"));

  // This is acceptable:
  CHECK(is_address("001.001.001.001"));
  // but not:
  CHECK(!is_address("0001.0.0.0"));

  CHECK(!is_address("256.0.0.0"));
  CHECK(!is_address("1.300.0.0"));
  CHECK(!is_address("1.1.1000.0"));
  CHECK(!is_address("1.1.1.260"));

  sockaddr_in in4{};
  CHECK(to_sockaddr("198.41.0.4", 53, in4));
  CHECK_EQ(in4.sin_family, AF_INET);
  CHECK_EQ(ntohs(in4.sin_port), 53);
  CHECK_EQ(ntohl(in4.sin_addr.s_addr), 0xc6290004u);

  CHECK(!to_sockaddr("a.root-servers.net", 53, in4));
  CHECK(!to_sockaddr("1.2.3.256", 53, in4));
}
