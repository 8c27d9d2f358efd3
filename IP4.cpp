#include "IP4.hpp"

#include <string>

#include <arpa/inet.h>

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/abnf.hpp>

using tao::pegtl::eof;
using tao::pegtl::memory_input;
using tao::pegtl::one;
using tao::pegtl::parse;
using tao::pegtl::range;
using tao::pegtl::rep;
using tao::pegtl::rep_min_max;
using tao::pegtl::seq;
using tao::pegtl::sor;
using tao::pegtl::string;

using tao::pegtl::abnf::DIGIT;

namespace IP4 {

using dot = one<'.'>;

// clang-format off
struct dec_octet : sor<seq<string<'2','5'>, range<'0','5'>>,
                       seq<one<'2'>, range<'0','4'>, DIGIT>,
                       seq<range<'0', '1'>, rep<2, DIGIT>>,
                       rep_min_max<1, 2, DIGIT>> {};
// clang-format on

struct ipv4_address
  : seq<dec_octet, dot, dec_octet, dot, dec_octet, dot, dec_octet, eof> {
};

auto is_address(std::string_view addr) -> bool
{
  memory_input<> in{addr.data(), addr.size(), "addr"};
  return parse<ipv4_address>(in);
}

auto to_sockaddr(std::string_view addr, uint16_t port, sockaddr_in& in4)
    -> bool
{
  if (!is_address(addr))
    return false;

  in4            = sockaddr_in{};
  in4.sin_family = AF_INET;
  in4.sin_port   = htons(port);

  // inet_pton(3) is stricter than the grammar: no leading zeros.
  std::string const str{addr};
  return inet_pton(AF_INET, str.c_str(), &in4.sin_addr) == 1;
}

} // namespace IP4
