#ifndef DNS_COLLECT_DOT_HPP
#define DNS_COLLECT_DOT_HPP

#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "DNS.hpp"

namespace Config {
// Printed in this order, one line per record, like host(1).
constexpr char const* cname_fmt = "{alias} is an alias for {name}";
constexpr char const* a_fmt = "{name} has address {address}";
constexpr char const* aaaa_fmt = "{name} has IPv6 address {address}";
constexpr char const* mx_fmt
    = "{name} mail is handled by {preference} {exchange}";
} // namespace Config

namespace DNS {

struct CNAME_result {
  Domain name;
  Domain alias;
};

struct Address_result {
  Domain      name;
  std::string address;
};

struct MX_result {
  Domain   name;
  uint16_t preference;
  Domain   exchange;
};

struct Results {
  std::vector<CNAME_result>   cname;
  std::vector<Address_result> a;
  std::vector<Address_result> aaaa;
  std::vector<MX_result>      mx;
};

// Aliases of name, then the A, AAAA and MX records of whatever it is
// finally an alias for.
Results collect(Resolver& res, Domain const& name);

// Throws std::invalid_argument if name doesn't parse.
Results collect(Resolver& res, std::string_view name);

void print_results(std::ostream& os, Results const& results);

} // namespace DNS

#endif // DNS_COLLECT_DOT_HPP
