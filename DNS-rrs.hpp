#ifndef DNS_RRS_DOT_HPP
#define DNS_RRS_DOT_HPP

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include <netinet/in.h>

#include "Domain.hpp"

namespace DNS {

enum class RR_type : uint16_t {
  // RFC 1035 section 3.2.2 “TYPE values”
  NONE,
  A,
  NS,
  MD,
  MF,
  CNAME,
  SOA,
  MB,
  MG,
  MR,
  RR_NULL,
  WKS,
  PTR,
  HINFO,
  MINFO,
  MX,
  TXT,

  // RFC 3596 section 2.1 “AAAA record type”
  AAAA = 28,

  // RFC 2782 Service locator
  SRV = 33,

  // RFC 6891 EDNS(0) OPT pseudo-RR
  OPT = 41,

  // RFC 4034
  RRSIG  = 46, // DNSSEC signature
  NSEC   = 47, // Next Secure record
  DNSKEY = 48, // DNS Key record
};

constexpr char const* RR_type_c_str(RR_type type)
{
  switch (type) { // clang-format off
  case RR_type::NONE:   return "NONE";
  case RR_type::A:      return "A";
  case RR_type::NS:     return "NS";
  case RR_type::MD:     return "MD";
  case RR_type::MF:     return "MF";
  case RR_type::CNAME:  return "CNAME";
  case RR_type::SOA:    return "SOA";
  case RR_type::MB:     return "MB";
  case RR_type::MG:     return "MG";
  case RR_type::MR:     return "MR";
  case RR_type::RR_NULL:return "RR_NULL";
  case RR_type::WKS:    return "WKS";
  case RR_type::PTR:    return "PTR";
  case RR_type::HINFO:  return "HINFO";
  case RR_type::MINFO:  return "MINFO";
  case RR_type::MX:     return "MX";
  case RR_type::TXT:    return "TXT";
  case RR_type::AAAA:   return "AAAA";
  case RR_type::SRV:    return "SRV";
  case RR_type::OPT:    return "OPT";
  case RR_type::RRSIG:  return "RRSIG";
  case RR_type::NSEC:   return "NSEC";
  case RR_type::DNSKEY: return "DNSKEY";
  } // clang-format on
  return "*** unknown RR_type ***";
}

constexpr char const* RR_type_c_str(uint16_t type)
{
  return RR_type_c_str(static_cast<RR_type>(type));
}

constexpr char const* rcode_c_str(uint16_t rcode)
{
  // https://www.iana.org/assignments/dns-parameters/dns-parameters.xhtml#dns-parameters-6
  switch (rcode) { // clang-format off
  case 0:  return "no error";                           // [RFC1035]
  case 1:  return "format error";                       // [RFC1035]
  case 2:  return "server failure";                     // [RFC1035]
  case 3:  return "non-existent domain";                // [RFC1035]
  case 4:  return "not implemented";                    // [RFC1035]
  case 5:  return "query Refused";                      // [RFC1035]
  case 6:  return "name exists when it should not";     // [RFC2136][RFC6672]
  case 7:  return "RR set exists when it should not";   // [RFC2136]
  case 8:  return "RR set that should exist does not";  // [RFC2136]
  case 9:  return "server not authoritative for zone or not authorized"; // [RFC2136 & RFC2845]
  case 10: return "name not contained in zone";         // [RFC2136]
  } // clang-format on
  if (rcode <= 4095) {
    return "unassigned or extended";
  }
  return "*** rcode out of range ***";
}

// Address records keep the textual form, that's what gets compared,
// cached and printed; the sockaddr is what the transport sends to.

class RR_A {
public:
  RR_A(uint8_t const* rd, size_t sz);
  explicit RR_A(char const* addr);

  std::optional<std::string> as_str() const { return std::string{str_}; }

  sockaddr_in const&       addr() const { return addr_; }
  char const*              c_str() const { return str_; }
  constexpr static RR_type rr_type() { return RR_type::A; }

  bool operator==(RR_A const& rhs) const { return strcmp(str_, rhs.str_) == 0; }
  bool operator<(RR_A const& rhs) const { return strcmp(str_, rhs.str_) < 0; }

private:
  sockaddr_in addr_{};
  char        str_[INET_ADDRSTRLEN];
};

class RR_NS {
public:
  explicit RR_NS(Domain nsdname)
    : nsdname_(std::move(nsdname))
  {
  }

  std::optional<std::string> as_str() const { return str(); }

  Domain const&            nsdname() const { return nsdname_; }
  std::string const&       str() const { return nsdname_.ascii(); }
  constexpr static RR_type rr_type() { return RR_type::NS; }

  bool operator==(RR_NS const& rhs) const { return nsdname_ == rhs.nsdname_; }
  bool operator<(RR_NS const& rhs) const { return str() < rhs.str(); }

private:
  Domain nsdname_;
};

class RR_CNAME {
public:
  explicit RR_CNAME(Domain cname)
    : cname_(std::move(cname))
  {
  }

  std::optional<std::string> as_str() const { return str(); }

  Domain const&            cname() const { return cname_; }
  std::string const&       str() const { return cname_.ascii(); }
  char const*              c_str() const { return str().c_str(); }
  constexpr static RR_type rr_type() { return RR_type::CNAME; }

  bool operator==(RR_CNAME const& rhs) const { return cname_ == rhs.cname_; }
  bool operator<(RR_CNAME const& rhs) const { return str() < rhs.str(); }

private:
  Domain cname_;
};

class RR_MX {
public:
  RR_MX(Domain exchange, uint16_t preference)
    : exchange_(std::move(exchange))
    , preference_(preference)
  {
  }

  std::optional<std::string> as_str() const { return exchange().ascii(); }

  Domain const& exchange() const { return exchange_; }
  uint16_t      preference() const { return preference_; }

  constexpr static RR_type rr_type() { return RR_type::MX; }

  bool operator==(RR_MX const& rhs) const
  {
    return (preference() == rhs.preference()) && (exchange() == rhs.exchange());
  }
  bool operator<(RR_MX const& rhs) const
  {
    if (preference() == rhs.preference())
      return exchange().ascii() < rhs.exchange().ascii();
    return preference() < rhs.preference();
  }

private:
  Domain   exchange_;
  uint16_t preference_;
};

class RR_AAAA {
public:
  RR_AAAA(uint8_t const* rd, size_t sz);
  explicit RR_AAAA(char const* addr);

  std::optional<std::string> as_str() const { return std::string{c_str()}; }

  sockaddr_in6 const&      addr() const { return addr_; }
  char const*              c_str() const { return str_; }
  constexpr static RR_type rr_type() { return RR_type::AAAA; }

  bool operator==(RR_AAAA const& rhs) const
  {
    return strcmp(c_str(), rhs.c_str()) == 0;
  }
  bool operator<(RR_AAAA const& rhs) const
  {
    return strcmp(c_str(), rhs.c_str()) < 0;
  }

private:
  sockaddr_in6 addr_{};
  char         str_[INET6_ADDRSTRLEN];
};

using RR = std::variant<RR_A, RR_NS, RR_CNAME, RR_MX, RR_AAAA>;

using RR_collection = std::vector<RR>;

inline RR_type rr_type(RR const& rr)
{
  return std::visit([](auto const& r) { return r.rr_type(); }, rr);
}

} // namespace DNS

#endif // DNS_RRS_DOT_HPP
