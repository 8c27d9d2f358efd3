#ifndef DNS_IOSTREAM_DOT_HPP
#define DNS_IOSTREAM_DOT_HPP

#include "DNS-message.hpp"
#include "DNS-rrs.hpp"
#include "DNS-transport.hpp"

#include <iostream>

// In namespace DNS so CHECK_EQ and friends find them.
namespace DNS {

inline std::ostream& operator<<(std::ostream& os, RR_A const& rr_a)
{
  return os << "A " << rr_a.c_str();
}

inline std::ostream& operator<<(std::ostream& os, RR_NS const& rr_ns)
{
  return os << "NS " << rr_ns.nsdname();
}

inline std::ostream& operator<<(std::ostream& os, RR_CNAME const& rr_c)
{
  return os << "CNAME " << rr_c.cname();
}

inline std::ostream& operator<<(std::ostream& os, RR_MX const& rr_mx)
{
  return os << "MX " << rr_mx.preference() << ' ' << rr_mx.exchange();
}

inline std::ostream& operator<<(std::ostream& os, RR_AAAA const& rr_aaaa)
{
  return os << "AAAA " << rr_aaaa.c_str();
}

inline std::ostream& operator<<(std::ostream& os, RR const& rr)
{
  std::visit([&os](auto const& r) { os << r; }, rr);
  return os;
}

inline std::ostream& operator<<(std::ostream& os, RR_type const& type)
{
  return os << RR_type_c_str(type);
}

inline std::ostream& operator<<(std::ostream& os, Outcome const& o)
{
  return os << Outcome_c_str(o);
}

inline std::ostream& operator<<(std::ostream& os, xchg_status const& s)
{
  return os << xchg_status_c_str(s);
}

} // namespace DNS

#endif // DNS_IOSTREAM_DOT_HPP
