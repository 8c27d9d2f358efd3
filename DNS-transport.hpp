#ifndef DNS_TRANSPORT_DOT_HPP
#define DNS_TRANSPORT_DOT_HPP

#include <chrono>
#include <cstdint>
#include <string>

#include "DNS-message.hpp"
#include "DNS-rrs.hpp"
#include "Domain.hpp"

namespace Config {
auto constexpr query_timeout{std::chrono::seconds(3)};

// No EDNS0, so the classic limit.
auto constexpr max_udp_sz{uint16_t(512)};

auto constexpr dns_port{uint16_t(53)};
} // namespace Config

namespace DNS {

enum class xchg_status : uint8_t { ok, timeout, error };

constexpr char const* xchg_status_c_str(xchg_status s)
{
  switch (s) { // clang-format off
  case xchg_status::ok:      return "ok";
  case xchg_status::timeout: return "timed out";
  case xchg_status::error:   return "failed";
  } // clang-format on
  return "*** unknown xchg_status ***";
}

// One question to one nameserver, one attempt.  Anything but ok means
// the caller should move on to another nameserver.

class Transport {
public:
  virtual ~Transport() = default;

  virtual xchg_status xchg(Domain const&      name,
                           RR_type            type,
                           std::string const& nameserver,
                           Response&          reply)
      = 0;
};

class UDP_transport : public Transport {
public:
  UDP_transport(UDP_transport const&) = delete;
  UDP_transport& operator=(UDP_transport const&) = delete;

  explicit UDP_transport(
      std::chrono::milliseconds timeout = Config::query_timeout,
      uint16_t                  port    = Config::dns_port)
    : timeout_(timeout)
    , port_(port)
  {
  }

  xchg_status xchg(Domain const&      name,
                   RR_type            type,
                   std::string const& nameserver,
                   Response&          reply) override;

private:
  std::chrono::milliseconds timeout_;
  uint16_t                  port_;
};

} // namespace DNS

#endif // DNS_TRANSPORT_DOT_HPP
