#include "DNS-transport.hpp"

#include "DNS-iostream.hpp"
#include "DNS-ldns.hpp"
#include "IP4.hpp"
#include "POSIX.hpp"

#include <limits>
#include <vector>

#include <experimental/random>

#include <sys/socket.h>
#include <unistd.h>

#include <gflags/gflags.h>

#include <glog/logging.h>

DEFINE_bool(log_dns_data, false, "log all DNS queries and replies");

namespace {
class Socket {
public:
  Socket(Socket const&) = delete;
  Socket& operator=(Socket const&) = delete;

  Socket()
    : fd_(socket(AF_INET, SOCK_DGRAM, 0))
  {
    PCHECK(fd_ >= 0) << "socket() failed";
  }
  ~Socket() { close(fd_); }

  int fd() const { return fd_; }

private:
  int fd_;
};

void log_section(char const* what, DNS::Section const& sec)
{
  for (auto const& set : sec) {
    for (auto const& rr : set.rrs) {
      LOG(INFO) << what << ' ' << set.owner << ' ' << rr;
    }
  }
}
} // namespace

namespace DNS {

xchg_status UDP_transport::xchg(Domain const&      name,
                                RR_type            type,
                                std::string const& nameserver,
                                Response&          reply)
{
  auto in4{sockaddr_in{}};
  if (!IP4::to_sockaddr(nameserver, port_, in4)) {
    LOG(WARNING) << "not an IPv4 nameserver address: " << nameserver;
    return xchg_status::error;
  }

  uint16_t const id
      = std::experimental::randint(std::numeric_limits<uint16_t>::min(),
                                   std::numeric_limits<uint16_t>::max());

  auto const q = DNS_ldns::create_query(name, type, id);
  if (q.empty())
    return xchg_status::error;

  Socket sock;

  if (connect(sock.fd(), reinterpret_cast<sockaddr const*>(&in4),
              sizeof(in4))) {
    PLOG(WARNING) << "connect failed " << nameserver;
    return xchg_status::error;
  }

  POSIX::set_nonblocking(sock.fd());

  if (send(sock.fd(), q.data(), q.size(), 0) != ssize_t(q.size())) {
    PLOG(WARNING) << "send to " << nameserver << " failed";
    return xchg_status::error;
  }

  if (FLAGS_log_dns_data) {
    LOG(INFO) << "sent " << name << '/' << type << " id " << id << " to "
              << nameserver << ", " << q.size() << " octets";
  }

  // A stray datagram doesn't end the attempt, but the clock keeps
  // running.
  auto const end_time = std::chrono::steady_clock::now() + timeout_;

  for (auto tries = 3; tries; --tries) {
    auto const now = std::chrono::steady_clock::now();
    if (now >= end_time) {
      LOG(WARNING) << "out of time waiting on " << nameserver << " for "
                   << name << '/' << type;
      return xchg_status::timeout;
    }
    auto const time_left
        = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - now);

    std::vector<DNS_ldns::octet> bfr(Config::max_udp_sz);

    auto       t_o{false};
    auto const a_buflen
        = POSIX::recv(sock.fd(), reinterpret_cast<char*>(bfr.data()),
                      bfr.size(), time_left, t_o);
    if (t_o) {
      LOG(WARNING) << "DNS read from " << nameserver << " timed out for "
                   << name << '/' << type;
      return xchg_status::timeout;
    }
    if (a_buflen < 0) {
      LOG(WARNING) << "DNS read from " << nameserver << " failed";
      return xchg_status::error;
    }

    bfr.resize(a_buflen);

    if (DNS_ldns::parse_response(bfr, id, name, type, reply)) {
      if (FLAGS_log_dns_data) {
        LOG(INFO) << "reply from " << nameserver << ", " << a_buflen
                  << " octets, rcode " << reply.rcode();
        log_section("answer", reply.answer());
        log_section("authority", reply.authority());
        log_section("additional", reply.additional());
      }
      return xchg_status::ok;
    }
  }

  LOG(WARNING) << "no usable reply from " << nameserver << " for " << name
               << '/' << type;
  return xchg_status::error;
}

} // namespace DNS
