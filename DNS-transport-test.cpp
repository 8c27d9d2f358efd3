#include "DNS-transport.hpp"

#include "DNS-iostream.hpp"
#include "DNS-ldns.hpp"
#include "IP4.hpp"
#include "POSIX.hpp"

#include <chrono>
#include <cstdlib>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <ldns/ldns.h>

#include <glog/logging.h>

using DNS::RR_type;
using DNS::xchg_status;
using DNS_ldns::octet;
using std::chrono::milliseconds;

namespace {
Domain const www{"www.example.com"};

// A nameserver on the loopback, on whatever port the kernel gives us.
class Responder {
public:
  Responder(Responder const&) = delete;
  Responder& operator=(Responder const&) = delete;

  Responder()
    : fd_(socket(AF_INET, SOCK_DGRAM, 0))
  {
    PCHECK(fd_ >= 0) << "socket() failed";

    auto in4{sockaddr_in{}};
    CHECK(IP4::to_sockaddr("127.0.0.1", 0, in4));
    PCHECK(bind(fd_, reinterpret_cast<sockaddr const*>(&in4), sizeof(in4))
           == 0);

    socklen_t len = sizeof(in4);
    PCHECK(getsockname(fd_, reinterpret_cast<sockaddr*>(&in4), &len) == 0);
    port_ = ntohs(in4.sin_port);
  }
  ~Responder() { close(fd_); }

  uint16_t port() const { return port_; }

  std::vector<octet> receive(sockaddr_in& from)
  {
    CHECK(POSIX::input_ready(fd_, std::chrono::seconds(5)))
        << "no query arrived";

    std::vector<octet> bfr(Config::max_udp_sz);
    socklen_t          len = sizeof(from);
    auto const         n   = recvfrom(fd_, bfr.data(), bfr.size(), 0,
                                      reinterpret_cast<sockaddr*>(&from), &len);
    PCHECK(n >= 0) << "recvfrom() failed";
    bfr.resize(n);
    return bfr;
  }

  void send_to(std::vector<octet> const& msg, sockaddr_in const& to)
  {
    PCHECK(sendto(fd_, msg.data(), msg.size(), 0,
                  reinterpret_cast<sockaddr const*>(&to), sizeof(to))
           == ssize_t(msg.size()));
  }

private:
  int      fd_;
  uint16_t port_;
};

uint16_t query_id(std::vector<octet> const& query)
{
  CHECK_GE(query.size(), 2);
  return uint16_t((query[0] << 8) | query[1]);
}

// The query turned into an authoritative answer carrying one record.
std::vector<octet>
answer_to(std::vector<octet> const& query, uint16_t id, char const* text)
{
  ldns_pkt* pkt = nullptr;
  CHECK_EQ(ldns_wire2pkt(&pkt, query.data(), query.size()), LDNS_STATUS_OK);
  DNS_ldns::Packet p{pkt};

  ldns_pkt_set_id(pkt, id);
  ldns_pkt_set_qr(pkt, true);
  ldns_pkt_set_aa(pkt, true);

  ldns_rr* rr = nullptr;
  CHECK_EQ(ldns_rr_new_frm_str(&rr, text, 0, nullptr, nullptr),
           LDNS_STATUS_OK)
      << text;
  CHECK(ldns_pkt_push_rr(pkt, LDNS_SECTION_ANSWER, rr));

  uint8_t* buf = nullptr;
  size_t   sz  = 0;
  CHECK_EQ(ldns_pkt2wire(&buf, pkt, &sz), LDNS_STATUS_OK);
  std::vector<octet> ret(buf, buf + sz);
  std::free(buf);
  return ret;
}

void check_stray_then_reply()
{
  Responder ns;

  std::thread server([&ns] {
    auto       from{sockaddr_in{}};
    auto const q  = ns.receive(from);
    auto const id = query_id(q);
    ns.send_to(answer_to(q, uint16_t(id + 1),
                         "www.example.com. 300 IN A 192.0.2.1"),
               from);
    ns.send_to(answer_to(q, id, "www.example.com. 300 IN A 192.0.2.2"), from);
  });

  DNS::UDP_transport udp{milliseconds(2000), ns.port()};
  DNS::Response      reply;
  auto const         st = udp.xchg(www, RR_type::A, "127.0.0.1", reply);
  server.join();

  CHECK_EQ(st, xchg_status::ok);
  auto const addrs = DNS::get_strings(reply.answer(), RR_type::A);
  CHECK_EQ(addrs.size(), 1);
  CHECK_EQ(addrs[0], "192.0.2.2");
}

void check_only_strays()
{
  Responder ns;

  std::thread server([&ns] {
    auto       from{sockaddr_in{}};
    auto const q  = ns.receive(from);
    auto const id = query_id(q);
    for (auto n = 1; n <= 3; ++n) {
      ns.send_to(answer_to(q, uint16_t(id + n),
                           "www.example.com. 300 IN A 192.0.2.1"),
                 from);
    }
  });

  DNS::UDP_transport udp{milliseconds(2000), ns.port()};
  DNS::Response      reply;
  auto const         st = udp.xchg(www, RR_type::A, "127.0.0.1", reply);
  server.join();

  CHECK_EQ(st, xchg_status::error);
  CHECK(reply.empty());
}

void check_silence()
{
  Responder ns;

  std::thread server([&ns] {
    auto from{sockaddr_in{}};
    ns.receive(from);
  });

  DNS::UDP_transport udp{milliseconds(200), ns.port()};
  DNS::Response      reply;

  auto const start = std::chrono::steady_clock::now();
  auto const st    = udp.xchg(www, RR_type::A, "127.0.0.1", reply);
  auto const spent = std::chrono::steady_clock::now() - start;
  server.join();

  CHECK_EQ(st, xchg_status::timeout);
  CHECK(spent >= milliseconds(200));
  CHECK(spent < milliseconds(2000));
}

// A stray datagram doesn't buy the nameserver more time.
void check_stray_then_silence()
{
  Responder ns;

  std::thread server([&ns] {
    auto       from{sockaddr_in{}};
    auto const q = ns.receive(from);
    ns.send_to(answer_to(q, uint16_t(query_id(q) + 1),
                         "www.example.com. 300 IN A 192.0.2.1"),
               from);
  });

  DNS::UDP_transport udp{milliseconds(300), ns.port()};
  DNS::Response      reply;

  auto const start = std::chrono::steady_clock::now();
  auto const st    = udp.xchg(www, RR_type::A, "127.0.0.1", reply);
  auto const spent = std::chrono::steady_clock::now() - start;
  server.join();

  CHECK_EQ(st, xchg_status::timeout);
  CHECK(spent < milliseconds(2000));
}

void check_closed_port()
{
  uint16_t port;
  {
    Responder gone;
    port = gone.port();
  }

  DNS::UDP_transport udp{milliseconds(2000), port};
  DNS::Response      reply;
  CHECK_EQ(udp.xchg(www, RR_type::A, "127.0.0.1", reply), xchg_status::error);
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  check_stray_then_reply();
  check_only_strays();
  check_silence();
  check_stray_then_silence();
  check_closed_port();

  DNS::UDP_transport udp;
  DNS::Response      reply;
  CHECK_EQ(udp.xchg(www, RR_type::A, "not-an-address", reply),
           xchg_status::error);
}
