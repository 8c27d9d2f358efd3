#include "DNS-delegation.hpp"

#include "DNS-iostream.hpp"

#include <glog/logging.h>

using DNS::Outcome;
using DNS::RR_type;

namespace {
void learn_ns(DNS::Cache& cache, char const* zone, char const* ns)
{
  DNS::Response rsp;
  add_rr(rsp.answer(), Domain{zone}, DNS::RR_NS{Domain{ns}});
  CHECK(cache.put(Domain{zone}, RR_type::NS,
                  DNS::Result{Outcome::answer, rsp}));
}

void learn_a(DNS::Cache& cache, char const* name, char const* addr)
{
  DNS::Response rsp;
  add_rr(rsp.answer(), Domain{name}, DNS::RR_A{addr});
  CHECK(cache.put(Domain{name}, RR_type::A, DNS::Result{Outcome::answer, rsp}));
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  DNS::Cache cache;

  // Nothing known: the root hints, in order.
  auto const cold = DNS::closest_delegation(cache, Domain{"www.example.com"});
  CHECK(cold.zone.is_root());
  CHECK(cold.nameservers == DNS::root_hints());
  CHECK_EQ(cold.nameservers.size(), 13);

  learn_ns(cache, "com", "a.gtld-servers.net");
  learn_a(cache, "a.gtld-servers.net", "192.5.6.30");

  auto const com = DNS::closest_delegation(cache, Domain{"www.example.com"});
  CHECK_EQ(com.zone, Domain{"com"});
  CHECK_EQ(com.nameservers.size(), 1);
  CHECK_EQ(com.nameservers[0], "192.5.6.30");

  // NS known, but no address for it: keep looking further up.
  learn_ns(cache, "example.com", "a.iana-servers.net");
  auto const still_com
      = DNS::closest_delegation(cache, Domain{"www.example.com"});
  CHECK_EQ(still_com.zone, Domain{"com"});

  // A failed lookup of the nameserver's address is no help either.
  CHECK(cache.put(Domain{"a.iana-servers.net"}, RR_type::A,
                  DNS::Result{Outcome::exhausted, DNS::empty_response()}));
  CHECK_EQ(DNS::closest_delegation(cache, Domain{"www.example.com"}).zone,
           Domain{"com"});

  // Most specific zone wins, addresses of every NS target are used.
  learn_ns(cache, "example.net", "ns1.example.net");
  learn_a(cache, "ns1.example.net", "203.0.113.1");
  learn_ns(cache, "sub.example.net", "ns2.example.net");
  learn_a(cache, "ns2.example.net", "203.0.113.2");

  auto const sub = DNS::closest_delegation(cache, Domain{"a.sub.example.net"});
  CHECK_EQ(sub.zone, Domain{"sub.example.net"});
  CHECK_EQ(sub.nameservers.size(), 1);
  CHECK_EQ(sub.nameservers[0], "203.0.113.2");

  auto const net = DNS::closest_delegation(cache, Domain{"b.example.net"});
  CHECK_EQ(net.zone, Domain{"example.net"});

  // The zone itself counts as its own closest delegation.
  CHECK_EQ(DNS::closest_delegation(cache, Domain{"example.net"}).zone,
           Domain{"example.net"});

  // Unrelated names still start at the root.
  CHECK(DNS::closest_delegation(cache, Domain{"example.org"}).zone.is_root());
}
