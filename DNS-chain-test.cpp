#include "DNS-chain.hpp"

#include "DNS-iostream.hpp"
#include "DNS-scripted-transport.hpp"

#include <glog/logging.h>

using DNS::Outcome;
using DNS::RR_type;

namespace {
auto const ns_addr{std::string{"10.0.0.1"}};

// Pretend we've already learned who serves "test".
void seed(DNS::Cache& cache)
{
  Domain const zone{"test"};
  Domain const ns{"ns.test"};
  CHECK(cache.put(zone, RR_type::NS,
                  DNS::Result{Outcome::answer,
                              DNS::answer(zone, DNS::RR_NS{ns})}));
  CHECK(cache.put(ns, RR_type::A,
                  DNS::Result{Outcome::answer,
                              DNS::answer(ns, DNS::RR_A{ns_addr.c_str()})}));
}

void alias(DNS::Scripted_transport& net, char const* from, char const* to)
{
  Domain const dom{from};
  net.reply(ns_addr, dom, RR_type::CNAME,
            DNS::answer(dom, DNS::RR_CNAME{Domain{to}}));
}

void not_alias(DNS::Scripted_transport& net, char const* name)
{
  net.reply(ns_addr, Domain{name}, RR_type::CNAME, DNS::no_data());
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  DNS::Scripted_transport net;
  DNS::Cache              cache;
  seed(cache);

  DNS::Resolver res{net, cache};

  alias(net, "a.test", "b.test");
  alias(net, "b.test", "c.test");
  not_alias(net, "c.test");

  auto const abc = DNS::resolve_chain(res, Domain{"a.test"});
  CHECK_EQ(abc.name, Domain{"c.test"});
  CHECK_EQ(abc.aliases.size(), 2);
  CHECK_EQ(abc.aliases[0].alias, Domain{"a.test"});
  CHECK_EQ(abc.aliases[0].name, Domain{"b.test"});
  CHECK_EQ(abc.aliases[1].alias, Domain{"b.test"});
  CHECK_EQ(abc.aliases[1].name, Domain{"c.test"});
  CHECK_EQ(abc.outcome, Outcome::no_data);

  // The cached delegation was used, not the roots.
  CHECK(!net.contacted(Config::root_servers[0]));

  not_alias(net, "d.test");
  auto const d = DNS::resolve_chain(res, Domain{"d.test"});
  CHECK_EQ(d.name, Domain{"d.test"});
  CHECK(d.aliases.empty());

  alias(net, "x.test", "y.test");
  alias(net, "y.test", "x.test");
  auto const xy = DNS::resolve_chain(res, Domain{"x.test"});
  CHECK_EQ(xy.outcome, Outcome::loop);
  CHECK_EQ(xy.name, Domain{"y.test"});
  CHECK_EQ(xy.aliases.size(), 1);

  DNS::Resolver short_res{net, cache, DNS::Resolver::Options{32, 8, 1}};
  auto const    cut = DNS::resolve_chain(short_res, Domain{"a.test"});
  CHECK_EQ(cut.outcome, Outcome::loop);
  CHECK_EQ(cut.name, Domain{"b.test"});
  CHECK_EQ(cut.aliases.size(), 1);

  // An alias found while asking for an address: the target is looked up
  // from the top.
  Domain const w{"w.test"};
  Domain const other{"other.example"};
  net.reply(ns_addr, w, RR_type::A, DNS::answer(w, DNS::RR_CNAME{other}));
  net.reply(Config::root_servers[0], other, RR_type::A,
            DNS::answer(other, DNS::RR_A{"192.0.2.1"}));

  net.forget();
  auto const wa = DNS::lookup(res, w, RR_type::A);
  CHECK_EQ(wa.outcome, Outcome::answer);
  auto const addrs = get_strings(wa.response.answer(), RR_type::A);
  CHECK_EQ(addrs.size(), 1);
  CHECK_EQ(addrs[0], "192.0.2.1");
  CHECK(net.contacted(Config::root_servers[0]));

  // Asking for the alias itself is never chased.
  net.reply(ns_addr, w, RR_type::CNAME, DNS::answer(w, DNS::RR_CNAME{other}));
  net.forget();
  auto const wc = DNS::lookup(res, w, RR_type::CNAME);
  CHECK_EQ(wc.outcome, Outcome::answer);
  CHECK(!net.asked(other, RR_type::CNAME));

  // The whole chain in one answer needs no further queries.
  Domain const v{"v.test"};
  Domain const u{"u.test"};
  auto         vu = DNS::answer(v, DNS::RR_CNAME{u});
  add_rr(vu.answer(), u, DNS::RR_A{"192.0.2.2"});
  net.reply(ns_addr, v, RR_type::A, vu);

  net.forget();
  auto const va = DNS::lookup(res, v, RR_type::A);
  CHECK_EQ(va.outcome, Outcome::answer);
  CHECK_EQ(get_strings(va.response.answer(), RR_type::A).front(), "192.0.2.2");
  CHECK_EQ(net.contacts().size(), 1);

  // Aliases pointing at each other while looking for an address.
  Domain const p{"p.test"};
  Domain const q{"q.test"};
  net.reply(ns_addr, p, RR_type::A, DNS::answer(p, DNS::RR_CNAME{q}));
  net.reply(Config::root_servers[0], q, RR_type::A,
            DNS::answer(q, DNS::RR_CNAME{p}));
  auto const pq = DNS::lookup(res, p, RR_type::A);
  CHECK_EQ(pq.outcome, Outcome::loop);
}
