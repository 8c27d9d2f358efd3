#include "DNS.hpp"

#include "DNS-delegation.hpp"
#include "DNS-iostream.hpp"
#include "DNS-scripted-transport.hpp"

#include <algorithm>

#include <glog/logging.h>

using DNS::Outcome;
using DNS::RR_type;

namespace {
auto const root{std::string{Config::root_servers[0]}};

auto const gtld{std::string{"192.5.6.30"}};
auto const iana{std::string{"199.43.135.53"}};

void script_example_com(DNS::Scripted_transport& net,
                        Domain const&            name,
                        RR_type                  type)
{
  net.reply(root, name, type,
            DNS::referral(Domain{"com"},
                          {{Domain{"a.gtld-servers.net"}, gtld}}));
  net.reply(gtld, name, type,
            DNS::referral(Domain{"example.com"},
                          {{Domain{"a.iana-servers.net"}, iana}}));
}

void check_exhaustion()
{
  DNS::Scripted_transport net; // nothing scripted, every query times out
  DNS::Cache              cache;
  DNS::Resolver           res{net, cache};

  Domain const name{"unreachable.example"};

  auto const r = res.query(name, RR_type::A);
  CHECK_EQ(r.outcome, Outcome::exhausted);
  CHECK(r.response.answer().empty());
  CHECK(!r.determined());

  // One attempt per root, in order.
  auto const hints = DNS::root_hints();
  CHECK_EQ(net.contacts().size(), hints.size());
  for (size_t i = 0; i < hints.size(); ++i)
    CHECK_EQ(net.contacts()[i].nameserver, hints[i]);

  auto const cached = cache.get(name, RR_type::A);
  CHECK(cached);
  CHECK_EQ(cached->outcome, Outcome::exhausted);

  net.forget();
  auto const again = res.query(name, RR_type::A);
  CHECK_EQ(again.outcome, Outcome::exhausted);
  CHECK(net.contacts().empty());
}

void check_glue_and_narrowing()
{
  DNS::Scripted_transport net;
  DNS::Cache              cache;
  DNS::Resolver           res{net, cache};

  Domain const www{"www.example.com"};
  script_example_com(net, www, RR_type::A);
  net.reply(iana, www, RR_type::A,
            DNS::answer(www, DNS::RR_A{"93.184.216.34"}));

  auto const r = res.query(www, RR_type::A);
  CHECK_EQ(r.outcome, Outcome::answer);
  CHECK(r.determined());

  auto const addrs = get_strings(r.response.answer(), RR_type::A);
  CHECK_EQ(addrs.size(), 1);
  CHECK_EQ(addrs[0], "93.184.216.34");

  // Glue was used, nobody asked for the nameservers' addresses.
  CHECK(!net.asked(Domain{"a.gtld-servers.net"}, RR_type::A));
  CHECK(!net.asked(Domain{"a.iana-servers.net"}, RR_type::A));
  CHECK_EQ(net.contacts().size(), 3);

  // What the referrals taught us.
  CHECK(cache.get(Domain{"com"}, RR_type::NS));
  CHECK(cache.get(Domain{"example.com"}, RR_type::NS));
  auto const glue = cache.get(Domain{"a.iana-servers.net"}, RR_type::A);
  CHECK(glue);
  CHECK_EQ(get_strings(glue->response.answer(), RR_type::A).front(), iana);

  // A sibling name goes straight to example.com's nameserver.
  Domain const mail{"mail.example.com"};
  net.reply(iana, mail, RR_type::A, DNS::answer(mail, DNS::RR_A{"10.1.1.1"}));

  net.forget();
  auto const m = res.query(mail, RR_type::A);
  CHECK_EQ(m.outcome, Outcome::answer);
  CHECK(!net.contacted(root));
  CHECK(!net.contacted(gtld));
  CHECK_EQ(net.contacts().size(), 1);

  // Served from the cache the second time around.
  net.forget();
  auto const again = res.query(www, RR_type::A);
  CHECK_EQ(again.outcome, Outcome::answer);
  CHECK(net.contacts().empty());
}

void check_glueless()
{
  DNS::Scripted_transport net;
  DNS::Cache              cache;
  DNS::Resolver           res{net, cache};

  Domain const www{"www.example.org"};
  Domain const ns{"ns.example.net"};

  net.reply(root, www, RR_type::A,
            DNS::referral(Domain{"org"}, {{Domain{"a0.org.afilias-nst.info"},
                                           std::string{"199.19.56.1"}}}));
  net.reply("199.19.56.1", www, RR_type::A,
            DNS::referral(Domain{"example.org"}, {{ns, std::nullopt}}));

  // The nested lookup for the nameserver's address.
  net.reply(root, ns, RR_type::A,
            DNS::referral(Domain{"net"}, {{Domain{"a.gtld-servers.net"},
                                           gtld}}));
  net.reply(gtld, ns, RR_type::A, DNS::answer(ns, DNS::RR_A{"203.0.113.53"}));

  net.reply("203.0.113.53", www, RR_type::A,
            DNS::answer(www, DNS::RR_A{"198.51.100.7"}));

  auto const r = res.query(www, RR_type::A);
  CHECK_EQ(r.outcome, Outcome::answer);
  CHECK_EQ(get_strings(r.response.answer(), RR_type::A).front(),
           "198.51.100.7");

  CHECK(net.asked(ns, RR_type::A));
  auto const ns_a = cache.get(ns, RR_type::A);
  CHECK(ns_a);
  CHECK_EQ(ns_a->outcome, Outcome::answer);

  // With no nesting allowed the delegation can't be followed.
  DNS::Cache    cache2;
  DNS::Resolver shallow{net, cache2, DNS::Resolver::Options{32, 0, 16}};
  auto const    s = shallow.query(www, RR_type::A);
  CHECK_EQ(s.outcome, Outcome::exhausted);

  // A glueless nameserver whose name is an alias: its address is found
  // by following the alias from the root.
  Domain const shop{"shop.example.edu"};
  Domain const mail{"mail.example.edu"};
  Domain const alias_ns{"ns.hosting.example"};
  Domain const real_ns{"ns1.hosting.example"};

  net.reply(root, shop, RR_type::A,
            DNS::referral(Domain{"example.edu"}, {{alias_ns, std::nullopt}}));
  net.reply(root, alias_ns, RR_type::A,
            DNS::answer(alias_ns, DNS::RR_CNAME{real_ns}));
  net.reply(root, real_ns, RR_type::A,
            DNS::answer(real_ns, DNS::RR_A{"203.0.113.54"}));
  net.reply("203.0.113.54", shop, RR_type::A,
            DNS::answer(shop, DNS::RR_A{"198.51.100.8"}));
  net.reply("203.0.113.54", mail, RR_type::A,
            DNS::answer(mail, DNS::RR_A{"198.51.100.9"}));

  DNS::Cache    cache3;
  DNS::Resolver aliased{net, cache3};
  auto const    sa = aliased.query(shop, RR_type::A);
  CHECK_EQ(sa.outcome, Outcome::answer);
  CHECK_EQ(get_strings(sa.response.answer(), RR_type::A).front(),
           "198.51.100.8");
  CHECK(net.asked(real_ns, RR_type::A));

  // Only the alias is cached under the nameserver name, yet the
  // delegation it serves is still usable later on.
  auto const alias_a = cache3.get(alias_ns, RR_type::A);
  CHECK(alias_a);
  CHECK(!has_type(alias_a->response.answer(), RR_type::A));

  auto const del = DNS::closest_delegation(cache3, mail);
  CHECK_EQ(del.zone, Domain{"example.edu"});
  CHECK_EQ(del.nameservers.size(), 1);
  CHECK_EQ(del.nameservers[0], "203.0.113.54");

  net.forget();
  auto const ma = aliased.query(mail, RR_type::A);
  CHECK_EQ(ma.outcome, Outcome::answer);
  CHECK(!net.contacted(root));
  CHECK_EQ(net.contacts().size(), 1);
}

void check_unusable_replies()
{
  DNS::Scripted_transport net;
  DNS::Cache              cache;
  DNS::Resolver           res{net, cache};

  DNS::Nameserver_set const start{"10.0.0.1", "10.0.0.2", "10.0.0.3",
                                  "10.0.0.4"};

  Domain const name{"host.example"};

  auto servfail = DNS::answer(name, DNS::RR_A{"10.9.9.9"});
  servfail.rcode(2);
  net.reply("10.0.0.1", name, RR_type::A, servfail);

  // Out of bailiwick.
  net.reply("10.0.0.2", name, RR_type::A,
            DNS::referral(Domain{"elsewhere.example"},
                          {{Domain{"ns.elsewhere.example"},
                            std::string{"10.0.0.9"}}}));

  // Glue, but only for a name that isn't one of the nameservers.
  auto stray = DNS::referral(Domain{"host.example"},
                             {{Domain{"ns.host.example"}, std::nullopt}});
  add_rr(stray.additional(), Domain{"evil.example"}, DNS::RR_A{"10.6.6.6"});
  net.reply("10.0.0.3", name, RR_type::A, stray);

  net.reply("10.0.0.4", name, RR_type::A,
            DNS::answer(name, DNS::RR_A{"10.4.4.4"}));

  auto const r = res.query(name, RR_type::A, start);
  CHECK_EQ(r.outcome, Outcome::answer);
  CHECK_EQ(get_strings(r.response.answer(), RR_type::A).front(), "10.4.4.4");

  CHECK(!net.contacted("10.0.0.9"));
  CHECK(!net.contacted("10.6.6.6"));
  CHECK(!cache.get(Domain{"evil.example"}, RR_type::A));
}

void check_negative()
{
  DNS::Scripted_transport net;
  DNS::Cache              cache;
  DNS::Resolver           res{net, cache};

  DNS::Nameserver_set const start{"10.0.0.1"};

  Domain const gone{"gone.example"};
  net.reply("10.0.0.1", gone, RR_type::A, DNS::nx_domain());
  auto const nx = res.query(gone, RR_type::A, start);
  CHECK_EQ(nx.outcome, Outcome::nx_domain);
  CHECK(nx.determined());

  Domain const bare{"bare.example"};
  net.reply("10.0.0.1", bare, RR_type::AAAA, DNS::no_data());
  auto const nd = res.query(bare, RR_type::AAAA, start);
  CHECK_EQ(nd.outcome, Outcome::no_data);
  CHECK(nd.response.answer().empty());
  CHECK_EQ(cache.get(bare, RR_type::AAAA)->outcome, Outcome::no_data);
}

void check_cname_queries()
{
  DNS::Scripted_transport net;
  DNS::Cache              cache;
  DNS::Resolver           res{net, cache};

  DNS::Nameserver_set const start{"10.0.0.1"};

  // Asked for an alias, got an address.
  Domain const plain{"plain.example"};
  net.reply("10.0.0.1", plain, RR_type::CNAME,
            DNS::answer(plain, DNS::RR_A{"10.5.5.5"}));
  auto const p = res.query(plain, RR_type::CNAME, start);
  CHECK_EQ(p.outcome, Outcome::no_data);
  CHECK(p.response.answer().empty());
  CHECK(cache.get(plain, RR_type::CNAME)->response.answer().empty());

  Domain const alias{"alias.example"};
  net.reply("10.0.0.1", alias, RR_type::CNAME,
            DNS::answer(alias, DNS::RR_CNAME{Domain{"target.example"}}));
  auto const a = res.query(alias, RR_type::CNAME, start);
  CHECK_EQ(a.outcome, Outcome::answer);
  CHECK_EQ(*first_cname(a.response.answer()), Domain{"target.example"});

  // The raw engine doesn't chase aliases.
  net.reply("10.0.0.1", alias, RR_type::A,
            DNS::answer(alias, DNS::RR_CNAME{Domain{"target.example"}}));
  auto const raw = res.query(alias, RR_type::A, start);
  CHECK_EQ(raw.outcome, Outcome::answer);
  CHECK(!has_type(raw.response.answer(), RR_type::A));
  CHECK(!net.asked(Domain{"target.example"}, RR_type::A));
}

void check_referral_limit()
{
  DNS::Scripted_transport net;
  DNS::Cache              cache;
  DNS::Resolver           res{net, cache, DNS::Resolver::Options{1, 8, 16}};

  Domain const www{"www.example.com"};
  script_example_com(net, www, RR_type::A);
  net.reply(iana, www, RR_type::A,
            DNS::answer(www, DNS::RR_A{"93.184.216.34"}));

  auto const r = res.query(www, RR_type::A);
  CHECK_EQ(r.outcome, Outcome::loop);
  CHECK(!r.determined());
  CHECK(!net.contacted(iana));

  // Not cached, a later caller with more patience may yet succeed.
  CHECK(!cache.get(www, RR_type::A));
}

void check_no_closer_referral()
{
  DNS::Scripted_transport net;
  DNS::Cache              cache;
  DNS::Resolver           res{net, cache};

  // Every root sends us back to the root.
  Domain const name{"circular.example"};
  for (auto const& ns : DNS::root_hints()) {
    net.reply(ns, name, RR_type::A,
              DNS::referral(Domain{}, {{Domain{"a.root-servers.net"},
                                        std::string{Config::root_servers[0]}}}));
  }

  auto const r = res.query(name, RR_type::A);
  CHECK_EQ(r.outcome, Outcome::exhausted);
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  check_exhaustion();
  check_glue_and_narrowing();
  check_glueless();
  check_unusable_replies();
  check_negative();
  check_cname_queries();
  check_referral_limit();
  check_no_closer_referral();
}
