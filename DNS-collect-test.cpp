#include "DNS-collect.hpp"

#include "DNS-scripted-transport.hpp"

#include <sstream>
#include <stdexcept>

#include <glog/logging.h>

using DNS::RR_type;

namespace {
auto const root{std::string{Config::root_servers[0]}};

Domain const example{"example.com"};
Domain const www{"www.example.com"};

void check_plain()
{
  DNS::Scripted_transport net;
  DNS::Cache              cache;
  DNS::Resolver           res{net, cache};

  net.reply(root, example, RR_type::CNAME, DNS::no_data());
  net.reply(root, example, RR_type::A,
            DNS::answer(example, DNS::RR_A{"93.184.216.34"}));
  net.reply(root, example, RR_type::AAAA,
            DNS::answer(example,
                        DNS::RR_AAAA{"2606:2800:220:1:248:1893:25c8:1946"}));
  net.reply(root, example, RR_type::MX,
            DNS::answer(example, DNS::RR_MX{Domain{"mail.example.com"}, 10}));

  auto const results = DNS::collect(res, "example.com");

  CHECK(results.cname.empty());
  CHECK_EQ(results.a.size(), 1);
  CHECK_EQ(results.a[0].name, example);
  CHECK_EQ(results.a[0].address, "93.184.216.34");
  CHECK_EQ(results.aaaa.size(), 1);
  CHECK_EQ(results.mx.size(), 1);
  CHECK_EQ(results.mx[0].preference, 10);
  CHECK_EQ(results.mx[0].exchange, Domain{"mail.example.com"});

  std::ostringstream out;
  DNS::print_results(out, results);
  CHECK_EQ(out.str(),
           "example.com has address 93.184.216.34\n"
           "example.com has IPv6 address 2606:2800:220:1:248:1893:25c8:1946\n"
           "example.com mail is handled by 10 mail.example.com\n");
}

void check_alias()
{
  DNS::Scripted_transport net;
  DNS::Cache              cache;
  DNS::Resolver           res{net, cache};

  net.reply(root, www, RR_type::CNAME,
            DNS::answer(www, DNS::RR_CNAME{example}));
  net.reply(root, example, RR_type::CNAME, DNS::no_data());
  net.reply(root, example, RR_type::A,
            DNS::answer(example, DNS::RR_A{"93.184.216.34"}));
  // Nobody answers for AAAA or MX.

  auto const results = DNS::collect(res, www);

  CHECK_EQ(results.cname.size(), 1);
  CHECK_EQ(results.cname[0].name, example);
  CHECK_EQ(results.cname[0].alias, www);
  CHECK_EQ(results.a.size(), 1);
  CHECK_EQ(results.a[0].name, example);
  CHECK(results.aaaa.empty());
  CHECK(results.mx.empty());

  // The A record was asked of the name at the end of the chain.
  CHECK(!net.asked(www, RR_type::A));

  std::ostringstream out;
  DNS::print_results(out, results);
  CHECK_EQ(out.str(), "www.example.com is an alias for example.com\n"
                      "example.com has address 93.184.216.34\n");
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  check_plain();
  check_alias();

  DNS::Scripted_transport net;
  DNS::Cache              cache;
  DNS::Resolver           res{net, cache};
  try {
    DNS::collect(res, "$?%^&*(");
    LOG(FATAL) << "should have thrown";
  }
  catch (std::invalid_argument const& ex) {
    CHECK(net.contacts().empty());
  }
}
