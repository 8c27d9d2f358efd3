#include "Domain.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

#include <glog/logging.h>

#include <fmt/format.h>
#include <fmt/ostream.h>

template <>
struct fmt::formatter<Domain> : ostream_formatter {};

using namespace std::string_literals;

int main(int argc, char const* argv[])
{
  std::string msg;

  Domain d0{"EXAMPLE.COM"};
  Domain d1{"example.com."};
  CHECK_EQ(d0, d1);
  CHECK_EQ(d0.ascii(), "example.com");

  Domain const d3{""};
  Domain const d4{"."};
  CHECK_EQ(d3, d4);
  CHECK(d3.is_root());
  CHECK(Domain{}.is_root());

  Domain const dom2{"黒川.日本"};
  Domain const dom3{"xn--5rtw95l.xn--wgv71a"};
  CHECK_EQ(dom2, dom3);
  CHECK_EQ(dom2.utf8(), "黒川.日本");

  Domain const poop1{"💩.la"};
  Domain const poop2{"xn--ls8h.la"};
  CHECK_EQ(poop1, poop2);

  Domain const norm0{"hi⒌com"}; // non-ascii "dot" before "com"
  Domain const norm1{"hi5.com"};
  CHECK_EQ(norm0, norm1);

  Domain dom;
  CHECK(Domain::validate("hi⒌com", msg, dom));
  CHECK(Domain::validate("hi5.com", msg, dom));
  CHECK(Domain::validate("_25._tcp.mx.example.com", msg, dom)) << msg;

  CHECK(!Domain::validate("$?%^&*(", msg, dom));
  CHECK_EQ(msg, "failed to parse domain «$?%^&*(»"s);

  CHECK(!Domain::validate("email@123.123.123.123", msg, dom));
  CHECK_EQ(msg, "failed to parse domain «email@123.123.123.123»"s);

  CHECK(!Domain::validate("a..b", msg, dom));
  CHECK_EQ(msg, "failed to parse domain «a..b»"s);

  auto constexpr long_dom =
      "xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx."
      "xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx."
      "xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx."
      "xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx";
  CHECK(Domain::validate(long_dom, msg, dom)) << msg;

  CHECK(!Domain::validate(
      "xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx."
      "xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx."
      "xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx."
      "xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx.com",
      msg, dom));
  CHECK_EQ(msg,
           "domain name "
           "«xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx."
           "xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx."
           "xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx."
           "xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx.com» "
           "too long");

  CHECK(!Domain::validate(
      "a.b.xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx."
      "com",
      msg, dom));
  CHECK_EQ(
      msg,
      "domain label «xxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxxx» too long"s);

  try {
    Domain const junk{"$?%^&*("};
    LOG(FATAL) << "should have thrown";
  }
  catch (std::invalid_argument const& ex) {
    CHECK_EQ(ex.what(), "failed to parse domain «$?%^&*(»"s);
  }

  // Walking up the tree.

  Domain const www{"www.Example.COM"};
  CHECK_EQ(www.parent(), Domain{"example.com"});
  CHECK_EQ(www.parent().parent(), Domain{"com"});
  CHECK(www.parent().parent().parent().is_root());
  CHECK(Domain{}.parent().is_root());

  auto const anc = www.ancestors();
  CHECK_EQ(anc.size(), 4);
  CHECK_EQ(anc[0], www);
  CHECK_EQ(anc[1], Domain{"example.com"});
  CHECK_EQ(anc[2], Domain{"com"});
  CHECK(anc[3].is_root());

  CHECK_EQ(Domain{}.ancestors().size(), 1);

  auto const lbls = www.labels();
  CHECK_EQ(lbls.size(), 3);
  CHECK_EQ(lbls.front(), "www");
  CHECK(Domain{}.labels().empty());

  CHECK(www.is_subdomain_of(Domain{"example.com"}));
  CHECK(www.is_subdomain_of(Domain{"com"}));
  CHECK(www.is_subdomain_of(Domain{}));
  CHECK(www.is_subdomain_of(www));
  CHECK(!www.is_subdomain_of(Domain{"ample.com"}));
  CHECK(!www.is_subdomain_of(Domain{"www.example.com.au"}));
  CHECK(!Domain{"example.com"}.is_subdomain_of(www));

  CHECK_EQ(fmt::format("{}", www), "www.example.com");
  CHECK_EQ(fmt::format("{}", Domain{}), ".");

  for (auto arg{1}; arg < argc; ++arg) {
    Domain const a{argv[arg]};
    std::cout << a << '\n';
  }
}
