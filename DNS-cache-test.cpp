#include "DNS-cache.hpp"

#include "DNS-iostream.hpp"

#include <thread>
#include <vector>

#include <glog/logging.h>

using DNS::Outcome;
using DNS::RR_type;

namespace {
DNS::Result address(Domain const& name, char const* addr)
{
  DNS::Response rsp;
  add_rr(rsp.answer(), name, DNS::RR_A{addr});
  return DNS::Result{Outcome::answer, rsp};
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  DNS::Cache cache;

  Domain const name{"example.com"};

  CHECK(!cache.get(name, RR_type::A));
  CHECK_EQ(cache.size(), 0);

  CHECK(cache.put(name, RR_type::A, address(name, "93.184.216.34")));
  CHECK_EQ(cache.size(), 1);

  // First writer wins.
  CHECK(!cache.put(name, RR_type::A, address(name, "192.0.2.1")));
  CHECK(!cache.put(name, RR_type::A,
                   DNS::Result{Outcome::exhausted, DNS::empty_response()}));
  CHECK_EQ(cache.size(), 1);

  for (auto i = 0; i < 3; ++i) {
    auto const r = cache.get(name, RR_type::A);
    CHECK(r);
    CHECK_EQ(r->outcome, Outcome::answer);
    auto const addrs = get_strings(r->response.answer(), RR_type::A);
    CHECK_EQ(addrs.size(), 1);
    CHECK_EQ(addrs[0], "93.184.216.34");
  }

  // Same name, different type, different key.
  CHECK(!cache.get(name, RR_type::AAAA));
  CHECK(cache.put(name, RR_type::AAAA,
                  DNS::Result{Outcome::no_data, DNS::empty_response()}));
  CHECK_EQ(cache.get(name, RR_type::AAAA)->outcome, Outcome::no_data);

  // Keys are normalized names.
  CHECK(cache.get(Domain{"EXAMPLE.COM."}, RR_type::A));

  // Racing writers: exactly one wins each key.
  DNS::Cache               shared;
  std::vector<std::thread> writers;
  std::vector<int>         wins(8);
  for (auto t = 0; t < 8; ++t) {
    writers.emplace_back([&shared, &wins, t] {
      for (auto i = 0; i < 100; ++i) {
        Domain const dom{"host" + std::to_string(i) + ".example"};
        if (shared.put(dom, RR_type::A,
                       DNS::Result{Outcome::no_data, DNS::empty_response()}))
          ++wins[t];
      }
    });
  }
  for (auto& w : writers)
    w.join();

  auto total = 0;
  for (auto w : wins)
    total += w;
  CHECK_EQ(total, 100);
  CHECK_EQ(shared.size(), 100);
}
