#include "DNS-delegation.hpp"

#include "DNS.hpp"

#include <glog/logging.h>

namespace {
// Cached addresses for a nameserver name.  A name that was found to be
// an alias has only its CNAME cached under it; the addresses are cached
// under the alias target.
DNS::Nameserver_set cached_addresses(DNS::Cache const& cache, Domain name)
{
  for (auto hops = 0; hops <= Config::max_chain; ++hops) {
    auto const result = cache.get(name, DNS::RR_type::A);
    if (!result || (result->outcome != DNS::Outcome::answer))
      break;

    auto const& answer = result->response.answer();
    auto        addrs  = DNS::get_strings(answer, DNS::RR_type::A);
    if (!addrs.empty())
      return addrs;

    auto const target = DNS::first_cname(answer);
    if (!target || (*target == name))
      break;
    name = *target;
  }
  return {};
}
} // namespace

namespace DNS {

Delegation closest_delegation(Cache const& cache, Domain const& name)
{
  for (auto const& zone : name.ancestors()) {
    auto const ns_result = cache.get(zone, RR_type::NS);
    if (!ns_result)
      continue;

    Nameserver_set nameservers;

    auto const ns_rrs = get_records(ns_result->response.answer(), RR_type::NS);

    for (auto const& rr : ns_rrs) {
      auto const& nsdname = std::get<RR_NS>(rr).nsdname();

      auto const addrs = cached_addresses(cache, nsdname);
      nameservers.insert(end(nameservers), begin(addrs), end(addrs));
    }

    if (!nameservers.empty()) {
      VLOG(1) << "closest cached delegation for " << name << " is " << zone
              << ", " << nameservers.size() << " addresses";
      return Delegation{zone, std::move(nameservers)};
    }

    VLOG(1) << "no known address for any nameserver of " << zone;
  }

  VLOG(1) << "starting " << name << " at the root";
  return Delegation{Domain{}, root_hints()};
}

} // namespace DNS
