#include "DNS-collect.hpp"

#include "DNS-chain.hpp"

#include <fmt/format.h>
#include <fmt/ostream.h>

template <>
struct fmt::formatter<Domain> : ostream_formatter {};

namespace {
std::vector<DNS::Address_result> addresses(DNS::Result const& r,
                                           DNS::RR_type       type)
{
  std::vector<DNS::Address_result> ret;
  if (r.outcome != DNS::Outcome::answer)
    return ret;

  for (auto const& set : r.response.answer()) {
    if (set.type != type)
      continue;
    for (auto const& rr : set.rrs) {
      auto const addr = std::visit([](auto const& x) { return x.as_str(); }, rr);
      if (addr)
        ret.push_back(DNS::Address_result{set.owner, *addr});
    }
  }
  return ret;
}
} // namespace

namespace DNS {

Results collect(Resolver& res, Domain const& name)
{
  Results results;

  auto const chain = resolve_chain(res, name);
  for (auto const& step : chain.aliases)
    results.cname.push_back(CNAME_result{step.name, step.alias});

  results.a = addresses(lookup(res, chain.name, RR_type::A), RR_type::A);
  results.aaaa
      = addresses(lookup(res, chain.name, RR_type::AAAA), RR_type::AAAA);

  auto const mx = lookup(res, chain.name, RR_type::MX);
  if (mx.outcome == Outcome::answer) {
    for (auto const& set : mx.response.answer()) {
      if (set.type != RR_type::MX)
        continue;
      for (auto const& rr : set.rrs) {
        auto const& x = std::get<RR_MX>(rr);
        results.mx.push_back(MX_result{set.owner, x.preference(), x.exchange()});
      }
    }
  }

  return results;
}

Results collect(Resolver& res, std::string_view name)
{
  return collect(res, Domain{name});
}

void print_results(std::ostream& os, Results const& results)
{
  for (auto const& r : results.cname)
    os << fmt::format(fmt::runtime(Config::cname_fmt), fmt::arg("alias", r.alias),
                      fmt::arg("name", r.name))
       << '\n';
  for (auto const& r : results.a)
    os << fmt::format(fmt::runtime(Config::a_fmt), fmt::arg("name", r.name),
                      fmt::arg("address", r.address))
       << '\n';
  for (auto const& r : results.aaaa)
    os << fmt::format(fmt::runtime(Config::aaaa_fmt), fmt::arg("name", r.name),
                      fmt::arg("address", r.address))
       << '\n';
  for (auto const& r : results.mx)
    os << fmt::format(fmt::runtime(Config::mx_fmt), fmt::arg("name", r.name),
                      fmt::arg("preference", r.preference),
                      fmt::arg("exchange", r.exchange))
       << '\n';
}

} // namespace DNS
