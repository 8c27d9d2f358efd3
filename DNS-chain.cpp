#include "DNS-chain.hpp"

#include "DNS-iostream.hpp"

#include <unordered_set>

#include <glog/logging.h>

namespace DNS {

Chain resolve_chain(Resolver& res, Domain const& name)
{
  Chain chain{name, {}, Outcome::no_data};

  std::unordered_set<Domain> seen{name};

  for (;;) {
    auto const r = res.query(chain.name, RR_type::CNAME);
    chain.outcome = r.outcome;

    auto const target = (r.outcome == Outcome::answer)
                            ? first_cname(r.response.answer())
                            : std::nullopt;
    if (!target)
      break;

    VLOG(1) << chain.name << " is an alias for " << *target;

    if (chain.aliases.size() >= size_t(res.options().max_chain)) {
      LOG(WARNING) << "more than " << res.options().max_chain
                   << " aliases following " << name;
      chain.outcome = Outcome::loop;
      break;
    }
    if (!seen.insert(*target).second) {
      LOG(WARNING) << "alias loop at " << *target << " following " << name;
      chain.outcome = Outcome::loop;
      break;
    }

    chain.aliases.push_back(Alias{chain.name, *target});
    chain.name = *target;
  }

  return chain;
}

Result lookup(Resolver& res, Domain const& name, RR_type type)
{
  return res.lookup(name, type);
}

} // namespace DNS
