#include "DNS.hpp"

#include "DNS-delegation.hpp"
#include "DNS-iostream.hpp"

#include <algorithm>
#include <string>
#include <unordered_set>

#include <glog/logging.h>

namespace {
// RFC 1035 section 4.1.1 RCODE values we act on.
auto constexpr rcode_noerror{uint16_t(0)};
auto constexpr rcode_nxdomain{uint16_t(3)};

std::string indent(int depth) { return std::string(2 * depth, ' '); }

enum class referral_kind { none, unusable, usable };

// Look for a delegation in the authority section: an NS set whose owner
// encloses name and sits strictly below the zone cut we asked at.  An NS
// set that fails either test makes the reply lame for our purposes.
referral_kind find_referral(DNS::Response const&  reply,
                            Domain const&         name,
                            Domain const&         cut,
                            Domain&               zone,
                            std::vector<Domain>&  ns_names)
{
  auto saw_ns = false;
  for (auto const& set : reply.authority()) {
    if (set.type != DNS::RR_type::NS)
      continue;
    saw_ns = true;

    if (!name.is_subdomain_of(set.owner)) {
      LOG(WARNING) << "out-of-bailiwick referral to " << set.owner
                   << " while resolving " << name;
      continue;
    }
    if ((set.owner == cut) || !set.owner.is_subdomain_of(cut)) {
      LOG(WARNING) << "referral to " << set.owner << " is no closer to "
                   << name << " than " << cut;
      continue;
    }

    zone = set.owner;
    for (auto const& rr : set.rrs) {
      auto const& nsdname = std::get<DNS::RR_NS>(rr).nsdname();
      if (std::find(begin(ns_names), end(ns_names), nsdname) == end(ns_names))
        ns_names.push_back(nsdname);
    }
    if (!ns_names.empty())
      return referral_kind::usable;
  }
  return saw_ns ? referral_kind::unusable : referral_kind::none;
}

// Follow the aliases carried in one answer section, starting at name.
Domain alias_target(DNS::Section const& answer, Domain name)
{
  for (auto steps = answer.size(); steps; --steps) {
    auto const it
        = std::find_if(begin(answer), end(answer), [&name](auto const& set) {
            return (set.type == DNS::RR_type::CNAME) && (set.owner == name)
                   && !set.rrs.empty();
          });
    if (it == end(answer))
      break;
    name = std::get<DNS::RR_CNAME>(it->rrs.front()).cname();
  }
  return name;
}
} // namespace

namespace DNS {

Resolver::Resolver(Transport& transport, Cache& cache)
  : transport_(transport)
  , cache_(cache)
{
}

Resolver::Resolver(Transport& transport, Cache& cache, Options const& opts)
  : transport_(transport)
  , cache_(cache)
  , opts_(opts)
{
}

Result Resolver::query(Domain const& name, RR_type type)
{
  return query_(name, type, nullptr, 0);
}

Result Resolver::query(Domain const&         name,
                       RR_type               type,
                       Nameserver_set const& start)
{
  return query_(name, type, &start, 0);
}

Result Resolver::lookup(Domain const& name, RR_type type)
{
  return lookup_(name, type, 0);
}

Result Resolver::lookup_(Domain const& name, RR_type type, int depth)
{
  auto result = query_(name, type, nullptr, depth);
  if (type == RR_type::CNAME)
    return result;

  auto const hints = root_hints();
  auto       current = name;

  std::unordered_set<Domain> seen{name};

  for (auto hops = 0; (result.outcome == Outcome::answer)
                      && !has_type(result.response.answer(), type);
       ++hops) {
    auto target = alias_target(result.response.answer(), current);
    if (target == current) {
      auto const any = first_cname(result.response.answer());
      if (!any)
        break;
      target = *any;
    }

    if (hops >= opts_.max_chain) {
      LOG(WARNING) << "more than " << opts_.max_chain
                   << " aliases looking up " << name << '/' << type;
      return Result{Outcome::loop, empty_response()};
    }
    if (!seen.insert(target).second) {
      LOG(WARNING) << "alias loop at " << target << " looking up " << name
                   << '/' << type;
      return Result{Outcome::loop, empty_response()};
    }

    VLOG(1) << indent(depth) << "following " << current << " to " << target;
    current = target;
    result  = query_(current, type, &hints, depth);
  }

  return result;
}

Result Resolver::remember_(Domain const& name, RR_type type, Result result)
{
  if (cache_.put(name, type, result))
    return result;

  // Someone got there first; theirs is the answer everyone sees.
  auto cached = cache_.get(name, type);
  CHECK(cached) << "cache lost " << name << '/' << type;
  return *cached;
}

Result Resolver::query_(Domain const&         name,
                        RR_type               type,
                        Nameserver_set const* start,
                        int                   depth)
{
  auto const pfx = indent(depth);

  if (auto cached = cache_.get(name, type); cached) {
    VLOG(1) << pfx << name << '/' << type << " from cache ("
            << cached->outcome << ')';
    return *cached;
  }

  if (depth > opts_.max_depth) {
    LOG(WARNING) << "glueless lookups nested too deeply resolving " << name
                 << '/' << type;
    return Result{Outcome::loop, empty_response()};
  }

  Domain         cut;
  Nameserver_set nameservers;
  if (start) {
    nameservers = *start;
  }
  else {
    auto delegation = closest_delegation(cache_, name);
    cut = delegation.zone;
    nameservers = std::move(delegation.nameservers);
  }

  auto referrals = 0;

  for (;;) {
    auto referred = false;

    for (auto const& ns : nameservers) {
      VLOG(1) << pfx << "asking " << ns << " (" << cut << ") for " << name
              << '/' << type;

      Response   reply;
      auto const status = transport_.xchg(name, type, ns, reply);
      if (status != xchg_status::ok) {
        VLOG(1) << pfx << ns << ' ' << xchg_status_c_str(status);
        continue;
      }

      if ((reply.rcode() != rcode_noerror) && (reply.rcode() != rcode_nxdomain)) {
        LOG(WARNING) << ns << " returned " << rcode_c_str(reply.rcode())
                     << " for " << name << '/' << type;
        continue;
      }

      if (!reply.answer().empty()) {
        if ((type == RR_type::CNAME) && !has_type(reply.answer(), RR_type::CNAME)) {
          // Asked for an alias, got the address it points at: there is
          // no alias by that name.
          VLOG(1) << pfx << name << " is not an alias";
          return remember_(name, type, Result{Outcome::no_data, empty_response()});
        }
        VLOG(1) << pfx << ns << " answered " << name << '/' << type;
        return remember_(name, type, Result{Outcome::answer, reply});
      }

      if (reply.rcode() == rcode_nxdomain) {
        VLOG(1) << pfx << ns << " says " << name << " does not exist";
        return remember_(name, type, Result{Outcome::nx_domain, reply});
      }

      Domain              zone;
      std::vector<Domain> ns_names;
      auto const kind = find_referral(reply, name, cut, zone, ns_names);

      if (kind == referral_kind::none) {
        VLOG(1) << pfx << ns << " has no " << type << " for " << name;
        return remember_(name, type, Result{Outcome::no_data, reply});
      }
      if (kind == referral_kind::unusable)
        continue;

      if (++referrals > opts_.max_referrals) {
        LOG(WARNING) << "more than " << opts_.max_referrals
                     << " referrals resolving " << name << '/' << type;
        return Result{Outcome::loop, empty_response()};
      }

      VLOG(1) << pfx << ns << " refers " << name << " to " << zone;

      auto next = learn_referral_(reply, zone, ns_names, depth);
      if (next.empty()) {
        LOG(WARNING) << "no usable nameserver address for " << zone;
        continue;
      }

      cut = zone;
      nameservers = std::move(next);
      referred = true;
      break;
    }

    if (!referred)
      break;
  }

  LOG(WARNING) << "no nameserver could answer " << name << '/' << type;
  return remember_(name, type, Result{Outcome::exhausted, empty_response()});
}

Nameserver_set Resolver::learn_referral_(Response const&            reply,
                                         Domain const&              zone,
                                         std::vector<Domain> const& ns_names,
                                         int                        depth)
{
  Response ns_rsp;
  for (auto const& set : reply.authority()) {
    if ((set.type == RR_type::NS) && (set.owner == zone))
      ns_rsp.answer().push_back(set);
  }
  cache_.put(zone, RR_type::NS, Result{Outcome::answer, ns_rsp});

  Nameserver_set next;

  // Glue: only addresses for the nameservers we were just given.
  for (auto const& set : reply.additional()) {
    if (set.type != RR_type::A)
      continue;
    if (std::find(begin(ns_names), end(ns_names), set.owner) == end(ns_names))
      continue;

    Response glue;
    glue.answer().push_back(set);
    cache_.put(set.owner, RR_type::A, Result{Outcome::answer, glue});

    auto const addrs = get_strings(glue.answer(), RR_type::A);
    next.insert(end(next), begin(addrs), end(addrs));
  }
  if (!next.empty())
    return next;

  for (auto const& ns_name : ns_names) {
    VLOG(1) << indent(depth) << "no glue for " << zone << ", resolving "
            << ns_name;
    auto const r = lookup_(ns_name, RR_type::A, depth + 1);
    if (r.outcome != Outcome::answer)
      continue;
    next = get_strings(r.response.answer(), RR_type::A);
    if (!next.empty())
      break;
  }
  return next;
}

} // namespace DNS
