#ifndef DNS_DOT_HPP
#define DNS_DOT_HPP

#include <vector>

#include "DNS-cache.hpp"
#include "DNS-message.hpp"
#include "DNS-root-hints.hpp"
#include "DNS-rrs.hpp"
#include "DNS-transport.hpp"
#include "Domain.hpp"

namespace Config {
// Bounds on a single lookup; nothing in the protocol stops a
// misconfigured (or hostile) set of zones from sending us in circles.
auto constexpr max_referrals{32}; // delegations followed per query
auto constexpr max_depth{8};      // nested lookups for glueless NS names
auto constexpr max_chain{16};     // CNAMEs followed per name
} // namespace Config

namespace DNS {

// Iterative resolution: starts from the closest zone we know
// nameservers for (the root, at first) and follows referrals down
// until some nameserver answers.  query() doesn't chase aliases,
// lookup() does; see also resolve_chain() in DNS-chain.hpp.

class Resolver {
public:
  struct Options {
    int max_referrals{Config::max_referrals};
    int max_depth{Config::max_depth};
    int max_chain{Config::max_chain};
  };

  Resolver(Resolver const&) = delete;
  Resolver& operator=(Resolver const&) = delete;

  Resolver(Transport& transport, Cache& cache);
  Resolver(Transport& transport, Cache& cache, Options const& opts);

  Result query(Domain const& name, RR_type type);

  // Start from these nameservers rather than the closest cached
  // delegation.  A cached result for name/type still wins.
  Result query(Domain const& name, RR_type type, Nameserver_set const& start);

  // A query that follows any alias in the answer: the alias target is
  // looked up again starting at the root hints, since it may live in an
  // unrelated zone.  Queries for CNAME itself are never chased.
  Result lookup(Domain const& name, RR_type type);

  Options const& options() const { return opts_; }
  Cache&         cache() { return cache_; }

private:
  Result query_(Domain const&         name,
                RR_type               type,
                Nameserver_set const* start,
                int                   depth);

  Result lookup_(Domain const& name, RR_type type, int depth);

  Nameserver_set learn_referral_(Response const&            reply,
                                 Domain const&              zone,
                                 std::vector<Domain> const& ns_names,
                                 int                        depth);

  Result remember_(Domain const& name, RR_type type, Result result);

  Transport& transport_;
  Cache&     cache_;
  Options    opts_;
};

} // namespace DNS

#endif // DNS_DOT_HPP
