#ifndef DNS_DELEGATION_DOT_HPP
#define DNS_DELEGATION_DOT_HPP

#include "DNS-cache.hpp"
#include "DNS-root-hints.hpp"
#include "Domain.hpp"

namespace DNS {

struct Delegation {
  Domain         zone; // the root when falling back to the hints
  Nameserver_set nameservers;
};

// The most specific zone enclosing name for which the cache holds NS
// records with at least one known address, else the root hints.  The
// nameserver set is never empty.
Delegation closest_delegation(Cache const& cache, Domain const& name);

} // namespace DNS

#endif // DNS_DELEGATION_DOT_HPP
