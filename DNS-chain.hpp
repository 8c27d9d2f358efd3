#ifndef DNS_CHAIN_DOT_HPP
#define DNS_CHAIN_DOT_HPP

#include <vector>

#include "DNS.hpp"

namespace DNS {

struct Alias {
  Domain alias; // the name looked up
  Domain name;  // what it's an alias for
};

struct Chain {
  Domain             name; // the terminal, non-alias name
  std::vector<Alias> aliases;

  // From the query that ended the walk, or loop if the chain revisited
  // a name or ran longer than max_chain.
  Outcome outcome{Outcome::no_data};
};

// Follow CNAME records one query at a time until a name has none.
Chain resolve_chain(Resolver& res, Domain const& name);

// Same as res.lookup(name, type).
Result lookup(Resolver& res, Domain const& name, RR_type type);

} // namespace DNS

#endif // DNS_CHAIN_DOT_HPP
