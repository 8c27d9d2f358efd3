#ifndef DNS_CACHE_DOT_HPP
#define DNS_CACHE_DOT_HPP

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "DNS-message.hpp"
#include "DNS-rrs.hpp"
#include "Domain.hpp"

namespace DNS {

struct Cache_key {
  Domain  name;
  RR_type type;

  bool operator==(Cache_key const& rhs) const = default;
};

struct Cache_key_hash {
  std::size_t operator()(Cache_key const& k) const
  {
    auto const h = std::hash<Domain>()(k.name);
    return h ^ (std::hash<uint16_t>()(static_cast<uint16_t>(k.type)) << 1);
  }
};

// Everything learned during this run: answers, NS sets, glue.  Entries
// never expire and are never replaced; the first result stored for a
// key is the one every later lookup sees.

class Cache {
public:
  Cache(Cache const&) = delete;
  Cache& operator=(Cache const&) = delete;

  Cache() = default;

  std::optional<Result> get(Domain const& name, RR_type type) const;

  // Returns false, leaving the cache as it was, if name/type is
  // already present.
  bool put(Domain const& name, RR_type type, Result result);

  std::size_t size() const;

private:
  mutable std::mutex                                   mtx_;
  std::unordered_map<Cache_key, Result, Cache_key_hash> map_;
};

} // namespace DNS

#endif // DNS_CACHE_DOT_HPP
