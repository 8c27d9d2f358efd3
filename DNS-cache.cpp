#include "DNS-cache.hpp"

#include "DNS-iostream.hpp"

#include <glog/logging.h>

namespace DNS {

std::optional<Result> Cache::get(Domain const& name, RR_type type) const
{
  std::lock_guard<std::mutex> lock(mtx_);

  auto const it = map_.find(Cache_key{name, type});
  if (it == map_.end())
    return {};
  return it->second;
}

bool Cache::put(Domain const& name, RR_type type, Result result)
{
  std::lock_guard<std::mutex> lock(mtx_);

  auto const outcome = result.outcome;
  auto const inserted
      = map_.try_emplace(Cache_key{name, type}, std::move(result)).second;
  if (inserted) {
    VLOG(2) << "cached " << name << '/' << type << " (" << outcome << ')';
  }
  return inserted;
}

std::size_t Cache::size() const
{
  std::lock_guard<std::mutex> lock(mtx_);
  return map_.size();
}

} // namespace DNS
