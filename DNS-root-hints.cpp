#include "DNS-root-hints.hpp"

#include "IP4.hpp"

#include <glog/logging.h>

namespace DNS {

Nameserver_set root_hints()
{
  Nameserver_set ret;
  for (auto const addr : Config::root_servers) {
    CHECK(IP4::is_address(addr)) << addr;
    ret.emplace_back(addr);
  }
  return ret;
}

} // namespace DNS
