#include "DNS-message.hpp"

#include <algorithm>

namespace DNS {

void add_rr(Section& sec, Domain const& owner, RR rr)
{
  auto const type = rr_type(rr);

  if (sec.empty() || (sec.back().owner != owner) || (sec.back().type != type))
    sec.push_back(RR_set{owner, type, {}});

  sec.back().rrs.emplace_back(std::move(rr));
}

RR_collection get_records(Section const& sec, RR_type type)
{
  RR_collection ret;
  for (auto const& set : sec) {
    if (set.type != type)
      continue;
    ret.insert(end(ret), begin(set.rrs), end(set.rrs));
  }
  return ret;
}

std::vector<std::string> get_strings(Section const& sec, RR_type type)
{
  std::vector<std::string> ret;

  for (auto const& rr : get_records(sec, type)) {
    std::visit(
        [&ret](auto const& r) {
          auto const s = r.as_str();
          if (s)
            ret.push_back(*s);
        },
        rr);
  }

  return ret;
}

bool has_type(Section const& sec, RR_type type)
{
  return std::any_of(begin(sec), end(sec),
                     [type](auto const& set) { return set.type == type; });
}

std::optional<Domain> first_cname(Section const& sec)
{
  for (auto const& set : sec) {
    for (auto const& rr : set.rrs) {
      if (std::holds_alternative<RR_CNAME>(rr))
        return std::get<RR_CNAME>(rr).cname();
    }
  }
  return {};
}

Response empty_response(uint16_t rcode)
{
  Response ret;
  ret.rcode(rcode);
  return ret;
}

} // namespace DNS
