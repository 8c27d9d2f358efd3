#ifndef DNS_MESSAGE_DOT_HPP
#define DNS_MESSAGE_DOT_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "DNS-rrs.hpp"
#include "Domain.hpp"

namespace DNS {

// Records sharing an owner name and type, in the order received.
struct RR_set {
  Domain        owner;
  RR_type       type;
  RR_collection rrs;
};

using Section = std::vector<RR_set>;

// A decoded reply, or one we made up.  The core only ever reads these;
// the codec builds them.

class Response {
public:
  Response() = default;

  uint16_t rcode() const { return rcode_; }
  void     rcode(uint16_t rc) { rcode_ = rc; }

  bool authoritative() const { return authoritative_; }
  void authoritative(bool aa) { authoritative_ = aa; }

  Section&       answer() { return answer_; }
  Section const& answer() const { return answer_; }

  Section&       authority() { return authority_; }
  Section const& authority() const { return authority_; }

  Section&       additional() { return additional_; }
  Section const& additional() const { return additional_; }

  bool empty() const
  {
    return answer_.empty() && authority_.empty() && additional_.empty();
  }

private:
  Section answer_;
  Section authority_;
  Section additional_;

  uint16_t rcode_{0};
  bool     authoritative_{false};
};

// What a lookup came to.  The empty-looking outcomes are kept apart so
// a caller can tell "there is no such record" from "nobody answered".

enum class Outcome : uint8_t {
  answer,    // answer section is populated
  no_data,   // a nameserver said there is nothing of this type
  nx_domain, // a nameserver said the name does not exist
  exhausted, // every nameserver we tried failed
  loop,      // too many referrals, nesting levels, or aliases
};

constexpr char const* Outcome_c_str(Outcome o)
{
  switch (o) { // clang-format off
  case Outcome::answer:    return "answer";
  case Outcome::no_data:   return "no data";
  case Outcome::nx_domain: return "non-existent domain";
  case Outcome::exhausted: return "nameservers exhausted";
  case Outcome::loop:      return "resolution loop";
  } // clang-format on
  return "*** unknown outcome ***";
}

struct Result {
  Outcome  outcome{Outcome::no_data};
  Response response;

  bool determined() const
  {
    return (outcome != Outcome::exhausted) && (outcome != Outcome::loop);
  }
};

// Append to the set with the same owner and type at the end of the
// section, or start a new one.
void add_rr(Section& sec, Domain const& owner, RR rr);

RR_collection            get_records(Section const& sec, RR_type type);
std::vector<std::string> get_strings(Section const& sec, RR_type type);

bool has_type(Section const& sec, RR_type type);

// The first CNAME target in the section, whatever its owner.
std::optional<Domain> first_cname(Section const& sec);

// The zero-answer placeholder used for negative results.
Response empty_response(uint16_t rcode = 0);

} // namespace DNS

#endif // DNS_MESSAGE_DOT_HPP
