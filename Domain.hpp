#ifndef DOMAIN_DOT_HPP
#define DOMAIN_DOT_HPP

#include <compare>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

// A DNS domain name: lower case A-labels with no trailing dot.  The
// root is the empty name.

class Domain {
public:
  Domain() = default;

  inline explicit Domain(std::string_view dom);

  inline static bool
  validate(std::string_view domain, std::string& msg, Domain& dom);

  inline bool is_root() const;

  inline bool operator==(Domain const& rhs) const;
  inline auto operator<=>(Domain const& rhs) const;

  inline std::string const& ascii() const;
  inline std::string const& utf8() const;

  std::vector<std::string> labels() const;

  // The enclosing zone; the root is its own parent.
  Domain parent() const;

  // This name, then each enclosing name in turn, ending with the root.
  std::vector<Domain> ancestors() const;

  // True if this name is zone, or is below it.
  bool is_subdomain_of(Domain const& zone) const;

private:
  bool set_(std::string_view dom, bool should_throw, std::string& msg);

  std::string ascii_; // A-labels
  std::string utf8_;  // U-labels, or empty
};

Domain::Domain(std::string_view dom)
{
  std::string msg;
  set_(dom, true /* throw */, msg);
}

bool Domain::validate(std::string_view domain, std::string& msg, Domain& dom)
{
  return dom.set_(domain, false /* don't throw */, msg);
}

bool Domain::is_root() const { return ascii_.empty(); }

bool Domain::operator==(Domain const& rhs) const
{
  return ascii_ == rhs.ascii_;
}

auto Domain::operator<=>(const Domain& rhs) const
{
  return ascii_ <=> rhs.ascii_;
}

std::string const& Domain::ascii() const { return ascii_; }
std::string const& Domain::utf8() const
{
  return utf8_.empty() ? ascii_ : utf8_;
}

inline std::ostream& operator<<(std::ostream& os, Domain const& dom)
{
  if (dom.is_root())
    return os << '.';
  return os << dom.ascii();
}

namespace std {
template <>
struct hash<Domain> {
  std::size_t operator()(Domain const& k) const
  {
    return hash<std::string>()(k.ascii());
  }
};
} // namespace std

#endif // DOMAIN_DOT_HPP
