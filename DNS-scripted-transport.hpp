#ifndef DNS_SCRIPTED_TRANSPORT_DOT_HPP
#define DNS_SCRIPTED_TRANSPORT_DOT_HPP

// A Transport for tests: replies come from a script keyed by
// nameserver, name and type.  Anything not scripted times out.

#include <algorithm>
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include "DNS-transport.hpp"

namespace DNS {

class Scripted_transport : public Transport {
public:
  struct Contact {
    std::string nameserver;
    Domain      name;
    RR_type     type;
  };

  void reply(std::string const& ns,
             Domain const&      name,
             RR_type            type,
             Response           rsp)
  {
    script_[key(ns, name, type)] = Step{xchg_status::ok, std::move(rsp)};
  }

  void fail(std::string const& ns,
            Domain const&      name,
            RR_type            type,
            xchg_status        status = xchg_status::error)
  {
    script_[key(ns, name, type)] = Step{status, Response{}};
  }

  xchg_status xchg(Domain const&      name,
                   RR_type            type,
                   std::string const& nameserver,
                   Response&          rsp) override
  {
    contacts_.push_back(Contact{nameserver, name, type});

    auto const it = script_.find(key(nameserver, name, type));
    if (it == script_.end())
      return xchg_status::timeout;

    rsp = it->second.rsp;
    return it->second.status;
  }

  std::vector<Contact> const& contacts() const { return contacts_; }
  void                        forget() { contacts_.clear(); }

  bool contacted(std::string const& ns) const
  {
    return std::any_of(begin(contacts_), end(contacts_),
                       [&ns](auto const& c) { return c.nameserver == ns; });
  }

  bool asked(Domain const& name, RR_type type) const
  {
    return std::any_of(begin(contacts_), end(contacts_), [&](auto const& c) {
      return (c.name == name) && (c.type == type);
    });
  }

private:
  struct Step {
    xchg_status status;
    Response    rsp;
  };

  using Key = std::tuple<std::string, std::string, RR_type>;

  static Key key(std::string const& ns, Domain const& name, RR_type type)
  {
    return Key{ns, name.ascii(), type};
  }

  std::map<Key, Step>  script_;
  std::vector<Contact> contacts_;
};

// Replies, as a nameserver would send them.

inline Response answer(Domain const& owner, RR rr)
{
  Response rsp;
  rsp.authoritative(true);
  add_rr(rsp.answer(), owner, std::move(rr));
  return rsp;
}

inline Response no_data() { return empty_response(); }

inline Response nx_domain() { return empty_response(3); }

// A delegation of zone to the given nameservers; those with an address
// get a glue record.
inline Response
referral(Domain const&                                               zone,
         std::vector<std::pair<Domain, std::optional<std::string>>> const& nss)
{
  Response rsp;
  for (auto const& ns : nss) {
    add_rr(rsp.authority(), zone, RR_NS{ns.first});
  }
  for (auto const& [ns, addr] : nss) {
    if (addr)
      add_rr(rsp.additional(), ns, RR_A{addr->c_str()});
  }
  return rsp;
}

} // namespace DNS

#endif // DNS_SCRIPTED_TRANSPORT_DOT_HPP
