#ifndef DNS_LDNS_DOT_HPP
#define DNS_LDNS_DOT_HPP

#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "DNS-message.hpp"
#include "DNS-rrs.hpp"
#include "Domain.hpp"

// forward decl
typedef struct ldns_struct_pkt     ldns_pkt;
typedef struct ldns_struct_rdf     ldns_rdf;
typedef struct ldns_struct_rr_list ldns_rr_list;

// Wire format encoding and decoding, courtesy of ldns.

namespace DNS_ldns {

using octet = unsigned char;

class Packet {
public:
  Packet(Packet const&) = delete;
  Packet& operator=(Packet const&) = delete;

  explicit Packet(ldns_pkt* p)
    : p_(p)
  {
  }
  ~Packet();

  ldns_pkt* get() const { return p_; }

private:
  ldns_pkt* p_;
};

// Printable form of a name as ldns holds it, no trailing dot.
std::string rr_name_str(ldns_rdf const* rdf);

// An iterative query: recursion desired is left off.  Returns an empty
// buffer if name can't be encoded.
std::vector<octet>
create_query(Domain const& name, DNS::RR_type type, uint16_t id);

// Decode a reply and make sure it answers the question we asked.
// Returns false, having logged why, if it doesn't.
bool parse_response(std::span<octet const> reply,
                    uint16_t               id,
                    Domain const&          name,
                    DNS::RR_type           type,
                    DNS::Response&         rsp);

// Sections of an ldns packet as RR sets, types we don't model are
// dropped.
void copy_section(ldns_rr_list const* rrs, DNS::Section& sec);

} // namespace DNS_ldns

#endif // DNS_LDNS_DOT_HPP
