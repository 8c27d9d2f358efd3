#include "DNS-ldns.hpp"

#include "DNS-iostream.hpp"

#include <cstdlib>
#include <optional>
#include <stdexcept>

#include <ldns/ldns.h>
#include <ldns/packet.h>
#include <ldns/rr.h>

#include <glog/logging.h>

namespace DNS_ldns {

namespace {
std::optional<Domain> to_domain(ldns_rdf const* rdf)
{
  try {
    return Domain{rr_name_str(rdf)};
  }
  catch (std::invalid_argument const& e) {
    LOG(WARNING) << "ignoring name «" << rr_name_str(rdf) << "»: " << e.what();
  }
  return {};
}

std::optional<DNS::RR> to_rr(ldns_rr const* rr)
{
  switch (ldns_rr_get_type(rr)) {
  case LDNS_RR_TYPE_A: {
    if (ldns_rr_rd_count(rr) != 1)
      break;
    auto const rdf = ldns_rr_rdf(rr, 0);
    if (ldns_rdf_get_type(rdf) != LDNS_RDF_TYPE_A || ldns_rdf_size(rdf) != 4)
      break;
    return DNS::RR_A{ldns_rdf_data(rdf), ldns_rdf_size(rdf)};
  }
  case LDNS_RR_TYPE_NS: {
    if (ldns_rr_rd_count(rr) != 1)
      break;
    auto const rdf = ldns_rr_rdf(rr, 0);
    if (ldns_rdf_get_type(rdf) != LDNS_RDF_TYPE_DNAME)
      break;
    auto dom = to_domain(rdf);
    if (!dom)
      return {};
    return DNS::RR_NS{std::move(*dom)};
  }
  case LDNS_RR_TYPE_CNAME: {
    if (ldns_rr_rd_count(rr) != 1)
      break;
    auto const rdf = ldns_rr_rdf(rr, 0);
    if (ldns_rdf_get_type(rdf) != LDNS_RDF_TYPE_DNAME)
      break;
    auto dom = to_domain(rdf);
    if (!dom)
      return {};
    return DNS::RR_CNAME{std::move(*dom)};
  }
  case LDNS_RR_TYPE_MX: {
    if (ldns_rr_rd_count(rr) != 2)
      break;
    auto const rdf_0 = ldns_rr_rdf(rr, 0);
    auto const rdf_1 = ldns_rr_rdf(rr, 1);
    if (ldns_rdf_get_type(rdf_0) != LDNS_RDF_TYPE_INT16 ||
        ldns_rdf_get_type(rdf_1) != LDNS_RDF_TYPE_DNAME)
      break;
    auto dom = to_domain(rdf_1);
    if (!dom)
      return {};
    return DNS::RR_MX{std::move(*dom), ldns_rdf2native_int16(rdf_0)};
  }
  case LDNS_RR_TYPE_AAAA: {
    if (ldns_rr_rd_count(rr) != 1)
      break;
    auto const rdf = ldns_rr_rdf(rr, 0);
    if (ldns_rdf_get_type(rdf) != LDNS_RDF_TYPE_AAAA ||
        ldns_rdf_size(rdf) != 16)
      break;
    return DNS::RR_AAAA{ldns_rdf_data(rdf), ldns_rdf_size(rdf)};
  }
  default:
    // SOA, RRSIG, OPT and friends: nothing here looks at them.
    VLOG(2) << "skipping "
            << DNS::RR_type_c_str(static_cast<uint16_t>(ldns_rr_get_type(rr)))
            << " record";
    return {};
  }

  LOG(WARNING) << "bogus "
               << DNS::RR_type_c_str(static_cast<uint16_t>(ldns_rr_get_type(rr)))
               << " record";
  return {};
}
} // namespace

Packet::~Packet()
{
  if (p_)
    ldns_pkt_free(p_);
}

std::string rr_name_str(ldns_rdf const* rdf)
{
  auto const sz = ldns_rdf_size(rdf);

  if (sz > LDNS_MAX_DOMAINLEN) {
    LOG(WARNING) << "rdf size too large";
    return "<too long>";
  }
  if (sz == 1) {
    return ""; // root label
  }

  auto const data = ldns_rdf_data(rdf);

  size_t        src_pos = 0;
  unsigned char len     = data[src_pos];

  std::string str;
  str.reserve(64);
  while ((len > 0) && (src_pos < sz)) {
    src_pos++;
    for (unsigned char i = 0; (i < len) && (src_pos < sz); ++i) {
      unsigned char c = data[src_pos];
      if (c == '.' || c == '\\') {
        str += '\\';
      }
      str += c;
      src_pos++;
    }
    if (src_pos < sz) {
      str += '.';
      len = data[src_pos];
    }
    else {
      len = 0;
    }
  }

  if (str.length() && ('.' == str.back())) {
    str.erase(str.length() - 1);
  }

  return str;
}

std::vector<octet>
create_query(Domain const& name, DNS::RR_type type, uint16_t id)
{
  ldns_pkt*  pkt    = nullptr;
  auto const qname  = name.is_root() ? std::string{"."} : name.ascii();
  auto const status = ldns_pkt_query_new_frm_str(
      &pkt, qname.c_str(), static_cast<ldns_rr_type>(type), LDNS_RR_CLASS_IN,
      0 /* no RD */);
  if (status != LDNS_STATUS_OK) {
    LOG(WARNING) << "can't make query for " << name << '/' << type << ": "
                 << ldns_get_errorstr_by_id(status);
    return {};
  }
  Packet q{pkt};

  ldns_pkt_set_id(q.get(), id);

  uint8_t* wire    = nullptr;
  size_t   wire_sz = 0;
  auto const wire_status = ldns_pkt2wire(&wire, q.get(), &wire_sz);
  if (wire_status != LDNS_STATUS_OK) {
    LOG(WARNING) << "can't encode query for " << name << '/' << type << ": "
                 << ldns_get_errorstr_by_id(wire_status);
    return {};
  }

  std::vector<octet> ret(wire, wire + wire_sz);
  std::free(wire);

  return ret;
}

bool parse_response(std::span<octet const> reply,
                    uint16_t               id,
                    Domain const&          name,
                    DNS::RR_type           type,
                    DNS::Response&         rsp)
{
  ldns_pkt* pkt    = nullptr;
  auto const status = ldns_wire2pkt(&pkt, reply.data(), reply.size());
  if (status != LDNS_STATUS_OK) {
    LOG(WARNING) << "bad reply for " << name << '/' << type << ": "
                 << ldns_get_errorstr_by_id(status);
    return false;
  }
  Packet a{pkt};

  if (ldns_pkt_id(a.get()) != id) {
    LOG(WARNING) << "packet out of order; ids don't match, got "
                 << ldns_pkt_id(a.get()) << " expecting " << id;
    return false;
  }

  if (!ldns_pkt_qr(a.get())) {
    LOG(WARNING) << "reply for " << name << '/' << type << " is a query";
    return false;
  }

  auto const question = ldns_pkt_question(a.get());
  if (!question || ldns_rr_list_rr_count(question) != 1) {
    LOG(WARNING) << "question not copied into answer for " << name << '/'
                 << type;
    return false;
  }

  { // make sure the question matches
    auto const q_rr  = ldns_rr_list_rr(question, 0);
    auto const qname = to_domain(ldns_rr_owner(q_rr));
    if (!qname || (*qname != name)) {
      LOG(WARNING) << "names don't match, "
                   << rr_name_str(ldns_rr_owner(q_rr)) << " != " << name;
      return false;
    }
    auto const qtype = static_cast<DNS::RR_type>(ldns_rr_get_type(q_rr));
    if (qtype != type) {
      LOG(WARNING) << "qtypes don't match, " << qtype << " != " << type;
      return false;
    }
  }

  if (ldns_pkt_tc(a.get())) {
    // No TCP here, make do with what fit.
    LOG(WARNING) << "DNS answer truncated for " << name << '/' << type;
  }

  rsp = DNS::Response{};
  rsp.rcode(ldns_pkt_get_rcode(a.get()));
  rsp.authoritative(ldns_pkt_aa(a.get()));

  copy_section(ldns_pkt_answer(a.get()), rsp.answer());
  copy_section(ldns_pkt_authority(a.get()), rsp.authority());
  copy_section(ldns_pkt_additional(a.get()), rsp.additional());

  return true;
}

void copy_section(ldns_rr_list const* rrs, DNS::Section& sec)
{
  if (!rrs)
    return;

  for (size_t i = 0; i < ldns_rr_list_rr_count(rrs); ++i) {
    auto const rr = ldns_rr_list_rr(rrs, i);
    if (!rr)
      continue;

    auto rec = to_rr(rr);
    if (!rec)
      continue;

    auto owner = to_domain(ldns_rr_owner(rr));
    if (!owner)
      continue;

    DNS::add_rr(sec, *owner, std::move(*rec));
  }
}

} // namespace DNS_ldns
