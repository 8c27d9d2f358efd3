#include "DNS-ldns.hpp"

#include "DNS-iostream.hpp"

#include <cstdlib>
#include <utility>
#include <vector>

#include <ldns/ldns.h>

#include <glog/logging.h>

using DNS::RR_type;
using DNS_ldns::octet;

namespace {
struct Record {
  ldns_pkt_section section;
  char const*      text;
};

std::vector<octet> wire(ldns_pkt* pkt)
{
  uint8_t* buf = nullptr;
  size_t   sz  = 0;
  CHECK_EQ(ldns_pkt2wire(&buf, pkt, &sz), LDNS_STATUS_OK);
  std::vector<octet> ret(buf, buf + sz);
  std::free(buf);
  return ret;
}

// What a nameserver would send back.
std::vector<octet> make_reply(char const*                qname,
                              ldns_rr_type               qtype,
                              uint16_t                   id,
                              std::vector<Record> const& records,
                              uint8_t                    rcode = 0,
                              bool                       qr    = true)
{
  ldns_pkt* pkt = nullptr;
  CHECK_EQ(ldns_pkt_query_new_frm_str(&pkt, qname, qtype, LDNS_RR_CLASS_IN, 0),
           LDNS_STATUS_OK);
  DNS_ldns::Packet p{pkt};

  ldns_pkt_set_id(pkt, id);
  ldns_pkt_set_qr(pkt, qr);
  ldns_pkt_set_aa(pkt, true);
  ldns_pkt_set_rcode(pkt, rcode);

  for (auto const& rec : records) {
    ldns_rr* rr = nullptr;
    CHECK_EQ(ldns_rr_new_frm_str(&rr, rec.text, 0, nullptr, nullptr),
             LDNS_STATUS_OK)
        << rec.text;
    CHECK(ldns_pkt_push_rr(pkt, rec.section, rr));
  }

  return wire(pkt);
}
} // namespace

int main(int argc, char* argv[])
{
  google::InitGoogleLogging(argv[0]);

  Domain const www{"www.example.com"};
  Domain const example{"example.com"};

  { // Queries go out without RD.
    auto const q = DNS_ldns::create_query(www, RR_type::MX, 0x1234);
    CHECK(!q.empty());

    ldns_pkt* pkt = nullptr;
    CHECK_EQ(ldns_wire2pkt(&pkt, q.data(), q.size()), LDNS_STATUS_OK);
    DNS_ldns::Packet p{pkt};

    CHECK_EQ(ldns_pkt_id(pkt), 0x1234);
    CHECK(!ldns_pkt_qr(pkt));
    CHECK(!ldns_pkt_rd(pkt));
    CHECK_EQ(ldns_rr_list_rr_count(ldns_pkt_question(pkt)), 1);

    auto const q_rr = ldns_rr_list_rr(ldns_pkt_question(pkt), 0);
    CHECK_EQ(DNS_ldns::rr_name_str(ldns_rr_owner(q_rr)), "www.example.com");
    CHECK_EQ(ldns_rr_get_type(q_rr), LDNS_RR_TYPE_MX);
  }

  { // An answer, with the alias that led to it.
    auto const reply = make_reply(
        "www.example.com.", LDNS_RR_TYPE_A, 7,
        {
            {LDNS_SECTION_ANSWER, "www.example.com. 300 IN CNAME example.com."},
            {LDNS_SECTION_ANSWER, "example.com. 300 IN A 93.184.216.34"},
            {LDNS_SECTION_ANSWER, "example.com. 300 IN A 93.184.216.35"},
            {LDNS_SECTION_ANSWER, "example.com. 300 IN TXT \"ignored\""},
        });

    DNS::Response rsp;
    CHECK(DNS_ldns::parse_response(reply, 7, www, RR_type::A, rsp));
    CHECK_EQ(rsp.rcode(), 0);
    CHECK(rsp.authoritative());

    // TXT isn't modelled, so two sets.
    auto const& ans = rsp.answer();
    CHECK_EQ(ans.size(), 2);
    CHECK_EQ(ans[0].owner, www);
    CHECK_EQ(ans[0].type, RR_type::CNAME);
    CHECK_EQ(ans[1].owner, example);
    CHECK_EQ(ans[1].type, RR_type::A);
    CHECK_EQ(ans[1].rrs.size(), 2);

    CHECK_EQ(*DNS::first_cname(ans), example);
    auto const addrs = DNS::get_strings(ans, RR_type::A);
    CHECK_EQ(addrs.size(), 2);
    CHECK_EQ(addrs[0], "93.184.216.34");
    CHECK_EQ(addrs[1], "93.184.216.35");
  }

  { // A referral with glue.
    auto const reply = make_reply(
        "www.example.com.", LDNS_RR_TYPE_AAAA, 99,
        {
            {LDNS_SECTION_AUTHORITY, "com. 172800 IN NS a.gtld-servers.net."},
            {LDNS_SECTION_AUTHORITY, "com. 172800 IN NS b.gtld-servers.net."},
            {LDNS_SECTION_ADDITIONAL, "a.gtld-servers.net. 172800 IN A 192.5.6.30"},
            {LDNS_SECTION_ADDITIONAL,
             "a.gtld-servers.net. 172800 IN AAAA 2001:503:a83e::2:30"},
            {LDNS_SECTION_ADDITIONAL, "b.gtld-servers.net. 172800 IN A 192.33.14.30"},
        });

    DNS::Response rsp;
    CHECK(DNS_ldns::parse_response(reply, 99, www, RR_type::AAAA, rsp));
    CHECK(rsp.answer().empty());

    CHECK_EQ(rsp.authority().size(), 1);
    CHECK_EQ(rsp.authority()[0].owner, Domain{"com"});
    auto const ns = DNS::get_records(rsp.authority(), RR_type::NS);
    CHECK_EQ(ns.size(), 2);
    CHECK_EQ(std::get<DNS::RR_NS>(ns[1]).nsdname(), Domain{"b.gtld-servers.net"});

    CHECK_EQ(rsp.additional().size(), 3);
    auto const glue = DNS::get_strings(rsp.additional(), RR_type::A);
    CHECK_EQ(glue.size(), 2);
    auto const glue6 = DNS::get_strings(rsp.additional(), RR_type::AAAA);
    CHECK_EQ(glue6.size(), 1);
    CHECK_EQ(glue6[0], "2001:503:a83e::2:30");
  }

  { // MX
    auto const reply = make_reply(
        "example.com.", LDNS_RR_TYPE_MX, 1,
        {{LDNS_SECTION_ANSWER, "example.com. 300 IN MX 10 mail.Example.COM."}});

    DNS::Response rsp;
    CHECK(DNS_ldns::parse_response(reply, 1, example, RR_type::MX, rsp));
    auto const mx = DNS::get_records(rsp.answer(), RR_type::MX);
    CHECK_EQ(mx.size(), 1);
    CHECK_EQ(std::get<DNS::RR_MX>(mx[0]).preference(), 10);
    CHECK_EQ(std::get<DNS::RR_MX>(mx[0]).exchange(), Domain{"mail.example.com"});
  }

  { // NXDOMAIN comes through as an rcode.
    auto const reply = make_reply("nope.example.com.", LDNS_RR_TYPE_A, 2, {},
                                  LDNS_RCODE_NXDOMAIN);
    DNS::Response rsp;
    CHECK(DNS_ldns::parse_response(reply, 2, Domain{"nope.example.com"},
                                   RR_type::A, rsp));
    CHECK_EQ(rsp.rcode(), 3);
    CHECK(rsp.empty());
  }

  { // Replies that don't answer our question.
    auto const reply = make_reply(
        "www.example.com.", LDNS_RR_TYPE_A, 5,
        {{LDNS_SECTION_ANSWER, "www.example.com. 300 IN A 192.0.2.1"}});

    DNS::Response rsp;
    CHECK(!DNS_ldns::parse_response(reply, 6, www, RR_type::A, rsp));
    CHECK(!DNS_ldns::parse_response(reply, 5, example, RR_type::A, rsp));
    CHECK(!DNS_ldns::parse_response(reply, 5, www, RR_type::AAAA, rsp));
    CHECK(rsp.empty());

    auto const query = make_reply("www.example.com.", LDNS_RR_TYPE_A, 5, {}, 0,
                                  false);
    CHECK(!DNS_ldns::parse_response(query, 5, www, RR_type::A, rsp));

    std::vector<octet> const junk{0x00, 0x05, 0x81};
    CHECK(!DNS_ldns::parse_response(junk, 5, www, RR_type::A, rsp));
  }
}
