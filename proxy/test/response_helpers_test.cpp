#include <gtest/gtest.h>
#include <ldns/ldns.h>
#include <dg_defs.h>
#include <dg_dns_utils.h>
#include <dnsproxy_settings.h>
#include "../src/response_helpers.h"

using namespace dg;

static ldns_pkt_ptr make_request(const char *name, ldns_rr_type type) {
    ldns_pkt_ptr req(ldns_pkt_query_new(ldns_dname_new_frm_str(name), type, LDNS_RR_CLASS_IN, LDNS_RD));
    ldns_pkt_set_id(req.get(), 777);
    return req;
}

static std::string rdf_str(const ldns_rdf *rdf) {
    allocated_ptr<char> str(ldns_rdf2str(rdf));
    return str ? str.get() : "";
}

static std::string answer_str(const ldns_pkt *pkt, size_t idx = 0) {
    const ldns_rr *rr = ldns_rr_list_rr(ldns_pkt_answer(pkt), idx);
    return (rr != nullptr) ? rdf_str(ldns_rr_rdf(rr, 0)) : "";
}

class response_helpers_test : public ::testing::Test {
protected:
    dnsproxy_settings m_settings = dnsproxy_settings::get_default();

    void SetUp() override {
        m_settings.blocked_response_ttl_secs = 10;
    }
};

TEST_F(response_helpers_test, reply_shell_echoes_request) {
    ldns_pkt_ptr req = make_request("example.org.", LDNS_RR_TYPE_A);
    ldns_pkt_ptr resp(response_helpers::create_servfail_response(req.get()));
    ASSERT_EQ(777, ldns_pkt_id(resp.get()));
    ASSERT_TRUE(ldns_pkt_qr(resp.get()));
    ASSERT_TRUE(ldns_pkt_ra(resp.get()));
    ASSERT_TRUE(ldns_pkt_rd(resp.get()));
    ASSERT_EQ(LDNS_RCODE_SERVFAIL, ldns_pkt_get_rcode(resp.get()));
    ASSERT_EQ(1u, ldns_pkt_qdcount(resp.get()));

    resp.reset(response_helpers::create_refused_response(req.get()));
    ASSERT_EQ(LDNS_RCODE_REFUSED, ldns_pkt_get_rcode(resp.get()));
    resp.reset(response_helpers::create_notimpl_response(req.get()));
    ASSERT_EQ(LDNS_RCODE_NOTIMPL, ldns_pkt_get_rcode(resp.get()));
}

TEST_F(response_helpers_test, nxdomain_has_soa) {
    ldns_pkt_ptr req = make_request("blocked.example.org.", LDNS_RR_TYPE_A);
    ldns_pkt_ptr resp(response_helpers::create_nxdomain_response(req.get(), m_settings));
    ASSERT_EQ(LDNS_RCODE_NXDOMAIN, ldns_pkt_get_rcode(resp.get()));
    ASSERT_EQ(0u, ldns_pkt_ancount(resp.get()));
    ASSERT_EQ(1u, ldns_pkt_nscount(resp.get()));

    const ldns_rr *soa = ldns_rr_list_rr(ldns_pkt_authority(resp.get()), 0);
    ASSERT_EQ(LDNS_RR_TYPE_SOA, ldns_rr_get_type(soa));
    ASSERT_EQ(10u, ldns_rr_ttl(soa));
    ASSERT_EQ("blocked.example.org.", rdf_str(ldns_rr_owner(soa)));
    ASSERT_EQ("hostmaster.blocked.example.org.", rdf_str(ldns_rr_rdf(soa, 1)));
    ASSERT_EQ(response_helpers::SOA_RETRY_DEFAULT, ldns_rdf2native_int32(ldns_rr_rdf(soa, 4)));
}

TEST_F(response_helpers_test, soa_ttl_defaults_to_hour) {
    m_settings.blocked_response_ttl_secs = 0;
    ldns_pkt_ptr req = make_request("example.org.", LDNS_RR_TYPE_AAAA);
    ldns_pkt_ptr resp(response_helpers::create_soa_response(req.get(), m_settings,
            response_helpers::SOA_RETRY_IPV6_BLOCK));
    ASSERT_EQ(LDNS_RCODE_NOERROR, ldns_pkt_get_rcode(resp.get()));
    const ldns_rr *soa = ldns_rr_list_rr(ldns_pkt_authority(resp.get()), 0);
    ASSERT_EQ(3600u, ldns_rr_ttl(soa));
    ASSERT_EQ(response_helpers::SOA_RETRY_IPV6_BLOCK, ldns_rdf2native_int32(ldns_rr_rdf(soa, 4)));
}

TEST_F(response_helpers_test, soa_of_root_zone) {
    ldns_pkt_ptr req = make_request(".", LDNS_RR_TYPE_A);
    ldns_pkt_ptr resp(response_helpers::create_nxdomain_response(req.get(), m_settings));
    const ldns_rr *soa = ldns_rr_list_rr(ldns_pkt_authority(resp.get()), 0);
    ASSERT_EQ("hostmaster.", rdf_str(ldns_rr_rdf(soa, 1)));
}

TEST_F(response_helpers_test, null_ip) {
    ldns_pkt_ptr req = make_request("example.org.", LDNS_RR_TYPE_A);
    ldns_pkt_ptr resp(response_helpers::create_null_ip_response(req.get(), m_settings));
    ASSERT_EQ("0.0.0.0", answer_str(resp.get()));
    ASSERT_EQ(10u, ldns_rr_ttl(ldns_rr_list_rr(ldns_pkt_answer(resp.get()), 0)));

    req = make_request("example.org.", LDNS_RR_TYPE_AAAA);
    resp.reset(response_helpers::create_null_ip_response(req.get(), m_settings));
    ASSERT_EQ("::", answer_str(resp.get()));

    req = make_request("example.org.", LDNS_RR_TYPE_TXT);
    resp.reset(response_helpers::create_null_ip_response(req.get(), m_settings));
    ASSERT_EQ(0u, ldns_pkt_ancount(resp.get()));
    ASSERT_EQ(LDNS_RCODE_NOERROR, ldns_pkt_get_rcode(resp.get()));
}

TEST_F(response_helpers_test, custom_ip) {
    m_settings.custom_blocking_ipv4 = "4.3.2.1";
    m_settings.custom_blocking_ipv6 = "::abcd";
    ldns_pkt_ptr req = make_request("example.org.", LDNS_RR_TYPE_A);
    ldns_pkt_ptr resp(response_helpers::create_custom_ip_response(req.get(), m_settings));
    ASSERT_EQ("4.3.2.1", answer_str(resp.get()));

    req = make_request("example.org.", LDNS_RR_TYPE_AAAA);
    resp.reset(response_helpers::create_custom_ip_response(req.get(), m_settings));
    ASSERT_EQ("::abcd", answer_str(resp.get()));
}

TEST_F(response_helpers_test, address_of_other_family_gives_empty_answer) {
    ldns_pkt_ptr req = make_request("example.org.", LDNS_RR_TYPE_AAAA);
    ldns_pkt_ptr resp(response_helpers::create_response_with_ip(req.get(), m_settings, "1.2.3.4"));
    ASSERT_EQ(0u, ldns_pkt_ancount(resp.get()));
    ASSERT_EQ(LDNS_RCODE_NOERROR, ldns_pkt_get_rcode(resp.get()));
}

TEST_F(response_helpers_test, rewrite_with_cname) {
    ldns_pkt_ptr req = make_request("alias.example.org.", LDNS_RR_TYPE_A);
    verdict::rewritten rewrite{"canonical.example.net", {"1.1.1.1", "::1", "2.2.2.2"}};
    ldns_pkt_ptr resp(response_helpers::create_rewrite_response(req.get(), m_settings, rewrite));
    ASSERT_EQ(3u, ldns_pkt_ancount(resp.get()));

    const ldns_rr *cname = ldns_rr_list_rr(ldns_pkt_answer(resp.get()), 0);
    ASSERT_EQ(LDNS_RR_TYPE_CNAME, ldns_rr_get_type(cname));
    ASSERT_EQ("alias.example.org.", rdf_str(ldns_rr_owner(cname)));
    ASSERT_EQ("canonical.example.net.", rdf_str(ldns_rr_rdf(cname, 0)));

    const ldns_rr *a = ldns_rr_list_rr(ldns_pkt_answer(resp.get()), 1);
    ASSERT_EQ("canonical.example.net.", rdf_str(ldns_rr_owner(a)));
    ASSERT_EQ("1.1.1.1", answer_str(resp.get(), 1));
    ASSERT_EQ("2.2.2.2", answer_str(resp.get(), 2));
}

TEST_F(response_helpers_test, redirect_renames_answers) {
    ldns_pkt_ptr req = make_request("www.search.example.", LDNS_RR_TYPE_A);
    ldns_pkt_ptr resolved = make_request("safe.search.example.", LDNS_RR_TYPE_A);
    ldns_rr *rr = nullptr;
    ASSERT_EQ(LDNS_STATUS_OK, ldns_rr_new_frm_str(&rr, "safe.search.example. 300 IN A 5.6.7.8", 0, nullptr, nullptr));
    ldns_pkt_push_rr(resolved.get(), LDNS_SECTION_ANSWER, rr);

    ldns_pkt_ptr resp(response_helpers::create_redirect_response(req.get(), resolved.get()));
    ASSERT_EQ(777, ldns_pkt_id(resp.get()));
    ASSERT_EQ(1u, ldns_pkt_ancount(resp.get()));
    const ldns_rr *answer = ldns_rr_list_rr(ldns_pkt_answer(resp.get()), 0);
    ASSERT_EQ("www.search.example.", rdf_str(ldns_rr_owner(answer)));
    ASSERT_EQ("5.6.7.8", answer_str(resp.get()));
}

TEST_F(response_helpers_test, ptr) {
    ldns_pkt_ptr req = make_request("5.1.168.192.in-addr.arpa.", LDNS_RR_TYPE_PTR);
    ldns_pkt_ptr resp(response_helpers::create_ptr_response(req.get(), m_settings, "printer"));
    ASSERT_EQ("printer.", answer_str(resp.get()));
}
