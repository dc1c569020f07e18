#include <gtest/gtest.h>
#include <ldns/ldns.h>
#include <dg_clock.h>
#include <dg_dns_utils.h>
#include <dg_logger.h>
#include "../src/response_cache.h"

using namespace dg;
using namespace std::chrono_literals;

static struct init {
    init() {
        dg::set_default_log_level(dg::TRACE);
    }
} init_;

static ldns_pkt_ptr make_request(const char *name, uint16_t id = 1, ldns_rr_type type = LDNS_RR_TYPE_A) {
    ldns_pkt_ptr req(ldns_pkt_query_new(ldns_dname_new_frm_str(name), type, LDNS_RR_CLASS_IN, LDNS_RD));
    ldns_pkt_set_id(req.get(), id);
    return req;
}

static ldns_pkt_ptr make_response(const ldns_pkt *request, uint32_t ttl, ldns_pkt_rcode rcode = LDNS_RCODE_NOERROR) {
    ldns_pkt_ptr resp(ldns_pkt_clone(request));
    ldns_pkt_set_qr(resp.get(), true);
    ldns_pkt_set_ra(resp.get(), true);
    ldns_pkt_set_rcode(resp.get(), rcode);
    const ldns_rr *question = ldns_rr_list_rr(ldns_pkt_question(request), 0);
    ldns_rr *rr = ldns_rr_new();
    ldns_rr_set_owner(rr, ldns_rdf_clone(ldns_rr_owner(question)));
    ldns_rr_set_type(rr, LDNS_RR_TYPE_A);
    ldns_rr_set_class(rr, LDNS_RR_CLASS_IN);
    ldns_rr_set_ttl(rr, ttl);
    ldns_rr_push_rdf(rr, ldns_rdf_new_frm_str(LDNS_RDF_TYPE_A, "1.2.3.4"));
    ldns_pkt_push_rr(resp.get(), LDNS_SECTION_ANSWER, rr);
    return resp;
}

static uint32_t first_ttl(const ldns_pkt *pkt) {
    return ldns_rr_ttl(ldns_rr_list_rr(ldns_pkt_answer(pkt), 0));
}

class response_cache_test : public ::testing::Test {
protected:
    void TearDown() override {
        steady_clock::reset_time_shift();
    }
};

TEST_F(response_cache_test, serves_with_request_id) {
    response_cache cache(100);
    ldns_pkt_ptr req = make_request("example.org.", 10);
    cache.set(make_response(req.get(), 60).get());
    ASSERT_EQ(1u, cache.size());

    ldns_pkt_ptr other = make_request("example.org.", 20);
    response_cache::result cached = cache.get(other.get());
    ASSERT_NE(nullptr, cached.response);
    ASSERT_EQ(20, ldns_pkt_id(cached.response.get()));
    ASSERT_EQ(1u, ldns_pkt_ancount(cached.response.get()));
}

TEST_F(response_cache_test, key_is_case_insensitive) {
    response_cache cache(100);
    ldns_pkt_ptr req = make_request("ExAmPlE.oRg.");
    cache.set(make_response(req.get(), 60).get());
    ASSERT_NE(nullptr, cache.get(make_request("example.ORG.").get()).response);
    ASSERT_EQ(response_cache::get_cache_key(req.get()), response_cache::get_cache_key(make_request("EXAMPLE.org.").get()));
    ASSERT_NE(response_cache::get_cache_key(req.get()),
            response_cache::get_cache_key(make_request("example.org.", 1, LDNS_RR_TYPE_AAAA).get()));
}

TEST_F(response_cache_test, ttl_decreases_and_entry_expires) {
    response_cache cache(100);
    ldns_pkt_ptr req = make_request("example.org.");
    cache.set(make_response(req.get(), 60).get());

    ldns_pkt_ptr first = cache.get(req.get()).response;
    ASSERT_NE(nullptr, first);
    ASSERT_EQ(60u, first_ttl(first.get()));

    steady_clock::add_time_shift(20s);
    ldns_pkt_ptr second = cache.get(req.get()).response;
    ASSERT_NE(nullptr, second);
    ASSERT_EQ(40u, first_ttl(second.get()));

    steady_clock::add_time_shift(41s);
    ASSERT_EQ(nullptr, cache.get(req.get()).response);
    ASSERT_EQ(0u, cache.size());
}

TEST_F(response_cache_test, ttl_bounds) {
    response_cache cache(100, 30, 100);
    ldns_pkt_ptr low = make_request("low.example.org.");
    ldns_pkt_ptr high = make_request("high.example.org.");
    cache.set(make_response(low.get(), 5).get());
    cache.set(make_response(high.get(), 1000).get());
    ASSERT_EQ(30u, first_ttl(cache.get(low.get()).response.get()));
    ASSERT_EQ(100u, first_ttl(cache.get(high.get()).response.get()));
}

TEST_F(response_cache_test, not_cacheable) {
    response_cache cache(100);
    ldns_pkt_ptr req = make_request("example.org.");

    cache.set(make_response(req.get(), 60, LDNS_RCODE_SERVFAIL).get());
    cache.set(make_response(req.get(), 0).get());
    ldns_pkt_ptr truncated = make_response(req.get(), 60);
    ldns_pkt_set_tc(truncated.get(), true);
    cache.set(truncated.get());
    ASSERT_EQ(0u, cache.size());

    cache.set(make_response(req.get(), 60, LDNS_RCODE_NXDOMAIN).get());
    ASSERT_EQ(1u, cache.size());
}

TEST_F(response_cache_test, question_count_other_than_one_is_not_cached) {
    response_cache cache(100);
    ldns_pkt_ptr req = make_request("example.org.");

    ldns_pkt_ptr two = make_response(req.get(), 60);
    ldns_rr *extra = ldns_rr_clone(ldns_rr_list_rr(ldns_pkt_question(two.get()), 0));
    ldns_rr_set_type(extra, LDNS_RR_TYPE_AAAA);
    ldns_pkt_push_rr(two.get(), LDNS_SECTION_QUESTION, extra);
    ASSERT_EQ(2, ldns_pkt_qdcount(two.get()));
    cache.set(two.get());
    ASSERT_EQ(0u, cache.size());
    ASSERT_EQ(nullptr, cache.get(req.get()).response);

    ldns_pkt_ptr none = make_response(req.get(), 60);
    ldns_rr_list_deep_free(ldns_pkt_question(none.get()));
    ldns_pkt_set_question(none.get(), ldns_rr_list_new());
    ldns_pkt_set_qdcount(none.get(), 0);
    cache.set(none.get());
    ASSERT_EQ(0u, cache.size());
    ASSERT_EQ(nullptr, cache.get(req.get()).response);
}

TEST_F(response_cache_test, disabled) {
    response_cache cache(0);
    ASSERT_FALSE(cache.enabled());
    ldns_pkt_ptr req = make_request("example.org.");
    cache.set(make_response(req.get(), 60).get());
    ASSERT_EQ(nullptr, cache.get(req.get()).response);
}

TEST_F(response_cache_test, capacity_evicts_least_recent) {
    response_cache cache(2);
    ldns_pkt_ptr a = make_request("a.example.org.");
    ldns_pkt_ptr b = make_request("b.example.org.");
    ldns_pkt_ptr c = make_request("c.example.org.");
    cache.set(make_response(a.get(), 60).get());
    cache.set(make_response(b.get(), 60).get());
    ASSERT_NE(nullptr, cache.get(a.get()).response);
    cache.set(make_response(c.get(), 60).get());
    ASSERT_EQ(2u, cache.size());
    ASSERT_NE(nullptr, cache.get(a.get()).response);
    ASSERT_EQ(nullptr, cache.get(b.get()).response);
}

TEST_F(response_cache_test, lowest_ttl) {
    ldns_pkt_ptr req = make_request("example.org.");
    ldns_pkt_ptr resp = make_response(req.get(), 300);
    ASSERT_EQ(300u, response_cache::compute_lowest_ttl(resp.get()));
    ASSERT_EQ(0u, response_cache::compute_lowest_ttl(req.get()));
}
