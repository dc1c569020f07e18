#include <fmt/format.h>
#include <gtest/gtest.h>
#include <ldns/ldns.h>
#include <dg_defs.h>
#include <dg_dns_utils.h>
#include "../src/dns_truncate.h"

using namespace dg;

static ldns_rr *make_rr(const std::string &str) {
    ldns_rr *rr = nullptr;
    ldns_status status = ldns_rr_new_frm_str(&rr, str.c_str(), 0, nullptr, nullptr);
    EXPECT_EQ(LDNS_STATUS_OK, status) << str;
    return rr;
}

static ldns_pkt_ptr make_response() {
    ldns_pkt_ptr pkt(ldns_pkt_query_new(ldns_dname_new_frm_str("example.org."), LDNS_RR_TYPE_A, LDNS_RR_CLASS_IN,
            LDNS_RD));
    ldns_pkt_set_qr(pkt.get(), true);
    ldns_pkt_set_ra(pkt.get(), true);
    ldns_pkt_set_id(pkt.get(), 4242);
    return pkt;
}

// About 2 kilobytes on the wire: answers in RRsets of two, name servers and their addresses
static ldns_pkt_ptr make_big_packet() {
    ldns_pkt_ptr pkt = make_response();
    for (int i = 0; i < 80; ++i) {
        ldns_pkt_push_rr(pkt.get(), LDNS_SECTION_ANSWER,
                make_rr(fmt::format("h{}.example.org. 300 IN A 10.0.{}.{}", i / 2, i / 250, i % 250 + 1)));
    }
    for (int i = 0; i < 8; ++i) {
        ldns_pkt_push_rr(pkt.get(), LDNS_SECTION_AUTHORITY,
                make_rr(fmt::format("example.org. 3600 IN NS ns{}.nameservers-of-example.net.", i)));
    }
    for (int i = 0; i < 8; ++i) {
        ldns_pkt_push_rr(pkt.get(), LDNS_SECTION_ADDITIONAL,
                make_rr(fmt::format("ns{}.nameservers-of-example.net. 3600 IN AAAA 2001:db8::{}", i, i + 1)));
    }
    return pkt;
}

static size_t wire_size(const ldns_pkt *pkt) {
    ldns_buffer_ptr buf{ldns_buffer_new(LDNS_MAX_PACKETLEN)};
    ldns_status status = ldns_pkt2buffer_wire(buf.get(), pkt);
    EXPECT_EQ(LDNS_STATUS_OK, status) << ldns_get_errorstr_by_id(status);
    return ldns_buffer_position(buf.get());
}

static size_t rrset_size(const ldns_rr_list *rrs, const ldns_rr *rr) {
    size_t n = 0;
    for (size_t i = 0; i < ldns_rr_list_rr_count(rrs); ++i) {
        const ldns_rr *other = ldns_rr_list_rr(rrs, i);
        n += ldns_rr_get_type(other) == ldns_rr_get_type(rr)
                && 0 == ldns_dname_compare(ldns_rr_owner(other), ldns_rr_owner(rr));
    }
    return n;
}

// Every RRset left in `truncated` has all the records it has in `full`
static void expect_whole_rrsets(const ldns_pkt *full, const ldns_pkt *truncated) {
    for (ldns_pkt_section section : {LDNS_SECTION_ANSWER, LDNS_SECTION_AUTHORITY, LDNS_SECTION_ADDITIONAL}) {
        const ldns_rr_list *full_rrs = ldns_pkt_get_section_clone(full, section);
        const ldns_rr_list *rrs = ldns_pkt_get_section_clone(truncated, section);
        for (size_t i = 0; i < ldns_rr_list_rr_count(rrs); ++i) {
            const ldns_rr *rr = ldns_rr_list_rr(rrs, i);
            EXPECT_EQ(rrset_size(full_rrs, rr), rrset_size(rrs, rr)) << ldns_rr2str(rr);
        }
        ldns_rr_list_deep_free((ldns_rr_list *) full_rrs);
        ldns_rr_list_deep_free((ldns_rr_list *) rrs);
    }
}

TEST(dns_truncate, min_size_is_512) {
    ldns_pkt_ptr pkt = make_big_packet();
    ASSERT_GT(wire_size(pkt.get()), 1500u);

    for (uint16_t max_size = 0; max_size < 256; ++max_size) {
        ldns_pkt_ptr pkt_tc{ldns_pkt_clone(pkt.get())};
        ASSERT_TRUE(ldns_pkt_truncate(pkt_tc.get(), max_size));
        size_t size = wire_size(pkt_tc.get());
        ASSERT_GT(size, max_size);
        ASSERT_LE(size, DNS_MIN_UDP_PAYLOAD);
        ASSERT_TRUE(ldns_pkt_tc(pkt_tc.get()));
    }
}

TEST(dns_truncate, fits_the_limit) {
    ldns_pkt_ptr pkt = make_big_packet();
    size_t full_size = wire_size(pkt.get());
    ASSERT_FALSE(ldns_pkt_tc(pkt.get()));

    size_t prev_size = 0;
    for (size_t max_size = DNS_MIN_UDP_PAYLOAD; max_size < full_size + 16; max_size += 7) {
        ldns_pkt_ptr pkt_tc{ldns_pkt_clone(pkt.get())};

        // Might not truncate, but result could still be smaller due to compression
        bool truncated = ldns_pkt_truncate(pkt_tc.get(), max_size);

        ldns_buffer_ptr buf{ldns_buffer_new(LDNS_MAX_PACKETLEN)};
        ldns_status status = ldns_pkt2buffer_wire(buf.get(), pkt_tc.get());
        ASSERT_EQ(LDNS_STATUS_OK, status) << ldns_get_errorstr_by_id(status);

        ASSERT_LE(ldns_buffer_position(buf.get()), max_size);
        ASSERT_GE(ldns_buffer_position(buf.get()), prev_size);
        prev_size = ldns_buffer_position(buf.get());

        ldns_pkt *pkt_dec;
        status = ldns_wire2pkt(&pkt_dec, ldns_buffer_begin(buf.get()), ldns_buffer_position(buf.get()));
        ASSERT_EQ(LDNS_STATUS_OK, status) << ldns_get_errorstr_by_id(status);
        ldns_pkt_ptr guard{pkt_dec};

        ASSERT_EQ(ldns_pkt_tc(pkt_dec), truncated);
        ASSERT_EQ(ldns_pkt_ancount(pkt_dec), ldns_rr_list_rr_count(ldns_pkt_answer(pkt_dec)));
        expect_whole_rrsets(pkt.get(), pkt_dec);
    }
}

TEST(dns_truncate, rrset_crossing_the_limit_is_dropped) {
    ldns_pkt_ptr pkt = make_response();
    ldns_pkt_push_rr(pkt.get(), LDNS_SECTION_ANSWER, make_rr("example.org. 300 IN CNAME cdn.example.net."));
    for (int i = 0; i < 40; ++i) {
        ldns_pkt_push_rr(pkt.get(), LDNS_SECTION_ANSWER,
                make_rr(fmt::format("cdn.example.net. 300 IN AAAA 2001:db8::{}", i + 1)));
    }
    // The AAAA set alone is larger than 512 bytes, so nothing of it may be sent
    ASSERT_GT(wire_size(pkt.get()), size_t(DNS_MIN_UDP_PAYLOAD));

    ASSERT_TRUE(ldns_pkt_truncate(pkt.get(), DNS_MIN_UDP_PAYLOAD));
    ASSERT_TRUE(ldns_pkt_tc(pkt.get()));
    ASSERT_EQ(1u, ldns_pkt_ancount(pkt.get()));
    ASSERT_EQ(LDNS_RR_TYPE_CNAME, ldns_rr_get_type(ldns_rr_list_rr(ldns_pkt_answer(pkt.get()), 0)));
    ASSERT_LE(wire_size(pkt.get()), size_t(DNS_MIN_UDP_PAYLOAD));
}

TEST(dns_truncate, rrset_is_kept_whole_before_the_cut) {
    ldns_pkt_ptr pkt = make_response();
    for (int i = 0; i < 4; ++i) {
        ldns_pkt_push_rr(pkt.get(), LDNS_SECTION_ANSWER, make_rr(fmt::format("example.org. 300 IN A 10.0.0.{}", i + 1)));
    }
    for (int i = 0; i < 40; ++i) {
        ldns_pkt_push_rr(pkt.get(), LDNS_SECTION_AUTHORITY,
                make_rr(fmt::format("example.org. 3600 IN NS ns{}.nameservers-of-example.net.", i)));
    }
    ldns_pkt_ptr full{ldns_pkt_clone(pkt.get())};

    ASSERT_TRUE(ldns_pkt_truncate(pkt.get(), DNS_MIN_UDP_PAYLOAD));
    ASSERT_EQ(4u, ldns_pkt_ancount(pkt.get()));
    ASSERT_EQ(0u, ldns_pkt_nscount(pkt.get()));
    expect_whole_rrsets(full.get(), pkt.get());
}

TEST(dns_truncate, small_packet_is_untouched) {
    ldns_pkt_ptr pkt(ldns_pkt_query_new(ldns_dname_new_frm_str("example.org."), LDNS_RR_TYPE_A, LDNS_RR_CLASS_IN,
            LDNS_RD));
    ldns_pkt_push_rr(pkt.get(), LDNS_SECTION_ANSWER, make_rr("example.org. 300 IN A 1.2.3.4"));
    ASSERT_FALSE(ldns_pkt_truncate(pkt.get(), DNS_MIN_UDP_PAYLOAD));
    ASSERT_FALSE(ldns_pkt_tc(pkt.get()));
    ASSERT_EQ(1u, ldns_pkt_ancount(pkt.get()));
}
