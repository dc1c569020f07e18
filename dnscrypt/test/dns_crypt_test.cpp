#include <algorithm>
#include <chrono>
#include <gtest/gtest.h>
#include <sodium.h>
#include <dg_logger.h>
#include <dg_net_utils.h>
#include <dns_crypt_client.h>
#include <dns_crypt_ldns.h>
#include "dns_crypt_cipher.h"
#include "dns_crypt_padding.h"
#include "test_dnscrypt_resolver.h"

using namespace std::chrono_literals;

namespace dg::dnscrypt::test {

class dnscrypt_test : public ::testing::Test {
protected:
    void SetUp() override {
        set_default_log_level(TRACE);
    }
};

struct cipher_test_data {
    crypto_construction construction;
    uint8_vector valid_ciphertext;
    key_array valid_shared_key;
};

static const cipher_test_data CIPHER_TEST_DATA[]{
        {crypto_construction::X_SALSA_20_POLY_1305,
                {139, 242, 162, 127, 140, 91, 194, 244, 122, 119, 21, 54, 123, 181, 235, 143, 173, 238, 20, 225, 93, 40,
                        236, 118, 44, 122},
                {88, 33, 20, 231, 222, 79, 169, 44, 137, 176, 138, 40, 176, 0, 214, 187, 82, 98, 99, 86, 30, 16, 48, 15,
                        42, 208, 235, 6, 131, 9, 118, 95}},
        {crypto_construction::X_CHACHA_20_POLY_1305,
                {239, 152, 51, 4, 230, 57, 196, 97, 228, 162, 121, 34, 100, 81, 169, 123, 25, 0, 158, 102, 177, 198, 60,
                        174, 14, 125},
                {100, 100, 146, 92, 58, 10, 170, 0, 17, 33, 109, 34, 144, 43, 156, 88, 186, 251, 1, 50, 56, 177, 31, 86,
                        28, 240, 96, 67, 1, 152, 252, 86}},
};

struct cipher_test : dnscrypt_test, ::testing::WithParamInterface<cipher_test_data> {};

TEST_P(cipher_test, seal_open_and_shared_key) {
    const auto &[construction, valid_ciphertext, valid_shared_key] = GetParam();

    key_array key;
    std::generate(key.begin(), key.end(), [n = 0]() mutable { return n++; });
    nonce_array nonce;
    std::generate(nonce.begin(), nonce.end(), [n = NONCE_SIZE]() mutable { return --n; });
    uint8_array<10> src;
    src.fill(42);

    auto [ciphertext, seal_err] = cipher_seal(construction, uint8_view{src.data(), src.size()}, nonce, key);
    ASSERT_FALSE(seal_err) << *seal_err;
    ASSERT_EQ(ciphertext, valid_ciphertext);

    auto [decrypted, open_err] = cipher_open(construction, uint8_view{ciphertext.data(), ciphertext.size()},
            nonce, key);
    ASSERT_FALSE(open_err) << *open_err;
    ASSERT_TRUE(std::equal(src.begin(), src.end(), decrypted.begin(), decrypted.end()));

    ++ciphertext.front();
    auto [bad, bad_err] = cipher_open(construction, uint8_view{ciphertext.data(), ciphertext.size()}, nonce, key);
    ASSERT_TRUE(bad_err) << "Tag validation must fail";

    auto [shared_key, key_err] = cipher_shared_key(construction, key, key);
    ASSERT_FALSE(key_err) << *key_err;
    ASSERT_EQ(shared_key, valid_shared_key);
}

INSTANTIATE_TEST_SUITE_P(constructions, cipher_test, ::testing::ValuesIn(CIPHER_TEST_DATA));

TEST_F(dnscrypt_test, unknown_construction_is_rejected) {
    auto [cipher_ptr, err] = create_cipher(crypto_construction::UNDEFINED);
    ASSERT_EQ(cipher_ptr, nullptr);
    ASSERT_TRUE(err);
}

TEST_F(dnscrypt_test, padding) {
    uint8_vector packet{1, 2, 3};
    ASSERT_TRUE(pad(packet, 64));
    ASSERT_EQ(packet.size(), 64u);
    ASSERT_EQ(packet[3], 0x80);
    ASSERT_TRUE(unpad(packet));
    ASSERT_EQ(packet, (uint8_vector{1, 2, 3}));

    uint8_vector too_long(64, 1);
    ASSERT_FALSE(pad(too_long, 64));

    uint8_vector garbage(64, 0);
    ASSERT_FALSE(unpad(garbage));
}

TEST_F(dnscrypt_test, invalid_stamp) {
    client c;
    auto [info, rtt, err] = c.dial("sdns://AQIAAAAAAAAAFDE", 1s);
    ASSERT_TRUE(err) << "Dial must not have been possible";
}

TEST_F(dnscrypt_test, non_dnscrypt_stamp) {
    client c;
    auto [info, rtt, err] = c.dial("sdns://AwAAAAAAAAAAAAAHMS4xLjEuMQ", 1s);
    ASSERT_TRUE(err);
}

TEST_F(dnscrypt_test, dial_times_out) {
    test_resolver resolver;
    server_stamp stamp = resolver.stamp();
    // Nothing answers on the discard port
    stamp.server_addr_str = "127.0.0.1:9";
    client c;
    auto [info, rtt, err] = c.dial(stamp, 200ms);
    ASSERT_TRUE(err);
}

struct exchange_test : dnscrypt_test, ::testing::WithParamInterface<crypto_construction> {};

TEST_P(exchange_test, dial_and_exchange) {
    test_resolver::cert_params params;
    params.construction = GetParam();
    test_resolver resolver({params});

    client c;
    auto [info, dial_rtt, dial_err] = c.dial(resolver.stamp(), 1s);
    ASSERT_FALSE(dial_err) << *dial_err;
    ASSERT_EQ(info.get_provider_name(), test_resolver::PROVIDER_NAME);
    ASSERT_EQ(info.get_server_cert().encryption_algorithm, GetParam());

    ldns_pkt_ptr req = create_request_ldns_pkt(LDNS_RR_TYPE_A, LDNS_RR_CLASS_IN, LDNS_RD, "example.org.",
            MAX_DNS_UDP_SAFE_PACKET_SIZE);
    ASSERT_NE(req, nullptr);
    ldns_pkt_set_random_id(req.get());

    auto [reply, rtt, err] = c.exchange(*req, info, 1s);
    ASSERT_FALSE(err) << *err;
    ASSERT_EQ(ldns_pkt_id(reply.get()), ldns_pkt_id(req.get()));
    ASSERT_EQ(ldns_pkt_ancount(reply.get()), 1);
    const ldns_rr *rr = ldns_rr_list_rr(ldns_pkt_answer(reply.get()), 0);
    const ldns_rdf *rdf = ldns_rr_rdf(rr, 0);
    ASSERT_EQ(utils::addr_to_str({ldns_rdf_data(rdf), ldns_rdf_size(rdf)}), test_resolver::ANSWER_ADDRESS);
}

INSTANTIATE_TEST_SUITE_P(constructions, exchange_test,
        ::testing::Values(crypto_construction::X_SALSA_20_POLY_1305, crypto_construction::X_CHACHA_20_POLY_1305));

TEST_F(dnscrypt_test, exchange_timeout_is_reported) {
    test_resolver resolver;
    client c;
    auto [info, dial_rtt, dial_err] = c.dial(resolver.stamp(), 1s);
    ASSERT_FALSE(dial_err) << *dial_err;

    resolver.ignore_queries(true);
    ldns_pkt_ptr req = create_request_ldns_pkt(LDNS_RR_TYPE_A, LDNS_RR_CLASS_IN, LDNS_RD, "example.org.",
            std::nullopt);
    auto [reply, rtt, err] = c.exchange(*req, info, 200ms);
    ASSERT_TRUE(err);
    ASSERT_EQ(*err, utils::TIMEOUT_STR);
}

TEST_F(dnscrypt_test, newest_certificate_is_preferred) {
    test_resolver::cert_params old_cert;
    old_cert.serial = 1;
    old_cert.construction = crypto_construction::X_CHACHA_20_POLY_1305;
    test_resolver::cert_params new_cert;
    new_cert.serial = 2;
    new_cert.construction = crypto_construction::X_SALSA_20_POLY_1305;
    test_resolver::cert_params upgraded_cert = new_cert;
    upgraded_cert.construction = crypto_construction::X_CHACHA_20_POLY_1305;
    test_resolver resolver({old_cert, new_cert, upgraded_cert});

    client c;
    auto [info, rtt, err] = c.dial(resolver.stamp(), 1s);
    ASSERT_FALSE(err) << *err;
    ASSERT_EQ(info.get_server_cert().serial, 2u);
    ASSERT_EQ(info.get_server_cert().encryption_algorithm, crypto_construction::X_CHACHA_20_POLY_1305);
}

TEST_F(dnscrypt_test, expired_certificate_is_rejected) {
    test_resolver::cert_params params;
    params.not_before = -7200;
    params.not_after = -3600;
    test_resolver resolver({params});

    client c;
    auto [info, rtt, err] = c.dial(resolver.stamp(), 1s);
    ASSERT_TRUE(err);
}

} // namespace dg::dnscrypt::test
