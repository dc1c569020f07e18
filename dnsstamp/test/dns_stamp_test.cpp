#include <gtest/gtest.h>
#include <base64.h>
#include <dns_stamp.h>

struct dns_stamp_parse_case {
    const char *stamp;
    const char *server_addr; // nullptr if the stamp must be rejected
};

static const dns_stamp_parse_case DNSCRYPT_CASES[] = {
        {"sdns://"
         "AQIAAAAAAAAADzE3Ni4xMDMuMTMwLjEzMCDRK0fyUtzywrv4mRCG6vec5EldixbIoMQyLlLKPzkIcyIyLmRuc2NyeXB0LmRlZmF1bHQubnMxL"
         "mFkZ3VhcmQuY29t",
                "176.103.130.130"},
        {"sdns://"
         "AQIAAAAAAAAAFFsyYTAwOjVhNjA6OmFkMjowZmZdIIHQAtNqTKUMRzt0eWUP4S4CsyHLYThWKiCOQD39xV6UIjIuZG5zY3J5cHQuZGVmYXVsd"
         "C5uczEuYWRndWFyZC5jb20",
                "[2a00:5a60::ad2:0ff]"},
        {"sdns://"
         "AQIAAAAAAAAAFDE3Ni4xMDMuMTMwLjEzMDo1NDQzINErR_JS3PLCu_iZEIbq95zkSV2LFsigxDIuUso_"
         "OQhzIjIuZG5zY3J5cHQuZGVmYXVsdC5uczEuYWRndWFyZC5jb20",
                "176.103.130.130:5443"},
        // IPv6 must be in square brackets
        {"sdns://"
         "AQIAAAAAAAAAEjJhMDA6NWE2MDo6YWQyOjBmZiCB0ALTakylDEc7dHllD-EuArMhy2E4ViogjkA9_"
         "cVelCIyLmRuc2NyeXB0LmRlZmF1bHQubnMxLmFkZ3VhcmQuY29t",
                nullptr},
        // colon without port
        {"sdns://"
         "AQIAAAAAAAAAEDE3Ni4xMDMuMTMwLjEzMDog0StH8lLc8sK7-"
         "JkQhur3nORJXYsWyKDEMi5Syj85CHMiMi5kbnNjcnlwdC5kZWZhdWx0Lm5zMS5hZGd1YXJkLmNvbQ",
                nullptr},
};

TEST(dns_stamp, dnscrypt_server_address) {
    for (const auto &c : DNSCRYPT_CASES) {
        auto [stamp, err] = dg::server_stamp::from_string(c.stamp);
        if (c.server_addr == nullptr) {
            ASSERT_TRUE(err.has_value()) << c.stamp;
            continue;
        }
        ASSERT_FALSE(err.has_value()) << *err;
        ASSERT_EQ(stamp.proto, dg::stamp_proto_type::DNSCRYPT);
        ASSERT_EQ(stamp.server_addr_str, c.server_addr);
        ASSERT_EQ(stamp.server_pk.size(), 32u);
        ASSERT_EQ(stamp.provider_name, "2.dnscrypt.default.ns1.adguard.com");
        ASSERT_EQ(stamp.pretty_url(), "dnscrypt://2.dnscrypt.default.ns1.adguard.com");
    }
}

TEST(dns_stamp, doh_stamp) {
    auto [stamp, err] = dg::server_stamp::from_string("sdns://AgAAAAAAAAAAAAALZXhhbXBsZS5jb20KL2Rucy1xdWVyeQ");
    ASSERT_FALSE(err.has_value()) << *err;
    ASSERT_EQ(stamp.proto, dg::stamp_proto_type::DOH);
    ASSERT_EQ(stamp.provider_name, "example.com");
    ASSERT_EQ(stamp.path, "/dns-query");
    ASSERT_TRUE(stamp.hashes.empty());
    ASSERT_EQ(stamp.pretty_url(), "https://example.com/dns-query");
}

TEST(dns_stamp, doh_stamp_with_hash) {
    auto [stamp, err] = dg::server_stamp::from_string(
            "sdns://AgUAAAAAAAAAACAe9iTP_15r07rd8_3b_epWVGfjdymdx-5mdRZvMAzBuQ5kbnMuZ29vZ2xlLmNvbQ0vZXhwZXJpbWVudGFs");
    ASSERT_FALSE(err.has_value()) << *err;
    ASSERT_EQ(stamp.hashes.size(), 1u);
    ASSERT_EQ(stamp.provider_name, "dns.google.com");
    ASSERT_EQ(stamp.path, "/experimental");
}

TEST(dns_stamp, dot_and_plain_stamps) {
    auto [dot, dot_err] = dg::server_stamp::from_string("sdns://AwAAAAAAAAAAAAAPZG5zLmFkZ3VhcmQuY29t");
    ASSERT_FALSE(dot_err.has_value()) << *dot_err;
    ASSERT_EQ(dot.proto, dg::stamp_proto_type::TLS);
    ASSERT_EQ(dot.pretty_url(), "tls://dns.adguard.com");

    auto [plain, plain_err] = dg::server_stamp::from_string("sdns://AAcAAAAAAAAABzguOC44Ljg");
    ASSERT_FALSE(plain_err.has_value()) << *plain_err;
    ASSERT_EQ(plain.proto, dg::stamp_proto_type::PLAIN);
    ASSERT_EQ(plain.pretty_url(), "8.8.8.8");
}

TEST(dns_stamp, rejects_malformed) {
    ASSERT_TRUE(dg::server_stamp::from_string("tls://dns.adguard.com").second.has_value());
    ASSERT_TRUE(dg::server_stamp::from_string("sdns://").second.has_value());
    ASSERT_TRUE(dg::server_stamp::from_string("sdns://!!!").second.has_value());
    // DoQ is not supported
    ASSERT_TRUE(dg::server_stamp::from_string("sdns://BAAAAAAAAAAAAAAPZG5zLmFkZ3VhcmQuY29t").second.has_value());
}

TEST(base64, decodes_padded_and_unpadded) {
    ASSERT_EQ(dg::decode_base64("aGVsbG8=", false), (dg::uint8_vector{'h', 'e', 'l', 'l', 'o'}));
    ASSERT_EQ(dg::decode_base64("aGVsbG8", true), (dg::uint8_vector{'h', 'e', 'l', 'l', 'o'}));
    ASSERT_EQ(dg::decode_base64("-_8", true), (dg::uint8_vector{0xfb, 0xff}));
    ASSERT_FALSE(dg::decode_base64("-_8", false).has_value());
}
