#include <gtest/gtest.h>
#include <dg_socket_address.h>
#include "../src/access_control.h"
#include "../src/lease_table.h"

using namespace dg;

TEST(access_control, disallowed_clients) {
    auto [access, err] = access_control::create({}, {"192.168.0.0/24", "::1"}, {});
    ASSERT_NE(nullptr, access) << err.value_or("");

    auto [blocked, rule] = access->is_blocked_ip(socket_address("192.168.0.17", 53));
    ASSERT_TRUE(blocked);
    ASSERT_EQ("192.168.0.0/24", rule);

    std::tie(blocked, rule) = access->is_blocked_ip(socket_address("::1", 0));
    ASSERT_TRUE(blocked);
    ASSERT_EQ("::1", rule);

    std::tie(blocked, rule) = access->is_blocked_ip(socket_address("192.168.1.1", 0));
    ASSERT_FALSE(blocked);
}

TEST(access_control, allowlist_takes_precedence) {
    auto [access, err] = access_control::create({"10.0.0.0/8"}, {"10.1.0.0/16"}, {});
    ASSERT_NE(nullptr, access) << err.value_or("");

    ASSERT_FALSE(access->is_blocked_ip(socket_address("10.1.2.3", 0)).first);

    auto [blocked, rule] = access->is_blocked_ip(socket_address("172.16.0.1", 0));
    ASSERT_TRUE(blocked);
    ASSERT_TRUE(rule.empty());
}

TEST(access_control, blocked_hosts) {
    auto [access, err] = access_control::create({}, {}, {"||blocked.example^", "@@||allowed.blocked.example^"});
    ASSERT_NE(nullptr, access) << err.value_or("");

    ASSERT_TRUE(access->is_blocked_domain("blocked.example"));
    ASSERT_TRUE(access->is_blocked_domain("sub.blocked.example"));
    ASSERT_FALSE(access->is_blocked_domain("allowed.blocked.example"));
    ASSERT_FALSE(access->is_blocked_domain("example.org"));
}

TEST(access_control, invalid_client_entry) {
    auto [access, err] = access_control::create({"not-an-address"}, {}, {});
    ASSERT_EQ(nullptr, access);
    ASSERT_TRUE(err.has_value());
}

TEST(lease_table, lookups) {
    lease_table leases;
    leases.update({
            {"Printer", "192.168.1.5"},
            {"nas", "fd00::5"},
            {"bad name!", "192.168.1.6"},
            {"", "192.168.1.7"},
            {"phone", "not-an-ip"},
    });

    ASSERT_EQ("192.168.1.5", leases.find_ip("printer").value_or(""));
    ASSERT_EQ("192.168.1.5", leases.find_ip("PRINTER").value_or(""));
    ASSERT_FALSE(leases.find_ip("nas").has_value());
    ASSERT_FALSE(leases.find_ip("phone").has_value());

    ASSERT_EQ("printer", leases.find_host(socket_address("192.168.1.5", 0)).value_or(""));
    ASSERT_EQ("nas", leases.find_host(socket_address("fd00::5", 0)).value_or(""));
    ASSERT_FALSE(leases.find_host(socket_address("192.168.1.6", 0)).has_value());

    leases.update({});
    ASSERT_FALSE(leases.find_ip("printer").has_value());
}

TEST(lease_table, unreverse) {
    ASSERT_EQ(socket_address("192.168.1.5", 0), lease_table::unreverse_addr("5.1.168.192.in-addr.arpa"));
    ASSERT_EQ(socket_address("192.168.1.5", 0), lease_table::unreverse_addr("5.1.168.192.IN-ADDR.ARPA."));
    ASSERT_EQ(socket_address("2001:db8::567:89ab", 0),
            lease_table::unreverse_addr("b.a.9.8.7.6.5.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.0.8.b.d.0.1.0.0.2.ip6.arpa"));

    ASSERT_FALSE(lease_table::unreverse_addr("1.168.192.in-addr.arpa").valid());
    ASSERT_FALSE(lease_table::unreverse_addr("300.1.168.192.in-addr.arpa").valid());
    ASSERT_FALSE(lease_table::unreverse_addr("example.org").valid());
}
