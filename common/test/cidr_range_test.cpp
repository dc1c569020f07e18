#include <gtest/gtest.h>
#include <dg_cidr_range.h>
#include <dg_socket_address.h>

TEST(cidr_range, parses) {
    ASSERT_TRUE(dg::cidr_range("192.168.0.0/16").valid());
    ASSERT_TRUE(dg::cidr_range("10.0.0.1").valid());
    ASSERT_TRUE(dg::cidr_range("fd00::/8").valid());
    ASSERT_TRUE(dg::cidr_range("::1").valid());

    ASSERT_FALSE(dg::cidr_range("").valid());
    ASSERT_FALSE(dg::cidr_range("10.0.0.0/").valid());
    ASSERT_FALSE(dg::cidr_range("10.0.0.0/33").valid());
    ASSERT_FALSE(dg::cidr_range("10.0.0.0/8x").valid());
    ASSERT_FALSE(dg::cidr_range("example.org/8").valid());
    ASSERT_FALSE(dg::cidr_range("::/129").valid());

    ASSERT_EQ(dg::cidr_range("192.168.10.20/16").str(), "192.168.0.0/16");
    ASSERT_EQ(dg::cidr_range("10.0.0.1").str(), "10.0.0.1/32");
    ASSERT_EQ(dg::cidr_range("fd12:3456::1/16").str(), "fd12::/16");
}

TEST(cidr_range, contains) {
    dg::cidr_range net("192.168.0.0/23");
    ASSERT_TRUE(net.contains(dg::socket_address("192.168.0.1", 0)));
    ASSERT_TRUE(net.contains(dg::socket_address("192.168.1.255", 53)));
    ASSERT_FALSE(net.contains(dg::socket_address("192.168.2.0", 0)));
    ASSERT_FALSE(net.contains(dg::socket_address("::1", 0)));
    ASSERT_TRUE(net.contains(dg::socket_address("::ffff:192.168.1.1", 0)));

    dg::cidr_range host("1.2.3.4");
    ASSERT_TRUE(host.contains(dg::socket_address("1.2.3.4", 0)));
    ASSERT_FALSE(host.contains(dg::socket_address("1.2.3.5", 0)));

    dg::cidr_range net6("2001:db8::/32");
    ASSERT_TRUE(net6.contains(dg::socket_address("2001:db8:ffff::1", 0)));
    ASSERT_FALSE(net6.contains(dg::socket_address("2001:db9::1", 0)));

    ASSERT_TRUE(dg::cidr_range("0.0.0.0/0").contains(dg::socket_address("8.8.8.8", 0)));
    ASSERT_TRUE(net.contains(dg::cidr_range("192.168.1.0/24")));
    ASSERT_FALSE(dg::cidr_range("192.168.1.0/24").contains(net));
}
