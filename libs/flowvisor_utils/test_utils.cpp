#include <catch2/catch.hpp>

#include "utils.h"

using namespace flowvisor::lib::utils;

TEST_CASE("parseHostSpec", "[utils]")
{

    SECTION("IPv4 /24")
    {
        IPv4subnetList hostIPv4;
        IPv6subnetList hostIPv6;
        parse_host_specs({"192.168.0.0/24"}, hostIPv4, hostIPv6);
        CHECK(hostIPv4.size() == 1);
        char buffer[INET_ADDRSTRLEN];
        inet_ntop(AF_INET, &hostIPv4[0].addr.s_addr, buffer, INET_ADDRSTRLEN);
        CHECK(std::string(buffer) == "192.168.0.0");
        CHECK(hostIPv4[0].cidr == 24);
    }

    SECTION("IPv6 /48")
    {
        IPv4subnetList hostIPv4;
        IPv6subnetList hostIPv6;
        parse_host_specs({"2001:7f8:1::a506:2597:1/48"}, hostIPv4, hostIPv6);
        CHECK(hostIPv6.size() == 1);
        char buffer[INET6_ADDRSTRLEN];
        inet_ntop(AF_INET6, &hostIPv6[0].addr.s6_addr, buffer, INET6_ADDRSTRLEN);
        CHECK(std::string(buffer) == "2001:7f8:1::a506:2597:1");
        CHECK(hostIPv6[0].cidr == 48);
    }

    SECTION("mixed entries")
    {
        IPv4subnetList hostIPv4;
        IPv6subnetList hostIPv6;
        parse_host_specs(split_str_to_vec_str("192.168.1.5/32,2001:7f8:1::a506:2597:1/48", ','), hostIPv4, hostIPv6);
        CHECK(hostIPv4.size() == 1);
        CHECK(hostIPv6.size() == 1);
    }

    SECTION("invalid specs")
    {
        IPv4subnetList hostIPv4;
        IPv6subnetList hostIPv6;
        CHECK_THROWS_AS(parse_host_specs({"192.168.1.5"}, hostIPv4, hostIPv6), UtilsException);
        CHECK_THROWS_AS(parse_host_specs({"192.168.1.5/33"}, hostIPv4, hostIPv6), UtilsException);
        CHECK_THROWS_AS(parse_host_specs({"192.168.1.5/"}, hostIPv4, hostIPv6), UtilsException);
        CHECK_THROWS_WITH(parse_host_specs({"192.168.1.500/24"}, hostIPv4, hostIPv6), "invalid IPv4 address: 192.168.1.500");
        CHECK(hostIPv4.empty());
    }
}

TEST_CASE("IpAddress parse", "[utils][ip]")
{
    SECTION("IPv4")
    {
        auto ip = IpAddress::parse("10.0.1.1");
        REQUIRE(ip.has_value());
        CHECK(ip->is_ipv4());
        CHECK(ip->to_string() == "10.0.1.1");
    }

    SECTION("IPv6 canonical rendering")
    {
        auto ip = IpAddress::parse("2001:0db8:0000:0000:0000:0000:0000:0001");
        REQUIRE(ip.has_value());
        CHECK(ip->is_ipv6());
        CHECK(ip->to_string() == "2001:db8::1");
    }

    SECTION("IPv4-mapped IPv6 normalized to IPv4")
    {
        auto ip = IpAddress::parse("::ffff:10.0.2.1");
        REQUIRE(ip.has_value());
        CHECK(ip->is_ipv4());
        CHECK(*ip == *IpAddress::parse("10.0.2.1"));
    }

    SECTION("not addresses")
    {
        CHECK_FALSE(IpAddress::parse("").has_value());
        CHECK_FALSE(IpAddress::parse("not-an-ip").has_value());
        CHECK_FALSE(IpAddress::parse("10.0.0.256").has_value());
        CHECK_FALSE(IpAddress::parse("10.0.0.1:80").has_value());
        CHECK_FALSE(IpAddress::parse(" 10.0.0.1").has_value());
        CHECK_FALSE(IpAddress::parse("fe80::1%eth0").has_value());
        CHECK_FALSE(IpAddress::parse("example.com").has_value());
        CHECK_FALSE(IpAddress::parse("0.0.0.0").has_value());
        CHECK_FALSE(IpAddress::parse("::").has_value());
    }

    SECTION("ordering and equality")
    {
        CHECK(*IpAddress::parse("10.0.0.1") < *IpAddress::parse("10.0.0.2"));
        CHECK(*IpAddress::parse("9.255.255.255") < *IpAddress::parse("10.0.0.0"));
        CHECK(*IpAddress::parse("::1") != *IpAddress::parse("127.0.0.1"));
        CHECK(std::hash<IpAddress>{}(*IpAddress::parse("1.2.3.4")) == std::hash<IpAddress>{}(*IpAddress::parse("::ffff:1.2.3.4")));
    }
}

TEST_CASE("IpAddress from pcpp addresses", "[utils][ip]")
{
    SECTION("IPv4")
    {
        IpAddress ip(pcpp::IPv4Address("192.0.2.7"));
        CHECK(ip.valid());
        CHECK(ip.is_ipv4());
        CHECK(ip.ipv4() == pcpp::IPv4Address("192.0.2.7"));
        CHECK(ip == *IpAddress::parse("192.0.2.7"));
    }

    SECTION("IPv4-mapped IPv6 bytes normalized to IPv4")
    {
        IpAddress ip(pcpp::IPv6Address("::ffff:198.51.100.20"));
        CHECK(ip.is_ipv4());
        CHECK(ip.to_string() == "198.51.100.20");
    }

    SECTION("IPv6")
    {
        IpAddress ip(pcpp::IPv6Address("2001:db8::20"));
        CHECK(ip.is_ipv6());
        CHECK(ip.ipv6() == pcpp::IPv6Address("2001:db8::20"));
        CHECK(ip.to_string() == "2001:db8::20");
    }

    SECTION("unspecified is not valid")
    {
        CHECK_FALSE(IpAddress(pcpp::IPv4Address::Zero).valid());
        CHECK_FALSE(IpAddress(pcpp::IPv6Address::Zero).valid());
        CHECK(IpAddress().to_string().empty());
    }
}

TEST_CASE("private address ranges", "[utils][ip]")
{
    auto is_private = [](const char *text) {
        return is_private_address(*IpAddress::parse(text));
    };

    CHECK(is_private("10.0.0.1"));
    CHECK(is_private("172.16.0.1"));
    CHECK(is_private("172.31.255.255"));
    CHECK_FALSE(is_private("172.32.0.1"));
    CHECK(is_private("192.168.10.1"));
    CHECK(is_private("127.0.0.1"));
    CHECK(is_private("169.254.1.1"));
    CHECK_FALSE(is_private("8.8.8.8"));
    CHECK(is_private("::1"));
    CHECK(is_private("fe80::1"));
    CHECK(is_private("febf::1"));
    CHECK_FALSE(is_private("fec0::1"));
    CHECK(is_private("fd12:3456::1"));
    CHECK(is_private("fc00::1"));
    CHECK_FALSE(is_private("2001:4860:4860::8888"));
    CHECK(is_private("::ffff:192.168.0.1"));
}

TEST_CASE("ip format conversion", "[utils]")
{
    auto ip = IpAddress::parse("1.128.0.0");
    struct sockaddr_in sa;
    CHECK(ipv4_to_sockaddr(ip->ipv4(), &sa));
    CHECK(memcmp(&sa.sin_addr, ip->ipv4().toBytes(), sizeof(sa.sin_addr)) == 0);
    CHECK(sa.sin_family == AF_INET);

    auto ip6 = IpAddress::parse("2401:8080::");
    struct sockaddr_in6 sa6;
    CHECK(ipv6_to_sockaddr(ip6->ipv6(), &sa6));
    CHECK(memcmp(&sa6.sin6_addr, ip6->ipv6().toBytes(), sizeof(sa6.sin6_addr)) == 0);
    CHECK(sa6.sin6_family == AF_INET6);
}
