#include <catch2/catch.hpp>

#include "Direction.h"

using namespace flowvisor;

static IpAddress ip(const char *text)
{
    return *IpAddress::parse(text);
}

TEST_CASE("classify direction", "[direction]")
{
    LocalAddressSet local{ip("10.0.2.1"), ip("2001:db8::5")};

    SECTION("inbound")
    {
        auto c = classify(ip("8.8.8.8"), ip("10.0.2.1"), local);
        CHECK(c.direction == Direction::In);
        CHECK(std::string(to_string(c.direction)) == "in");
    }

    SECTION("outbound")
    {
        auto c = classify(ip("2001:db8::5"), ip("2606:4700::1111"), local);
        CHECK(c.direction == Direction::Out);
        CHECK(std::string(to_string(c.direction)) == "out");
    }

    SECTION("both local is inbound")
    {
        LocalAddressSet both{ip("10.0.2.1"), ip("10.0.2.2")};
        CHECK(classify(ip("10.0.2.2"), ip("10.0.2.1"), both).direction == Direction::In);
        CHECK(classify(ip("10.0.2.1"), ip("10.0.2.2"), both).direction == Direction::In);
    }

    SECTION("neither local")
    {
        auto c = classify(ip("8.8.8.8"), ip("1.1.1.1"), local);
        CHECK(c.direction == Direction::Unknown);
        CHECK(std::string(to_string(c.direction)) == "unknown");
    }

    SECTION("empty local set")
    {
        CHECK(classify(ip("10.0.2.1"), ip("10.0.2.1"), LocalAddressSet()).direction == Direction::Unknown);
    }

    SECTION("IPv4-mapped addresses match their IPv4 form")
    {
        CHECK(classify(ip("8.8.8.8"), ip("::ffff:10.0.2.1"), local).direction == Direction::In);
    }
}

TEST_CASE("classify privacy", "[direction]")
{
    LocalAddressSet local{ip("10.0.0.5")};
    CHECK(classify(ip("10.0.0.1"), ip("10.0.0.2"), local).is_private);
    CHECK_FALSE(classify(ip("8.8.8.8"), ip("10.0.0.5"), local).is_private);
    CHECK_FALSE(classify(ip("10.0.0.5"), ip("8.8.8.8"), local).is_private);
    CHECK(classify(ip("fd00::1"), ip("192.168.1.1"), local).is_private);
    CHECK(classify(ip("127.0.0.1"), ip("::1"), local).is_private);
}

TEST_CASE("local address set", "[direction]")
{
    LocalAddressSet local;
    CHECK(local.empty());
    local.add(ip("10.0.0.2"));
    local.add(ip("10.0.0.1"));
    local.add(ip("10.0.0.1"));
    CHECK(local.size() == 2);
    CHECK(local.to_strings() == std::vector<std::string>{"10.0.0.1", "10.0.0.2"});

    LocalAddressSet other{ip("::1")};
    local.merge(other);
    CHECK(local.size() == 3);
    CHECK(local.contains(ip("::1")));
    CHECK_FALSE(local.contains(ip("10.0.0.3")));
}
