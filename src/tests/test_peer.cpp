#include <catch2/catch.hpp>

#include "Peer.h"
#include "fake_lookups.h"

using namespace flowvisor;

TEST_CASE("Peer resolver", "[peer]")
{
    test::FakeCityLookup city;
    test::FakeAsnLookup asn;
    city.records["89.160.20.112"] = {"Sweden", "SE", "Linköping", 58.4167, 15.6167};
    asn.records["89.160.20.112"] = {"29518", "Bredband2 AB"};
    asn.records["2001:db8::1"] = {"64496", "Documentation AS"};
    PeerResolver resolver(&city, &asn);

    SECTION("both lookups hit")
    {
        auto peer = resolver.resolve("89.160.20.112");
        CHECK(peer.ip.to_string() == "89.160.20.112");
        CHECK(peer.country == "Sweden");
        CHECK(peer.country_iso == "SE");
        CHECK(peer.city == "Linköping");
        CHECK(peer.latitude == Approx(58.4167));
        CHECK(peer.asn == "29518");
        CHECK(peer.asn_org == "Bredband2 AB");
    }

    SECTION("lookups are independent")
    {
        auto peer = resolver.resolve("2001:0db8::0001");
        CHECK(peer.ip.to_string() == "2001:db8::1");
        CHECK(peer.country.empty());
        CHECK(peer.latitude == 0.0);
        CHECK(peer.asn == "64496");
    }

    SECTION("miss is not an error")
    {
        auto peer = resolver.resolve("10.0.0.1");
        CHECK(peer.country.empty());
        CHECK(peer.city.empty());
        CHECK(peer.asn.empty());
        CHECK(peer.asn_org.empty());
    }

    SECTION("lookup failure degrades to a miss for that lookup only")
    {
        city.failing.insert("89.160.20.112");
        auto peer = resolver.resolve("89.160.20.112");
        CHECK(peer.country.empty());
        CHECK(peer.asn == "29518");
    }

    SECTION("invalid addresses")
    {
        CHECK_THROWS_AS(resolver.resolve(""), InvalidAddressException);
        CHECK_THROWS_AS(resolver.resolve("not-an-ip"), InvalidAddressException);
        CHECK_THROWS_AS(resolver.resolve("10.0.0.1:53"), InvalidAddressException);
        CHECK_THROWS_AS(resolver.resolve(" 10.0.0.1"), InvalidAddressException);
        CHECK_THROWS_WITH(resolver.resolve("999.1.1.1"), "invalid IP address: \"999.1.1.1\"");
        CHECK(city.calls == 0);
        CHECK(asn.calls == 0);
    }

    SECTION("resolution is idempotent")
    {
        auto a = resolver.resolve("89.160.20.112");
        auto b = resolver.resolve("89.160.20.112");
        CHECK(a.ip == b.ip);
        CHECK(a.country == b.country);
        CHECK(a.asn == b.asn);
        CHECK(a.asn_org == b.asn_org);
        // no caching: every resolve queries the services
        CHECK(city.calls == 2);
        CHECK(asn.calls == 2);
    }
}

TEST_CASE("Peer resolver without databases", "[peer]")
{
    PeerResolver resolver(nullptr, nullptr);
    auto peer = resolver.resolve("8.8.8.8");
    CHECK(peer.ip.to_string() == "8.8.8.8");
    CHECK(peer.country.empty());
    CHECK(peer.asn.empty());
}
