#include <catch2/catch.hpp>

#include "FlowEnricher.h"
#include "fake_lookups.h"

using namespace flowvisor;

TEST_CASE("Flow enricher", "[flow][enrich]")
{
    test::FakeCityLookup city;
    test::FakeAsnLookup asn;
    city.records["8.8.8.8"] = {"United States", "US", "", 37.751, -97.822};
    asn.records["8.8.8.8"] = {"15169", "GOOGLE"};
    PeerResolver resolver(&city, &asn);
    LocalAddressSet local{*IpAddress::parse("10.0.2.1")};
    FlowEnricher enricher(resolver, local);

    SECTION("private inbound with lookup misses")
    {
        auto flow = enricher.enrich(R"({"ip_src":"10.0.1.1","ip_dst":"10.0.2.1","packets":2,"bytes":143})");
        CHECK(flow.direction == Direction::In);
        CHECK(flow.is_private);
        CHECK(std::string(flow.privacy()) == "private");
        CHECK(flow.packets == 2);
        CHECK(flow.bytes == 143);
        REQUIRE(flow.remote() == &flow.source);
        CHECK(flow.remote()->ip.to_string() == "10.0.1.1");
        CHECK(flow.remote()->country.empty());
        CHECK(flow.remote()->asn.empty());
        CHECK(flow.destination.ip.to_string() == "10.0.2.1");
    }

    SECTION("public outbound")
    {
        auto flow = enricher.enrich(R"({"ip_src":"10.0.2.1","ip_dst":"8.8.8.8","packets":1,"bytes":60,"proto":"udp"})");
        CHECK(flow.direction == Direction::Out);
        CHECK_FALSE(flow.is_private);
        CHECK(std::string(flow.privacy()) == "public");
        CHECK(flow.proto == "udp");
        REQUIRE(flow.remote() == &flow.destination);
        CHECK(flow.remote()->country == "United States");
        CHECK(flow.remote()->asn == "15169");
        CHECK(flow.remote()->asn_org == "GOOGLE");
    }

    SECTION("unattributable")
    {
        auto flow = enricher.enrich(R"({"ip_src":"8.8.8.8","ip_dst":"1.1.1.1","packets":1,"bytes":60})");
        CHECK(flow.direction == Direction::Unknown);
        CHECK(flow.remote() == nullptr);
        CHECK(flow.source.asn == "15169");
    }

    SECTION("errors abort the whole flow")
    {
        CHECK_THROWS_AS(enricher.enrich("{garbage"), MalformedRecordException);
        CHECK_THROWS_AS(enricher.enrich(R"({"ip_src":"10.0.1.1","ip_dst":"bogus","packets":1,"bytes":1})"), InvalidAddressException);
        CHECK_THROWS_AS(enricher.enrich(R"({"ip_dst":"10.0.2.1","packets":1,"bytes":1})"), InvalidAddressException);
    }
}
