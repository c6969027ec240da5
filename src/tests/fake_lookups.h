#pragma once

#include "GeoDB.h"
#include <map>
#include <set>
#include <string>

namespace flowvisor::test {

/**
 * in-memory lookups keyed by canonical address text
 */
class FakeCityLookup : public geo::CityLookup
{
public:
    std::map<std::string, geo::City> records;
    std::set<std::string> failing;
    mutable unsigned int calls{0};

    std::optional<geo::City> lookup_city(const IpAddress &ip) const override
    {
        ++calls;
        auto key = ip.to_string();
        if (failing.count(key)) {
            throw geo::GeoLookupException("corrupt search tree for " + key);
        }
        auto it = records.find(key);
        if (it == records.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

class FakeAsnLookup : public geo::AsnLookup
{
public:
    std::map<std::string, geo::Asn> records;
    std::set<std::string> failing;
    mutable unsigned int calls{0};

    std::optional<geo::Asn> lookup_asn(const IpAddress &ip) const override
    {
        ++calls;
        auto key = ip.to_string();
        if (failing.count(key)) {
            throw geo::GeoLookupException("corrupt search tree for " + key);
        }
        auto it = records.find(key);
        if (it == records.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

}
