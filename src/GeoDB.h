/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once
#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpedantic"
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#endif
#include <maxminddb.h>
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>

#include "utils.h"

namespace flowvisor::geo {

using lib::utils::IpAddress;

class GeoLookupException : public std::runtime_error
{
public:
    explicit GeoLookupException(const std::string &msg)
        : std::runtime_error(msg)
    {
    }
};

struct City {
    std::string country;
    std::string country_iso;
    std::string city;
    double latitude{0.0};
    double longitude{0.0};

    bool operator==(const City &other) const
    {
        return std::tie(country, country_iso, city, latitude, longitude) == std::tie(other.country, other.country_iso, other.city, other.latitude, other.longitude);
    }
    bool operator!=(const City &other) const
    {
        return !(*this == other);
    }
};

struct Asn {
    std::string number;
    std::string organization;

    bool operator==(const Asn &other) const
    {
        return std::tie(number, organization) == std::tie(other.number, other.organization);
    }
};

/**
 * Read-only city/geo lookup service. Returns std::nullopt when there is no record for the address,
 * throws GeoLookupException when the lookup itself failed.
 */
class CityLookup
{
public:
    virtual ~CityLookup() = default;
    virtual std::optional<City> lookup_city(const IpAddress &ip) const = 0;
};

/**
 * Read-only network number lookup service, same contract as CityLookup.
 */
class AsnLookup
{
public:
    virtual ~AsnLookup() = default;
    virtual std::optional<Asn> lookup_asn(const IpAddress &ip) const = 0;
};

class MaxmindDB final : public CityLookup, public AsnLookup
{
public:
    enum class Type {
        Asn,
        Geo
    };

    MaxmindDB(Type type)
        : _type(type){};
    ~MaxmindDB();

    MaxmindDB(const MaxmindDB &) = delete;
    MaxmindDB &operator=(const MaxmindDB &) = delete;

    void enable(const std::string &database_filename);
    bool enabled() const
    {
        return _enabled;
    }

    /*
     * These routines accept both IPv4 and IPv6. A database of the other type never has a record.
     */
    std::optional<City> lookup_city(const IpAddress &ip) const override;
    std::optional<Asn> lookup_asn(const IpAddress &ip) const override;

private:
    Type _type;
    mutable MMDB_s _mmdb;
    bool _enabled = false;

    std::optional<MMDB_lookup_result_s> _lookup(const IpAddress &ip) const;
    City _get_city(MMDB_lookup_result_s *lookup) const;
    Asn _get_asn(MMDB_lookup_result_s *lookup) const;
};

}
