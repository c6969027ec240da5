/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "GeoDB.h"
#include <fmt/format.h>

namespace flowvisor::geo {

void MaxmindDB::enable(const std::string &database_filename)
{
    auto status = MMDB_open(database_filename.c_str(), MMDB_MODE_MMAP, &_mmdb);
    if (status != MMDB_SUCCESS) {
        std::string msg = database_filename + ": " + MMDB_strerror(status);
        throw std::runtime_error(msg);
    }
    _enabled = true;
}

MaxmindDB::~MaxmindDB()
{
    if (_enabled) {
        MMDB_close(&_mmdb);
    }
}

std::optional<MMDB_lookup_result_s> MaxmindDB::_lookup(const IpAddress &ip) const
{
    int mmdb_error{MMDB_SUCCESS};
    MMDB_lookup_result_s lookup{};

    if (ip.is_ipv4()) {
        struct sockaddr_in sa4;
        lib::utils::ipv4_to_sockaddr(ip.ipv4(), &sa4);
        lookup = MMDB_lookup_sockaddr(&_mmdb, reinterpret_cast<const struct sockaddr *>(&sa4), &mmdb_error);
    } else if (ip.is_ipv6()) {
        struct sockaddr_in6 sa6;
        lib::utils::ipv6_to_sockaddr(ip.ipv6(), &sa6);
        lookup = MMDB_lookup_sockaddr(&_mmdb, reinterpret_cast<const struct sockaddr *>(&sa6), &mmdb_error);
    } else {
        return std::nullopt;
    }

    if (mmdb_error == MMDB_IPV6_LOOKUP_IN_IPV4_DATABASE_ERROR) {
        // an IPv4-only database simply has no record for IPv6 space
        return std::nullopt;
    }
    if (mmdb_error != MMDB_SUCCESS) {
        throw GeoLookupException(fmt::format("{}: {}", ip.to_string(), MMDB_strerror(mmdb_error)));
    }
    if (!lookup.found_entry) {
        return std::nullopt;
    }
    return lookup;
}

std::optional<City> MaxmindDB::lookup_city(const IpAddress &ip) const
{
    if (!_enabled || _type != Type::Geo) {
        return std::nullopt;
    }

    auto lookup = _lookup(ip);
    if (!lookup) {
        return std::nullopt;
    }

    return _get_city(&lookup.value());
}

std::optional<Asn> MaxmindDB::lookup_asn(const IpAddress &ip) const
{
    if (!_enabled || _type != Type::Asn) {
        return std::nullopt;
    }

    auto lookup = _lookup(ip);
    if (!lookup) {
        return std::nullopt;
    }

    return _get_asn(&lookup.value());
}

City MaxmindDB::_get_city(MMDB_lookup_result_s *lookup) const
{

    City city;

    {
        MMDB_entry_data_s result;
        if (MMDB_get_value(&lookup->entry, &result, "country", "names", "en", NULL) == MMDB_SUCCESS
            && result.has_data && result.type == MMDB_DATA_TYPE_UTF8_STRING) {
            city.country.assign(result.utf8_string, result.data_size);
        }
    }

    {
        MMDB_entry_data_s result;
        if (MMDB_get_value(&lookup->entry, &result, "country", "iso_code", NULL) == MMDB_SUCCESS
            && result.has_data && result.type == MMDB_DATA_TYPE_UTF8_STRING) {
            city.country_iso.assign(result.utf8_string, result.data_size);
        }
    }

    {
        MMDB_entry_data_s result;
        if (MMDB_get_value(&lookup->entry, &result, "city", "names", "en", NULL) == MMDB_SUCCESS
            && result.has_data && result.type == MMDB_DATA_TYPE_UTF8_STRING) {
            city.city.assign(result.utf8_string, result.data_size);
        }
    }

    {
        MMDB_entry_data_s result;
        if (MMDB_get_value(&lookup->entry, &result, "location", "latitude", NULL) == MMDB_SUCCESS
            && result.has_data && result.type == MMDB_DATA_TYPE_DOUBLE) {
            city.latitude = result.double_value;
        }
    }

    {
        MMDB_entry_data_s result;
        if (MMDB_get_value(&lookup->entry, &result, "location", "longitude", NULL) == MMDB_SUCCESS
            && result.has_data && result.type == MMDB_DATA_TYPE_DOUBLE) {
            city.longitude = result.double_value;
        }
    }

    // expect implicit move
    return city;
}

Asn MaxmindDB::_get_asn(MMDB_lookup_result_s *lookup) const
{

    Asn asn;

    {
        MMDB_entry_data_s result;
        if (MMDB_get_value(&lookup->entry, &result, "autonomous_system_number", NULL) == MMDB_SUCCESS && result.has_data) {
            switch (result.type) {
            case MMDB_DATA_TYPE_UINT16:
                asn.number = std::to_string(result.uint16);
                break;
            case MMDB_DATA_TYPE_INT32:
                asn.number = std::to_string(result.int32);
                break;
            case MMDB_DATA_TYPE_UINT32:
                asn.number = std::to_string(result.uint32);
                break;
            case MMDB_DATA_TYPE_UINT64:
                asn.number = std::to_string(result.uint64);
                break;
            case MMDB_DATA_TYPE_UTF8_STRING:
                asn.number.assign(result.utf8_string, result.data_size);
                break;
            }
        }
    }

    {
        MMDB_entry_data_s result;
        if (MMDB_get_value(&lookup->entry, &result, "autonomous_system_organization", NULL) == MMDB_SUCCESS
            && result.has_data && result.type == MMDB_DATA_TYPE_UTF8_STRING) {
            asn.organization.assign(result.utf8_string, result.data_size);
        }
    }

    // expect implicit move
    return asn;
}
}
