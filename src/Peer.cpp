/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "Peer.h"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace flowvisor {

PeerResolver::PeerResolver(const geo::CityLookup *city, const geo::AsnLookup *asn)
    : _city(city)
    , _asn(asn)
{
    _logger = spdlog::get("flowvisor");
    if (!_logger) {
        _logger = spdlog::stderr_color_mt("flowvisor");
    }
}

Peer PeerResolver::resolve(const std::string &ip) const
{
    auto addr = IpAddress::parse(ip);
    if (!addr) {
        throw InvalidAddressException(ip);
    }

    Peer peer;
    peer.ip = *addr;

    if (_city) {
        try {
            if (auto city = _city->lookup_city(peer.ip)) {
                peer.country = city->country;
                peer.country_iso = city->country_iso;
                peer.city = city->city;
                peer.latitude = city->latitude;
                peer.longitude = city->longitude;
            }
        } catch (const geo::GeoLookupException &e) {
            _logger->debug("city lookup failed for {}: {}", ip, e.what());
        }
    }

    if (_asn) {
        try {
            if (auto asn = _asn->lookup_asn(peer.ip)) {
                peer.asn = asn->number;
                peer.asn_org = asn->organization;
            }
        } catch (const geo::GeoLookupException &e) {
            _logger->debug("asn lookup failed for {}: {}", ip, e.what());
        }
    }

    return peer;
}

}
