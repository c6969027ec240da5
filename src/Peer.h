/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include "FlowException.h"
#include "GeoDB.h"
#include <spdlog/spdlog.h>
#include <string>

namespace flowvisor {

using lib::utils::IpAddress;

/**
 * One enriched flow endpoint. Fields a lookup did not resolve stay empty (or 0 for coordinates).
 */
struct Peer {
    IpAddress ip;
    std::string country;
    std::string country_iso;
    std::string city;
    double latitude{0.0};
    double longitude{0.0};
    std::string asn;
    std::string asn_org;
};

class PeerResolver
{
    const geo::CityLookup *_city;
    const geo::AsnLookup *_asn;
    std::shared_ptr<spdlog::logger> _logger;

public:
    /**
     * either lookup may be nullptr when its database is not configured, every lookup then misses
     */
    PeerResolver(const geo::CityLookup *city, const geo::AsnLookup *asn);

    /**
     * @throws InvalidAddressException if ip is not a textual IPv4 or IPv6 address
     */
    Peer resolve(const std::string &ip) const;
};

}
