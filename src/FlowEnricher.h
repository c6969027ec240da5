/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include "Direction.h"
#include "FlowRecord.h"
#include "Peer.h"

namespace flowvisor {

/**
 * One enriched flow. Both peers are always present.
 */
struct Flow {
    IpAddress ip_src;
    IpAddress ip_dst;
    uint64_t packets{0};
    uint64_t bytes{0};
    std::string proto;
    Direction direction{Direction::Unknown};
    bool is_private{false};
    Peer source;
    Peer destination;

    const char *privacy() const
    {
        return is_private ? "private" : "public";
    }

    /**
     * the peer on the other side of the local host: source for inbound, destination for outbound.
     * nullptr for unattributable flows.
     */
    const Peer *remote() const
    {
        switch (direction) {
        case Direction::In:
            return &source;
        case Direction::Out:
            return &destination;
        case Direction::Unknown:
            break;
        }
        return nullptr;
    }
};

class FlowEnricher
{
    const PeerResolver &_resolver;
    const LocalAddressSet &_local;

public:
    FlowEnricher(const PeerResolver &resolver, const LocalAddressSet &local)
        : _resolver(resolver)
        , _local(local)
    {
    }

    /**
     * parse, resolve both endpoints and classify one input line
     *
     * @throws MalformedRecordException
     * @throws InvalidAddressException
     */
    Flow enrich(const std::string &line) const;
};

}
