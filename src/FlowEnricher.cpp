/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "FlowEnricher.h"
#include <utility>

namespace flowvisor {

Flow FlowEnricher::enrich(const std::string &line) const
{
    auto record = parse_flow_record(line);

    Flow flow;
    flow.source = _resolver.resolve(record.ip_src);
    flow.destination = _resolver.resolve(record.ip_dst);
    flow.ip_src = flow.source.ip;
    flow.ip_dst = flow.destination.ip;
    flow.packets = record.packets;
    flow.bytes = record.bytes;
    flow.proto = std::move(record.proto);

    auto classification = classify(flow.ip_src, flow.ip_dst, _local);
    flow.direction = classification.direction;
    flow.is_private = classification.is_private;

    return flow;
}

}
