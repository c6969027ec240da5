/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include "FlowException.h"
#include <cstdint>
#include <string>
#include <string_view>

namespace flowvisor {

/**
 * One decoded collector record, before any address parsing or enrichment.
 */
struct RawFlowRecord {
    std::string ip_src;
    std::string ip_dst;
    uint64_t packets{0};
    uint64_t bytes{0};
    std::string proto;
};

/**
 * true iff the first non-whitespace character is '{'
 */
bool is_flow_candidate(std::string_view line);

/**
 * Decode one JSON flow line.
 *
 * packets and bytes are required non-negative integers. ip_src and ip_dst must be strings when present
 * and decode to "" when absent. proto may be a string or a non-negative integer. Unknown fields are ignored.
 *
 * @throws MalformedRecordException
 */
RawFlowRecord parse_flow_record(const std::string &line);

}
