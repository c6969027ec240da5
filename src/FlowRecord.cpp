/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "FlowRecord.h"
#include <cctype>
#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace flowvisor {

using json = nlohmann::json;

bool is_flow_candidate(std::string_view line)
{
    for (auto c : line) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            continue;
        }
        return c == '{';
    }
    return false;
}

static uint64_t required_count(const json &j, const char *field)
{
    auto it = j.find(field);
    if (it == j.end()) {
        throw MalformedRecordException(fmt::format("missing required field: {}", field));
    }
    // non-negative integers decode as unsigned, everything else is rejected
    if (!it->is_number_unsigned()) {
        throw MalformedRecordException(fmt::format("{} must be a non-negative integer, got: {}", field, it->dump()));
    }
    return it->get<uint64_t>();
}

static std::string optional_address(const json &j, const char *field)
{
    auto it = j.find(field);
    if (it == j.end() || it->is_null()) {
        return std::string();
    }
    if (!it->is_string()) {
        throw MalformedRecordException(fmt::format("{} must be a string, got: {}", field, it->dump()));
    }
    return it->get<std::string>();
}

RawFlowRecord parse_flow_record(const std::string &line)
{
    auto j = json::parse(line, nullptr, false);
    if (j.is_discarded()) {
        throw MalformedRecordException("invalid JSON");
    }
    if (!j.is_object()) {
        throw MalformedRecordException("flow record is not a JSON object");
    }

    RawFlowRecord record;
    record.ip_src = optional_address(j, "ip_src");
    record.ip_dst = optional_address(j, "ip_dst");
    record.packets = required_count(j, "packets");
    record.bytes = required_count(j, "bytes");

    if (auto proto = j.find("proto"); proto != j.end() && !proto->is_null()) {
        if (proto->is_string()) {
            record.proto = proto->get<std::string>();
        } else if (proto->is_number_unsigned()) {
            record.proto = std::to_string(proto->get<uint64_t>());
        } else {
            throw MalformedRecordException(fmt::format("proto must be a string or protocol number, got: {}", proto->dump()));
        }
    }

    return record;
}

}
