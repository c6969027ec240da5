/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include "utils.h"
#include <initializer_list>
#include <string>
#include <unordered_set>
#include <vector>

namespace flowvisor {

using lib::utils::IpAddress;

enum class Direction {
    In,
    Out,
    Unknown
};

const char *to_string(Direction direction);

/**
 * The addresses considered to be "this host". Filled once at startup, read-only afterwards.
 */
class LocalAddressSet
{
    std::unordered_set<IpAddress> _addresses;

public:
    LocalAddressSet() = default;
    LocalAddressSet(std::initializer_list<IpAddress> addresses)
        : _addresses(addresses)
    {
    }

    void add(const IpAddress &ip)
    {
        _addresses.insert(ip);
    }

    void merge(const LocalAddressSet &other)
    {
        _addresses.insert(other._addresses.begin(), other._addresses.end());
    }

    bool contains(const IpAddress &ip) const
    {
        return _addresses.count(ip) > 0;
    }

    size_t size() const
    {
        return _addresses.size();
    }

    bool empty() const
    {
        return _addresses.empty();
    }

    // sorted textual form, for logging
    std::vector<std::string> to_strings() const;
};

struct Classification {
    Direction direction;
    bool is_private;
};

/**
 * destination is checked first: a flow between two local addresses is inbound
 */
Classification classify(const IpAddress &ip_src, const IpAddress &ip_dst, const LocalAddressSet &local);

}
