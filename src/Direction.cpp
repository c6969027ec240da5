/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "Direction.h"
#include <algorithm>

namespace flowvisor {

const char *to_string(Direction direction)
{
    switch (direction) {
    case Direction::In:
        return "in";
    case Direction::Out:
        return "out";
    case Direction::Unknown:
        break;
    }
    return "unknown";
}

std::vector<std::string> LocalAddressSet::to_strings() const
{
    std::vector<IpAddress> sorted(_addresses.begin(), _addresses.end());
    std::sort(sorted.begin(), sorted.end());
    std::vector<std::string> result;
    result.reserve(sorted.size());
    for (const auto &ip : sorted) {
        result.push_back(ip.to_string());
    }
    return result;
}

Classification classify(const IpAddress &ip_src, const IpAddress &ip_dst, const LocalAddressSet &local)
{
    Classification result{Direction::Unknown, false};
    if (local.contains(ip_dst)) {
        result.direction = Direction::In;
    } else if (local.contains(ip_src)) {
        result.direction = Direction::Out;
    }
    result.is_private = lib::utils::is_private_address(ip_src) && lib::utils::is_private_address(ip_dst);
    return result;
}

}
