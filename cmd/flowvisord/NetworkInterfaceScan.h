/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#if defined(__APPLE__) || defined(__linux__)
#include <ifaddrs.h>
#include <net/if.h>
#endif
#include "Direction.h"
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace flowvisor {

/**
 * every IPv4 and IPv6 address configured on an interface that is up, loopback included
 */
static inline LocalAddressSet local_interface_addresses()
{
    LocalAddressSet local;
#if defined(__APPLE__) || defined(__linux__)
    struct ifaddrs *ifaddr;
    if (getifaddrs(&ifaddr) == -1) {
        throw std::runtime_error(std::string("getifaddrs() failed: ") + std::strerror(errno));
    }
    for (struct ifaddrs *ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next) {
        if (ifa->ifa_addr == nullptr || !(ifa->ifa_flags & IFF_UP)) {
            continue;
        }
        lib::utils::IpAddress ip;
        if (int family = ifa->ifa_addr->sa_family; family == AF_INET) {
            ip = lib::utils::IpAddress(pcpp::IPv4Address(reinterpret_cast<struct sockaddr_in *>(ifa->ifa_addr)->sin_addr.s_addr));
        } else if (family == AF_INET6) {
            ip = lib::utils::IpAddress(pcpp::IPv6Address(reinterpret_cast<struct sockaddr_in6 *>(ifa->ifa_addr)->sin6_addr.s6_addr));
        } else {
            continue;
        }
        if (!ip.valid()) {
            continue;
        }
        local.add(ip);
    }
    freeifaddrs(ifaddr);
#endif
    return local;
}

}
