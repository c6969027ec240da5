/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
#include <IpAddress.h>
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif
#include <cstring>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace flowvisor::lib::utils {

class UtilsException : public std::runtime_error
{
public:
    UtilsException(const char *msg)
        : std::runtime_error(msg)
    {
    }
    UtilsException(const std::string &msg)
        : std::runtime_error(msg)
    {
    }
};

/**
 * A parsed IPv4 or IPv6 address. IPv4-mapped IPv6 addresses (::ffff:a.b.c.d) are
 * normalized to plain IPv4.
 */
class IpAddress
{
    pcpp::IPAddress _addr;
    bool _valid{false};

public:
    IpAddress() = default;
    explicit IpAddress(const pcpp::IPv4Address &ipv4);
    explicit IpAddress(const pcpp::IPv6Address &ipv6);

    /*
     * Accepts textual v4 or v6 only: no port, no zone, no surrounding whitespace.
     * The unspecified addresses (0.0.0.0, ::) are not valid endpoints.
     */
    static std::optional<IpAddress> parse(const std::string &text);

    bool is_ipv4() const
    {
        return _valid && _addr.isIPv4();
    }
    bool is_ipv6() const
    {
        return _valid && _addr.isIPv6();
    }
    bool valid() const
    {
        return _valid;
    }

    const pcpp::IPv4Address &ipv4() const
    {
        return _addr.getIPv4();
    }
    const pcpp::IPv6Address &ipv6() const
    {
        return _addr.getIPv6();
    }

    std::string to_string() const;

    bool operator==(const IpAddress &other) const;
    bool operator!=(const IpAddress &other) const
    {
        return !(*this == other);
    }
    bool operator<(const IpAddress &other) const;
};

struct IPv4subnet {
    in_addr addr;
    uint8_t cidr;
    std::string str;
};

struct IPv6subnet {
    in6_addr addr;
    uint8_t cidr;
    std::string str;
};
typedef std::vector<IPv4subnet> IPv4subnetList;
typedef std::vector<IPv6subnet> IPv6subnetList;

bool ipv4_to_sockaddr(const pcpp::IPv4Address &ip, struct sockaddr_in *sa);
bool ipv6_to_sockaddr(const pcpp::IPv6Address &ip, struct sockaddr_in6 *sa);

std::vector<std::string> split_str_to_vec_str(const std::string &spec, const char &delimiter);
void parse_host_specs(const std::vector<std::string> &host_list, IPv4subnetList &ipv4_list, IPv6subnetList &ipv6_list);
std::optional<IPv4subnetList::const_iterator> match_subnet(const IPv4subnetList &ipv4_list, uint32_t ipv4_val);
std::optional<IPv6subnetList::const_iterator> match_subnet(const IPv6subnetList &ipv6_list, const uint8_t *ipv6_val);
bool match_subnet(const IPv4subnetList &ipv4_list, const IPv6subnetList &ipv6_list, const IpAddress &ip);

// loopback, link-local, RFC1918 and RFC4193 unique local ranges
bool is_private_address(const IpAddress &ip);
}

template <>
struct std::hash<flowvisor::lib::utils::IpAddress> {
    std::size_t operator()(const flowvisor::lib::utils::IpAddress &ip) const
    {
        if (ip.is_ipv4()) {
            return std::hash<uint32_t>{}(ip.ipv4().toInt());
        }
        if (ip.is_ipv6()) {
            return std::hash<std::string>{}(std::string(reinterpret_cast<const char *>(ip.ipv6().toBytes()), 16));
        }
        return 0;
    }
};
