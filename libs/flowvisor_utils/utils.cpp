/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "utils.h"
#include <algorithm>
#include <cctype>
#include <fmt/format.h>
#include <sstream>

namespace flowvisor::lib::utils {

template <typename Out>
static void split(const std::string &s, char delim, Out result)
{
    std::stringstream ss;
    ss.str(s);
    std::string item;
    while (std::getline(ss, item, delim)) {
        *(result++) = item;
    }
}

IpAddress::IpAddress(const pcpp::IPv4Address &ipv4)
    : _addr(ipv4)
    , _valid(ipv4.isValid())
{
}

IpAddress::IpAddress(const pcpp::IPv6Address &ipv6)
{
    static constexpr uint8_t v4_mapped_prefix[12] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xff, 0xff};
    auto bytes = ipv6.toBytes();
    if (std::memcmp(bytes, v4_mapped_prefix, sizeof(v4_mapped_prefix)) == 0) {
        pcpp::IPv4Address ipv4(bytes + sizeof(v4_mapped_prefix));
        _addr = pcpp::IPAddress(ipv4);
        _valid = ipv4.isValid();
    } else {
        _addr = pcpp::IPAddress(ipv6);
        _valid = ipv6.isValid();
    }
}

std::optional<IpAddress> IpAddress::parse(const std::string &text)
{
    if (text.empty()) {
        return std::nullopt;
    }
    IpAddress ip;
    if (text.find(':') != std::string::npos) {
        ip = IpAddress(pcpp::IPv6Address(text));
    } else {
        ip = IpAddress(pcpp::IPv4Address(text));
    }
    if (!ip.valid()) {
        return std::nullopt;
    }
    return ip;
}

std::string IpAddress::to_string() const
{
    if (!_valid) {
        return std::string();
    }
    return _addr.toString();
}

bool IpAddress::operator==(const IpAddress &other) const
{
    if (_valid != other._valid) {
        return false;
    }
    if (!_valid) {
        return true;
    }
    if (is_ipv4() && other.is_ipv4()) {
        return ipv4().toInt() == other.ipv4().toInt();
    }
    if (is_ipv6() && other.is_ipv6()) {
        return std::memcmp(ipv6().toBytes(), other.ipv6().toBytes(), 16) == 0;
    }
    return false;
}

bool IpAddress::operator<(const IpAddress &other) const
{
    if (_valid != other._valid) {
        return !_valid;
    }
    if (!_valid) {
        return false;
    }
    if (is_ipv4() != other.is_ipv4()) {
        // IPv4 sorts before IPv6
        return is_ipv4();
    }
    if (is_ipv4()) {
        return ntohl(ipv4().toInt()) < ntohl(other.ipv4().toInt());
    }
    return std::memcmp(ipv6().toBytes(), other.ipv6().toBytes(), 16) < 0;
}

std::optional<IPv4subnetList::const_iterator> match_subnet(const IPv4subnetList &ipv4_list, uint32_t ipv4_val)
{
    if (ipv4_val && !ipv4_list.empty()) {
        in_addr ipv4{};
        std::memcpy(&ipv4, &ipv4_val, sizeof(in_addr));
        for (IPv4subnetList::const_iterator it = ipv4_list.begin(); it != ipv4_list.end(); ++it) {
            uint8_t cidr = it->cidr;
            if (cidr == 0) {
                return it;
            }
            uint32_t mask = htonl((0xFFFFFFFFu) << (32 - cidr));
            if (!((ipv4.s_addr ^ it->addr.s_addr) & mask)) {
                return it;
            }
        }
    }
    return std::nullopt;
}

std::optional<IPv6subnetList::const_iterator> match_subnet(const IPv6subnetList &ipv6_list, const uint8_t *ipv6_val)
{
    if (ipv6_val && !ipv6_list.empty()) {
        in6_addr ipv6{};
        std::memcpy(&ipv6, ipv6_val, sizeof(in6_addr));
        for (IPv6subnetList::const_iterator it = ipv6_list.begin(); it != ipv6_list.end(); ++it) {
            uint8_t prefixLength = it->cidr;
            auto network = it->addr;
            uint8_t compareByteCount = prefixLength / 8;
            uint8_t compareBitCount = prefixLength % 8;
            bool result = false;
            if (compareByteCount > 0) {
                result = std::memcmp(&network.s6_addr, &ipv6.s6_addr, compareByteCount) == 0;
            }
            if ((result || prefixLength < 8) && compareBitCount > 0) {
                uint8_t subSubnetByte = network.s6_addr[compareByteCount] >> (8 - compareBitCount);
                uint8_t subThisByte = ipv6.s6_addr[compareByteCount] >> (8 - compareBitCount);
                result = subSubnetByte == subThisByte;
            }
            if (result) {
                return it;
            }
        }
    }
    return std::nullopt;
}

bool match_subnet(const IPv4subnetList &ipv4_list, const IPv6subnetList &ipv6_list, const IpAddress &ip)
{
    if (ip.is_ipv4()) {
        return match_subnet(ipv4_list, ip.ipv4().toInt()).has_value();
    } else if (ip.is_ipv6()) {
        return match_subnet(ipv6_list, ip.ipv6().toBytes()).has_value();
    }
    return false;
}

bool is_private_address(const IpAddress &ip)
{
    static const auto private_ranges = [] {
        std::pair<IPv4subnetList, IPv6subnetList> ranges;
        parse_host_specs({"127.0.0.0/8", "169.254.0.0/16", "10.0.0.0/8", "172.16.0.0/12", "192.168.0.0/16",
                             "::1/128", "fe80::/10", "fc00::/7"},
            ranges.first, ranges.second);
        return ranges;
    }();
    return match_subnet(private_ranges.first, private_ranges.second, ip);
}

void parse_host_specs(const std::vector<std::string> &host_list, IPv4subnetList &ipv4_list, IPv6subnetList &ipv6_list)
{
    for (const auto &host : host_list) {
        auto delimiter = host.find('/');
        if (delimiter == std::string::npos) {
            throw UtilsException(fmt::format("invalid CIDR: {}", host));
        }
        auto ip = host.substr(0, delimiter);
        auto cidr = host.substr(++delimiter);
        auto not_number = std::count_if(cidr.begin(), cidr.end(),
            [](unsigned char c) { return !std::isdigit(c); });
        if (cidr.empty() || not_number) {
            throw UtilsException(fmt::format("invalid CIDR: {}", host));
        }

        auto cidr_number = std::stoi(cidr);
        if (ip.find(':') != std::string::npos) {
            if (cidr_number < 0 || cidr_number > 128) {
                throw UtilsException(fmt::format("invalid CIDR: {}", host));
            }
            in6_addr ipv6{};
            if (inet_pton(AF_INET6, ip.c_str(), &ipv6) != 1) {
                throw UtilsException(fmt::format("invalid IPv6 address: {}", ip));
            }
            ipv6_list.push_back({ipv6, static_cast<uint8_t>(cidr_number), host});
        } else {
            if (cidr_number < 0 || cidr_number > 32) {
                throw UtilsException(fmt::format("invalid CIDR: {}", host));
            }
            in_addr ipv4{};
            if (inet_pton(AF_INET, ip.c_str(), &ipv4) != 1) {
                throw UtilsException(fmt::format("invalid IPv4 address: {}", ip));
            }
            ipv4_list.push_back({ipv4, static_cast<uint8_t>(cidr_number), host});
        }
    }
}

std::vector<std::string> split_str_to_vec_str(const std::string &spec, const char &delimiter)
{
    std::vector<std::string> elems;
    split(spec, delimiter, std::back_inserter(elems));
    return elems;
}

bool ipv4_to_sockaddr(const pcpp::IPv4Address &ip, struct sockaddr_in *sa)
{
    memset(sa, 0, sizeof(struct sockaddr_in));
    uint32_t ip_int(ip.toInt());
    memcpy(&sa->sin_addr, &ip_int, sizeof(sa->sin_addr));
    sa->sin_family = AF_INET;
    return true;
}

bool ipv6_to_sockaddr(const pcpp::IPv6Address &ip, struct sockaddr_in6 *sa)
{
    memset(sa, 0, sizeof(struct sockaddr_in6));
    auto ip_bytes = ip.toBytes();
    for (int i = 0; i < 16; ++i) {
        sa->sin6_addr.s6_addr[i] = ip_bytes[i];
    }
    sa->sin6_family = AF_INET6;
    return true;
}

}
