/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <stdexcept>
#include <string>

namespace flowvisor {

/**
 * input line looked like a flow record but could not be decoded into one
 */
class MalformedRecordException : public std::runtime_error
{
public:
    explicit MalformedRecordException(const std::string &msg)
        : std::runtime_error(msg)
    {
    }
};

/**
 * a flow endpoint is not a textual IPv4 or IPv6 address
 */
class InvalidAddressException : public std::runtime_error
{
    std::string _address;

public:
    explicit InvalidAddressException(const std::string &address)
        : std::runtime_error("invalid IP address: \"" + address + "\"")
        , _address(address)
    {
    }

    const std::string &address() const
    {
        return _address;
    }
};

}
