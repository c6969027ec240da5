/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <sigslot/signal.hpp>
#include <string>

namespace flowvisor {

/**
 * The signals an input stream publishes to its consumers. Inputs with payloads subclass this and add
 * their own payload signals.
 */
class InputEventProxy
{
protected:
    std::string _input_name;

public:
    InputEventProxy(const std::string &name)
        : _input_name(name)
    {
    }
    virtual ~InputEventProxy() = default;

    const std::string &name() const
    {
        return _input_name;
    }

    void end_of_stream_cb()
    {
        end_of_stream_signal();
    }

    virtual size_t consumer_count() const
    {
        return end_of_stream_signal.slot_count();
    }

    // note: mutable because slot_count() is not const
    mutable sigslot::signal<> end_of_stream_signal;
};
}
