/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include "AbstractModule.h"
#include "InputEventProxy.h"
#include <memory>
#include <shared_mutex>
#include <vector>

namespace flowvisor {

class InputStream : public AbstractRunnableModule
{

protected:
    mutable std::shared_mutex _input_mutex;
    std::vector<std::unique_ptr<InputEventProxy>> _event_proxies;

public:
    InputStream(const std::string &name)
        : AbstractRunnableModule(name)
    {
    }

    virtual ~InputStream(){};

    size_t consumer_count() const
    {
        std::shared_lock lock(_input_mutex);
        size_t count = 0;
        for (auto const &proxy : _event_proxies) {
            count += proxy->consumer_count();
        }
        return count;
    }

    InputEventProxy *add_event_proxy()
    {
        std::unique_lock lock(_input_mutex);
        _event_proxies.push_back(create_event_proxy());
        return _event_proxies.back().get();
    }

    virtual std::unique_ptr<InputEventProxy> create_event_proxy() = 0;

    void common_info_json(json &j) const
    {
        AbstractRunnableModule::common_info_json(j);
        j["input"]["running"] = running();
        j["input"]["consumers"] = consumer_count();
    }
};

}
