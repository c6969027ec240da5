/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "LineInputStream.h"
#include "FlowRecord.h"
#include "ThreadName.h"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace flowvisor::input::line {

LineInputStream::LineInputStream(const std::string &name, std::unique_ptr<LineSource> source)
    : flowvisor::InputStream(name)
    , _source(std::move(source))
{
    if (!_source) {
        throw std::invalid_argument("line input requires a source");
    }
    _logger = spdlog::get("flowvisor");
    if (!_logger) {
        _logger = spdlog::stderr_color_mt("flowvisor");
    }
}

LineInputStream::~LineInputStream()
{
    stop();
}

void LineInputStream::start()
{
    if (_running) {
        return;
    }

    _logger->info("[{}] reading lines from {}", _name, _source->description());

    _running = true;
    _io_thread = std::make_unique<std::thread>([this] {
        thread::change_self_name(schema_key(), name());
        _read_loop();
    });
}

void LineInputStream::_read_loop()
{
    std::string line;
    while (true) {
        try {
            if (!_source->read_line(line)) {
                break;
            }
        } catch (const LineSourceException &e) {
            _logger->error("[{}] {}", _name, e.what());
            break;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        ++_line_count;
        bool flow = is_flow_candidate(line);
        std::shared_lock lock(_input_mutex);
        for (auto &proxy : _event_proxies) {
            auto line_proxy = static_cast<LineEventProxy *>(proxy.get());
            if (flow) {
                line_proxy->flow_line_cb(line);
            } else {
                line_proxy->diagnostic_line_cb(line);
            }
        }
    }

    _logger->info("[{}] end of input after {} lines", _name, _line_count.load());
    std::shared_lock lock(_input_mutex);
    for (auto &proxy : _event_proxies) {
        proxy->end_of_stream_cb();
    }
}

void LineInputStream::stop()
{
    if (!_running) {
        return;
    }

    _source->close();
    if (_io_thread && _io_thread->joinable()) {
        _io_thread->join();
    }

    _running = false;
}

void LineInputStream::info_json(json &j) const
{
    common_info_json(j);
    j[schema_key()]["source"] = _source->description();
    j[schema_key()]["lines"] = _line_count.load();
}

std::unique_ptr<InputEventProxy> LineInputStream::create_event_proxy()
{
    return std::make_unique<LineEventProxy>(_name);
}

}
