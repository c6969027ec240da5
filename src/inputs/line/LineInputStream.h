/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include "InputStream.h"
#include "LineSource.h"
#include <spdlog/spdlog.h>
#include <thread>

namespace flowvisor::input::line {

/**
 * Pulls lines from a LineSource on a dedicated thread and routes each one, in order, to the flow or the
 * diagnostic signal of every event proxy. The thread ends when the source reports end of stream; stop()
 * closes the source to get there.
 */
class LineInputStream : public flowvisor::InputStream
{
    std::unique_ptr<LineSource> _source;
    std::unique_ptr<std::thread> _io_thread;
    std::atomic<uint64_t> _line_count{0};
    std::shared_ptr<spdlog::logger> _logger;

    void _read_loop();

public:
    LineInputStream(const std::string &name, std::unique_ptr<LineSource> source);
    ~LineInputStream();

    // flowvisor::AbstractModule
    std::string schema_key() const override
    {
        return "line";
    }
    void start() override;
    void stop() override;
    void info_json(json &j) const override;
    std::unique_ptr<InputEventProxy> create_event_proxy() override;

    /**
     * close the source without waiting for the reader thread; async-signal-safe for FdLineSource
     */
    void close_source()
    {
        _source->close();
    }

    uint64_t line_count() const
    {
        return _line_count.load();
    }
};

class LineEventProxy : public flowvisor::InputEventProxy
{

public:
    LineEventProxy(const std::string &name)
        : InputEventProxy(name)
    {
    }

    ~LineEventProxy() = default;

    size_t consumer_count() const override
    {
        return end_of_stream_signal.slot_count() + flow_line_signal.slot_count() + diagnostic_line_signal.slot_count();
    }

    void flow_line_cb(const std::string &line)
    {
        flow_line_signal(line);
    }

    void diagnostic_line_cb(const std::string &line)
    {
        diagnostic_line_signal(line);
    }

    // handler functionality
    // IF THIS changes, see consumer_count()
    mutable sigslot::signal<const std::string &> flow_line_signal;
    mutable sigslot::signal<const std::string &> diagnostic_line_signal;
};

}
