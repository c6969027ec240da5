/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include "AbstractModule.h"
#include "FlowEnricher.h"
#include "Metrics.h"
#include "inputs/line/LineInputStream.h"
#include <spdlog/spdlog.h>

namespace flowvisor::handler::flow {

using namespace flowvisor::input::line;

/**
 * Owns the cumulative flow counters. Written by the ingestion thread, read by scrapes.
 */
class FlowMetricsManager final
{
    CounterFamily _bytes;
    CounterFamily _packets;

    Counter _lines;
    Counter _records;
    Counter _malformed;
    Counter _invalid_address;
    Counter _unattributed;
    Counter _diagnostic_lines;

public:
    FlowMetricsManager();

    /**
     * attribute the flow to its remote peer; unattributable flows only bump the unattributed counter
     */
    void process_flow(const Flow &flow);

    void process_line()
    {
        ++_lines;
    }

    void process_diagnostic_line()
    {
        ++_diagnostic_lines;
    }

    void process_malformed()
    {
        ++_malformed;
    }

    void process_invalid_address()
    {
        ++_invalid_address;
    }

    const CounterFamily &bytes() const
    {
        return _bytes;
    }

    const CounterFamily &packets() const
    {
        return _packets;
    }

    const Counter &lines() const
    {
        return _lines;
    }

    const Counter &records() const
    {
        return _records;
    }

    const Counter &malformed() const
    {
        return _malformed;
    }

    const Counter &invalid_address() const
    {
        return _invalid_address;
    }

    const Counter &unattributed() const
    {
        return _unattributed;
    }

    const Counter &diagnostic_lines() const
    {
        return _diagnostic_lines;
    }

    void to_prometheus(std::stringstream &out, const Metric::LabelMap &add_labels = {}) const;
    // the self metrics only, the flow families can be large
    void self_metrics_json(json &j) const;
};

class FlowStreamHandler final : public flowvisor::AbstractRunnableModule
{
    LineEventProxy *_line_proxy;
    const FlowEnricher &_enricher;
    FlowMetricsManager *_metrics;
    std::shared_ptr<spdlog::logger> _logger;

    sigslot::connection _flow_line_connection;
    sigslot::connection _diagnostic_line_connection;

    void process_flow_line_cb(const std::string &line);
    void process_diagnostic_line_cb(const std::string &line);

public:
    FlowStreamHandler(const std::string &name, LineEventProxy *proxy, const FlowEnricher &enricher, FlowMetricsManager *metrics);
    ~FlowStreamHandler() override;

    // flowvisor::AbstractModule
    std::string schema_key() const override
    {
        return "flow";
    }

    void start() override;
    void stop() override;
    void info_json(json &j) const override;
};

}
