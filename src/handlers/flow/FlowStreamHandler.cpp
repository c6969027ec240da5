/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "FlowStreamHandler.h"
#include <spdlog/sinks/stdout_color_sinks.h>

namespace flowvisor::handler::flow {

static const std::vector<std::string> FLOW_LABELS = {"direction", "private", "country", "asn", "asn_org"};

FlowMetricsManager::FlowMetricsManager()
    : _bytes("flow", {"bytes", "total"}, "Bytes attributed to the remote peer of each flow", FLOW_LABELS)
    , _packets("flow", {"packets", "total"}, "Packets attributed to the remote peer of each flow", FLOW_LABELS)
    , _lines("flow", {"lines", "total"}, "Lines read from the collector")
    , _records("flow", {"records", "total"}, "Flow records successfully enriched")
    , _malformed("flow", {"records", "malformed", "total"}, "Flow lines that could not be decoded")
    , _invalid_address("flow", {"records", "invalid", "address", "total"}, "Flow records dropped for an unparseable endpoint address")
    , _unattributed("flow", {"unattributed", "total"}, "Flows with no local endpoint, not counted by direction")
    , _diagnostic_lines("flow", {"diagnostic", "lines", "total"}, "Non-record lines passed through from the collector")
{
}

void FlowMetricsManager::process_flow(const Flow &flow)
{
    ++_records;

    auto remote = flow.remote();
    if (!remote) {
        ++_unattributed;
        return;
    }

    CounterFamily::LabelValues labels{to_string(flow.direction), flow.privacy(), remote->country, remote->asn, remote->asn_org};
    _bytes.add(labels, flow.bytes);
    _packets.add(labels, flow.packets);
}

void FlowMetricsManager::to_prometheus(std::stringstream &out, const Metric::LabelMap &add_labels) const
{
    _bytes.to_prometheus(out, add_labels);
    _packets.to_prometheus(out, add_labels);
    _lines.to_prometheus(out, add_labels);
    _records.to_prometheus(out, add_labels);
    _malformed.to_prometheus(out, add_labels);
    _invalid_address.to_prometheus(out, add_labels);
    _unattributed.to_prometheus(out, add_labels);
    _diagnostic_lines.to_prometheus(out, add_labels);
}

void FlowMetricsManager::self_metrics_json(json &j) const
{
    _lines.to_json(j);
    _records.to_json(j);
    _malformed.to_json(j);
    _invalid_address.to_json(j);
    _unattributed.to_json(j);
    _diagnostic_lines.to_json(j);
    j["bytes"]["series"] = _bytes.series_count();
}

FlowStreamHandler::FlowStreamHandler(const std::string &name, LineEventProxy *proxy, const FlowEnricher &enricher, FlowMetricsManager *metrics)
    : flowvisor::AbstractRunnableModule(name)
    , _line_proxy(proxy)
    , _enricher(enricher)
    , _metrics(metrics)
{
    if (!_line_proxy) {
        throw std::invalid_argument("FlowStreamHandler: requires a line input event proxy");
    }
    if (!_metrics) {
        throw std::invalid_argument("FlowStreamHandler: requires a metrics manager");
    }
    _logger = spdlog::get("flowvisor");
    if (!_logger) {
        _logger = spdlog::stderr_color_mt("flowvisor");
    }
}

FlowStreamHandler::~FlowStreamHandler()
{
    stop();
}

void FlowStreamHandler::start()
{
    if (_running) {
        return;
    }

    _flow_line_connection = _line_proxy->flow_line_signal.connect(&FlowStreamHandler::process_flow_line_cb, this);
    _diagnostic_line_connection = _line_proxy->diagnostic_line_signal.connect(&FlowStreamHandler::process_diagnostic_line_cb, this);

    _running = true;
}

void FlowStreamHandler::stop()
{
    if (!_running) {
        return;
    }

    _flow_line_connection.disconnect();
    _diagnostic_line_connection.disconnect();

    _running = false;
}

void FlowStreamHandler::process_flow_line_cb(const std::string &line)
{
    _metrics->process_line();
    try {
        auto flow = _enricher.enrich(line);
        if (_logger->should_log(spdlog::level::debug)) {
            const auto &s = flow.source;
            const auto &d = flow.destination;
            _logger->debug("flow {} {} {} [{} {} {}] -> {} [{} {} {}] packets={} bytes={} proto={}",
                to_string(flow.direction), flow.privacy(),
                s.ip.to_string(), s.country, s.asn, s.asn_org,
                d.ip.to_string(), d.country, d.asn, d.asn_org,
                flow.packets, flow.bytes, flow.proto);
        }
        _metrics->process_flow(flow);
    } catch (const MalformedRecordException &e) {
        _metrics->process_malformed();
        _logger->warn("[{}] discarding malformed flow record: {}: {}", _name, e.what(), line);
    } catch (const InvalidAddressException &e) {
        _metrics->process_invalid_address();
        _logger->warn("[{}] discarding flow: {}", _name, e.what());
    } catch (const std::exception &e) {
        _logger->error("[{}] dropping line after unexpected error: {}", _name, e.what());
    }
}

void FlowStreamHandler::process_diagnostic_line_cb([[maybe_unused]] const std::string &line)
{
    _metrics->process_line();
    _metrics->process_diagnostic_line();
}

void FlowStreamHandler::info_json(json &j) const
{
    common_info_json(j);
    _metrics->self_metrics_json(j[schema_key()]);
}

}
