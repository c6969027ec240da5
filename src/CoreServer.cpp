/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "CoreServer.h"
#include "flowvisor_config.h"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/stopwatch.h>

namespace flowvisor {

CoreServer::CoreServer(const handler::flow::FlowMetricsManager *metrics, std::shared_ptr<spdlog::logger> logger, const HttpConfig &http_config, const PrometheusConfig &prom_config)
    : _svr(http_config)
    , _metrics(metrics)
    , _logger(logger)
    , _start_time(std::chrono::system_clock::now())
{

    if (!_logger) {
        _logger = spdlog::get("flowvisor");
        if (!_logger) {
            _logger = spdlog::stderr_color_mt("flowvisor");
        }
    }

    if (!_metrics) {
        throw std::invalid_argument("CoreServer requires a metrics manager");
    }

    if (!prom_config.instance_label.empty()) {
        _prom_labels["instance"] = prom_config.instance_label;
    }

    _setup_routes(prom_config);
}

void CoreServer::start(const std::string &host, int port)
{
    if (port == 0) {
        port = _svr.bind_to_any_port(host.c_str());
        if (port < 0) {
            throw std::runtime_error("unable to bind to " + host + " on any port");
        }
    } else if (!_svr.bind_to_port(host.c_str(), port)) {
        throw std::runtime_error("unable to bind to " + host + ":" + std::to_string(port));
    }
    _port = port;
    _logger->info("web server listening on {}:{}", host, port);
    if (!_svr.listen_after_bind()) {
        throw std::runtime_error("error during listen");
    }
}

void CoreServer::stop()
{
    _svr.stop();
}

CoreServer::~CoreServer()
{
    stop();
}

void CoreServer::_setup_routes(const PrometheusConfig &prom_config)
{

    _logger->info("Initialize server control plane");

    // General metrics retriever
    _svr.Get("/api/v1/metrics/app", [&]([[maybe_unused]] const httplib::Request &req, httplib::Response &res) {
        json j;
        try {
            j["app"]["version"] = FLOWVISOR_VERSION_NUM;
            j["app"]["up_time_min"] = float(std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now() - _start_time).count()) / 60;
            _metrics->self_metrics_json(j["flow"]);
            std::unique_lock lock(_module_mutex);
            for (const auto &mod : _modules) {
                mod->info_json(j["modules"][mod->name()]);
            }
            res.set_content(j.dump(), "text/json");
        } catch (const std::exception &e) {
            res.status = 500;
            j["error"] = e.what();
            res.set_content(j.dump(), "text/json");
        }
    });
    if (!prom_config.default_path.empty()) {
        _logger->info("enabling prometheus metrics on: {}", prom_config.default_path);
        _svr.Get(prom_config.default_path.c_str(), [&]([[maybe_unused]] const httplib::Request &req, httplib::Response &res) {
            try {
                std::stringstream output;
                spdlog::stopwatch sw;
                _metrics->to_prometheus(output, _prom_labels);
                _logger->debug("prometheus output elapsed time: {}", sw);
                res.set_content(output.str(), "text/plain; version=0.0.4");
            } catch (const std::exception &e) {
                res.status = 500;
                res.set_content(e.what(), "text/plain");
            }
        });
    }
}

}
