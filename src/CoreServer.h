/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include "HttpServer.h"
#include "handlers/flow/FlowStreamHandler.h"
#include <atomic>
#include <chrono>
#include <mutex>
#include <spdlog/spdlog.h>
#include <vector>

namespace flowvisor {

struct PrometheusConfig {
    std::string default_path{"/metrics"};
    std::string instance_label;
};

/**
 * The scrape surface: prometheus text on PrometheusConfig::default_path and a JSON status document on
 * /api/v1/metrics/app. Metrics and modules are borrowed and must outlive the server.
 */
class CoreServer
{

    HttpServer _svr;
    const handler::flow::FlowMetricsManager *_metrics;
    mutable std::mutex _module_mutex;
    std::vector<const AbstractModule *> _modules;
    std::atomic<int> _port{-1};
    // added to every series on the prometheus scrape
    Metric::LabelMap _prom_labels;

    std::shared_ptr<spdlog::logger> _logger;
    std::chrono::system_clock::time_point _start_time;

    void _setup_routes(const PrometheusConfig &prom_config);

public:
    CoreServer(const handler::flow::FlowMetricsManager *metrics, std::shared_ptr<spdlog::logger> logger, const HttpConfig &http_config, const PrometheusConfig &prom_config);
    ~CoreServer();

    /**
     * modules whose info_json is reported on the status endpoint
     */
    void add_module(const AbstractModule *module)
    {
        std::unique_lock lock(_module_mutex);
        _modules.push_back(module);
    }

    /**
     * bind and serve until stop(); blocks the calling thread. port 0 binds an ephemeral port.
     * @throws std::runtime_error if the bind or listen fails
     */
    void start(const std::string &host, int port);
    void stop();

    bool running() const
    {
        return _svr.is_running();
    }

    // the bound port, -1 before start()
    int port() const
    {
        return _port;
    }

    void set_http_logger(httplib::Logger logger)
    {
        _svr.set_logger(logger);
    }
};

}
