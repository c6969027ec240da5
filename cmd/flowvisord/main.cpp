/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include <csignal>
#include <functional>
#include <future>
#include <iostream>
#include <map>
#include <optional>
#include <thread>

#include "CoreServer.h"
#include "FlowEnricher.h"
#include "GeoDB.h"
#include "NetworkInterfaceScan.h"
#include "flowvisor_config.h"
#include "handlers/flow/FlowStreamHandler.h"
#include "inputs/line/CollectorProcess.h"
#include "inputs/line/LineInputStream.h"
#include <docopt/docopt.h>
#include <fmt/ranges.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/syslog_sink.h>
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <yaml-cpp/yaml.h>

static const char USAGE[] =
    R"(flowvisord.
    Usage:
      flowvisord [options]
      flowvisord (-h | --help)
      flowvisord --version

    flowvisord runs a flow collector (pmacctd in JSON print mode by default), enriches every flow record it
    prints with GeoIP country and ASN information for the remote peer, classifies the flow as inbound or
    outbound relative to this host, and exposes cumulative byte and packet counters for Prometheus on /metrics.

    Lines from the collector which are not flow records are passed through to standard output.

    Base Options:
      -h --help                             Show this screen
      -v                                    Verbose log output, including every enriched flow
      --version                             Show version
    Web Server Options:
      -l HOST                               Run web server on the given host or IP (default: localhost)
      -p PORT                               Run web server on the given port (default: 9590)
      --tls                                 Enable TLS on the web server
      --tls-cert FILE                       Use given TLS cert. Required if --tls is enabled.
      --tls-key FILE                        Use given TLS private key. Required if --tls is enabled.
    Geo Options:
      --geo-city FILE                       GeoLite2 City database to use for IP to Geo mapping
      --geo-asn FILE                        GeoLite2 ASN database to use for IP to ASN mapping
    Local Address Options:
      -H ADDRS                              Additional addresses (comma separated) to consider local to this host.
                                            Example: "10.0.1.5,2001:db8::5"
      --no-iface-scan                       Do not use the addresses of the network interfaces of this host
    Input Options:
      --collector-cmd CMD                   Collector command line to run, split on whitespace
                                            (default: pmacctd -r 1 -c src_host,dst_host -P print -O json)
      --stdin                               Read collector output from standard input instead of running a collector
    Configuration:
      --config FILE                         Use specified YAML configuration to configure options
    Logging Options:
      --log-file FILE                       Log to the given output file name
      --syslog                              Log to syslog
    Prometheus Options:
      --prom-instance ID                    Optionally set the 'instance' label to given ID
)";

namespace {
std::function<void(int)> shutdown_handler;
void signal_handler(int signal)
{
    shutdown_handler(signal);
}

class ConfigException : public std::runtime_error
{
public:
    explicit ConfigException(const std::string &msg)
        : std::runtime_error(msg)
    {
    }
};
}

using namespace flowvisor;

struct CmdOptions {
    bool syslog{false};
    bool verbose{false};
    bool no_iface_scan{false};
    bool read_stdin{false};
    std::optional<std::string> log_file;
    std::optional<std::string> prom_instance;
    std::optional<std::string> geo_city;
    std::optional<std::string> geo_asn;
    std::optional<std::string> host_addresses;
    std::optional<std::string> collector_cmd;

    struct WebServer {
        bool tls_support{false};
        std::optional<unsigned int> port;
        std::optional<std::string> host;
        std::optional<std::string> tls_cert;
        std::optional<std::string> tls_key;
    };
    WebServer web_server;
};

void fill_cmd_options(std::map<std::string, docopt::value> args, CmdOptions &options)
{
    YAML::Node config;
    // local config file
    if (args["--config"]) {
        auto file_name = args["--config"].asString();
        YAML::Node config_file;
        try {
            config_file = YAML::LoadFile(file_name);
        } catch (const YAML::Exception &e) {
            throw ConfigException(fmt::format("{} in config file: {}", e.what(), file_name));
        }
        if (!config_file.IsMap() || !config_file["flowvisor"]) {
            throw ConfigException(fmt::format("invalid schema in config file: {}", file_name));
        }
        if (!config_file["version"] || !config_file["version"].IsScalar() || config_file["version"].as<std::string>() != "1.0") {
            throw ConfigException(fmt::format("missing or unsupported version in config file: {}", file_name));
        }
        if (config_file["flowvisor"]["config"]) {
            if (!config_file["flowvisor"]["config"].IsMap()) {
                throw ConfigException(fmt::format("flowvisor.config must be a map in config file: {}", file_name));
            }
            config = config_file["flowvisor"]["config"];
        }
    }

    try {
        options.verbose = (config["verbose"] && config["verbose"].as<bool>()) || args["-v"].asBool();
        options.syslog = (config["syslog"] && config["syslog"].as<bool>()) || args["--syslog"].asBool();
        options.no_iface_scan = (config["no_iface_scan"] && config["no_iface_scan"].as<bool>()) || args["--no-iface-scan"].asBool();
        options.read_stdin = (config["stdin"] && config["stdin"].as<bool>()) || args["--stdin"].asBool();

        if (args["--log-file"]) {
            options.log_file = args["--log-file"].asString();
        } else if (config["log_file"]) {
            options.log_file = config["log_file"].as<std::string>();
        }

        if (args["--prom-instance"]) {
            options.prom_instance = args["--prom-instance"].asString();
        } else if (config["prom_instance"]) {
            options.prom_instance = config["prom_instance"].as<std::string>();
        }

        if (args["--geo-city"]) {
            options.geo_city = args["--geo-city"].asString();
        } else if (config["geo_city"]) {
            options.geo_city = config["geo_city"].as<std::string>();
        } else {
            options.geo_city = "";
        }

        if (args["--geo-asn"]) {
            options.geo_asn = args["--geo-asn"].asString();
        } else if (config["geo_asn"]) {
            options.geo_asn = config["geo_asn"].as<std::string>();
        } else {
            options.geo_asn = "";
        }

        if (args["-H"]) {
            options.host_addresses = args["-H"].asString();
        } else if (config["host_addresses"]) {
            if (config["host_addresses"].IsSequence()) {
                options.host_addresses = fmt::format("{}", fmt::join(config["host_addresses"].as<std::vector<std::string>>(), ","));
            } else {
                options.host_addresses = config["host_addresses"].as<std::string>();
            }
        }

        if (args["--collector-cmd"]) {
            options.collector_cmd = args["--collector-cmd"].asString();
        } else if (config["collector_cmd"]) {
            options.collector_cmd = config["collector_cmd"].as<std::string>();
        } else {
            options.collector_cmd = input::line::CollectorProcess::DEFAULT_COMMAND;
        }

        options.web_server.tls_support = (config["tls"] && config["tls"].as<bool>()) || args["--tls"].asBool();

        if (args["-p"]) {
            options.web_server.port = static_cast<unsigned int>(args["-p"].asLong());
        } else if (config["port"]) {
            options.web_server.port = config["port"].as<unsigned int>();
        } else {
            options.web_server.port = 9590;
        }

        if (args["-l"]) {
            options.web_server.host = args["-l"].asString();
        } else if (config["host"]) {
            options.web_server.host = config["host"].as<std::string>();
        } else {
            options.web_server.host = "localhost";
        }

        if (args["--tls-cert"]) {
            options.web_server.tls_cert = args["--tls-cert"].asString();
        } else if (config["tls_cert"]) {
            options.web_server.tls_cert = config["tls_cert"].as<std::string>();
        }

        if (args["--tls-key"]) {
            options.web_server.tls_key = args["--tls-key"].asString();
        } else if (config["tls_key"]) {
            options.web_server.tls_key = config["tls_key"].as<std::string>();
        }
    } catch (const YAML::Exception &e) {
        throw ConfigException(fmt::format("invalid option in config file: {}", e.what()));
    } catch (const std::invalid_argument &e) {
        // docopt asLong() on a non-numeric value
        throw ConfigException(fmt::format("invalid numeric option: {}", e.what()));
    }

    if (options.web_server.port.value() > 65535) {
        throw ConfigException(fmt::format("invalid port: {}", options.web_server.port.value()));
    }
}

LocalAddressSet load_local_addresses(const CmdOptions &options, std::shared_ptr<spdlog::logger> logger)
{
    LocalAddressSet local;
    if (!options.no_iface_scan) {
        local.merge(local_interface_addresses());
    }
    if (options.host_addresses.has_value()) {
        for (const auto &spec : lib::utils::split_str_to_vec_str(options.host_addresses.value(), ',')) {
            if (spec.empty()) {
                continue;
            }
            auto ip = lib::utils::IpAddress::parse(spec);
            if (!ip) {
                throw ConfigException(fmt::format("invalid local address: {}", spec));
            }
            local.add(*ip);
        }
    }
    if (local.empty()) {
        logger->warn("no local addresses: every flow will be unattributed");
    } else {
        logger->info("local addresses: {}", fmt::join(local.to_strings(), ", "));
    }
    return local;
}

int main(int argc, char *argv[])
{
    std::map<std::string, docopt::value> args = docopt::docopt(USAGE,
        {argv + 1, argv + argc},
        true,               // show help if requested
        FLOWVISOR_VERSION); // version string

    CmdOptions options;
    try {
        fill_cmd_options(args, options);
    } catch (const ConfigException &e) {
        std::cerr << e.what() << std::endl;
        exit(EXIT_FAILURE);
    }

    std::shared_ptr<spdlog::logger> logger;
    spdlog::flush_on(spdlog::level::err);
    try {
        if (options.log_file.has_value()) {
            logger = spdlog::basic_logger_mt("flowvisor", options.log_file.value());
            spdlog::flush_every(std::chrono::seconds(3));
        } else if (options.syslog) {
            logger = spdlog::syslog_logger_mt("flowvisor", "flowvisord", LOG_PID, LOG_DAEMON);
        } else {
            // stdout carries the collector's pass-through lines
            logger = spdlog::stderr_color_mt("flowvisor");
        }
    } catch (const spdlog::spdlog_ex &ex) {
        std::cerr << "Log init failed: " << ex.what() << std::endl;
        exit(EXIT_FAILURE);
    }
    if (options.verbose) {
        logger->set_level(spdlog::level::debug);
    }

    logger->info("{} starting up", FLOWVISOR_VERSION);

    geo::MaxmindDB geo_city(geo::MaxmindDB::Type::Geo);
    geo::MaxmindDB geo_asn(geo::MaxmindDB::Type::Asn);
    try {
        if (!options.geo_city.value().empty()) {
            geo_city.enable(options.geo_city.value());
            logger->info("using city database {}", options.geo_city.value());
        } else {
            logger->warn("no city database configured, country labels will be empty");
        }
        if (!options.geo_asn.value().empty()) {
            geo_asn.enable(options.geo_asn.value());
            logger->info("using ASN database {}", options.geo_asn.value());
        } else {
            logger->warn("no ASN database configured, asn labels will be empty");
        }
    } catch (const std::exception &e) {
        logger->error("Fatal error: {}", e.what());
        exit(EXIT_FAILURE);
    }

    LocalAddressSet local;
    try {
        local = load_local_addresses(options, logger);
    } catch (const std::exception &e) {
        logger->error(e.what());
        logger->info("exit with failure");
        exit(EXIT_FAILURE);
    }

    PeerResolver resolver(geo_city.enabled() ? &geo_city : nullptr, geo_asn.enabled() ? &geo_asn : nullptr);
    FlowEnricher enricher(resolver, local);
    handler::flow::FlowMetricsManager metrics;

    PrometheusConfig prom_config;
    if (options.prom_instance.has_value()) {
        prom_config.instance_label = options.prom_instance.value();
    }

    HttpConfig http_config;
    if (options.web_server.tls_support) {
        http_config.tls_enabled = true;
        if (!options.web_server.tls_key.has_value() || !options.web_server.tls_cert.has_value()) {
            logger->error("you must specify --tls-key and --tls-cert to use --tls");
            exit(EXIT_FAILURE);
        }
        http_config.key = options.web_server.tls_key.value();
        http_config.cert = options.web_server.tls_cert.value();
        logger->info("Enabling TLS with cert {} and key {}", http_config.cert, http_config.key);
    }

    std::unique_ptr<CoreServer> svr;
    try {
        svr = std::make_unique<CoreServer>(&metrics, logger, http_config, prom_config);
    } catch (const std::exception &e) {
        logger->error(e.what());
        logger->info("exit with failure");
        exit(EXIT_FAILURE);
    }
    svr->set_http_logger([&logger](const auto &req, const auto &res) {
        logger->debug("REQUEST: {} {} {}", req.method, req.path, res.status);
        if (res.status == 500) {
            logger->error(res.body);
        }
    });

    auto host = options.web_server.host.value();
    auto port = options.web_server.port.value();

    // the web server runs on its own thread, the main thread waits for the input to end
    std::promise<std::string> server_result;
    auto server_done = server_result.get_future();
    std::thread server_thread([&] {
        try {
            svr->start(host, port);
            server_result.set_value(std::string());
        } catch (const std::exception &e) {
            server_result.set_value(e.what());
        }
    });
    while (!svr->running()) {
        if (server_done.wait_for(std::chrono::milliseconds(10)) == std::future_status::ready) {
            server_thread.join();
            logger->error(server_done.get());
            logger->info("exit with failure");
            exit(EXIT_FAILURE);
        }
    }

    std::unique_ptr<input::line::CollectorProcess> collector;
    std::unique_ptr<input::line::LineSource> source;
    try {
        if (options.read_stdin) {
            source = std::make_unique<input::line::FdLineSource>(STDIN_FILENO, false, "stdin");
        } else {
            collector = std::make_unique<input::line::CollectorProcess>(input::line::CollectorProcess::split_command(options.collector_cmd.value()));
            collector->spawn();
            source = std::make_unique<input::line::FdLineSource>(collector->release_stdout(), true, "collector " + collector->command());
        }
    } catch (const std::exception &e) {
        logger->error(e.what());
        svr->stop();
        server_thread.join();
        logger->info("exit with failure");
        exit(EXIT_FAILURE);
    }

    input::line::LineInputStream input(options.read_stdin ? "stdin" : "collector", std::move(source));
    auto proxy = static_cast<input::line::LineEventProxy *>(input.add_event_proxy());

    std::promise<void> input_ended;
    proxy->end_of_stream_signal.connect([&input_ended] {
        input_ended.set_value();
    });
    proxy->diagnostic_line_signal.connect([](const std::string &line) {
        std::cout << line << std::endl;
    });

    handler::flow::FlowStreamHandler flow_handler("flow", proxy, enricher, &metrics);
    flow_handler.start();
    svr->add_module(&input);
    svr->add_module(&flow_handler);

    volatile std::sig_atomic_t shutdown_requested{0};
    shutdown_handler = [&](int signal) {
        shutdown_requested = signal;
        if (collector) {
            // the collector flushes and exits, its stdout closes and the input sees end of stream
            collector->interrupt(SIGINT);
        } else {
            input.close_source();
        }
    };
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    input.start();
    input_ended.get_future().wait();

    if (shutdown_requested) {
        logger->info("Shutting down on signal {}", static_cast<int>(shutdown_requested));
    }

    input.stop();
    flow_handler.stop();

    int exit_code = EXIT_SUCCESS;
    if (collector) {
        auto status = collector->wait();
        if (status != 0 && !shutdown_requested) {
            logger->error("collector exited unexpectedly with status {}", status);
            exit_code = EXIT_FAILURE;
        }
    }

    svr->stop();
    server_thread.join();
    if (auto error = server_done.get(); !error.empty()) {
        logger->error(error);
        exit_code = EXIT_FAILURE;
    }

    logger->info("processed {} lines, {} flow records", input.line_count(), metrics.records().value());
    logger->info(exit_code == EXIT_SUCCESS ? "exit with success" : "exit with failure");
    logger->flush();
    return exit_code;
}
