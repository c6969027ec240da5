/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#define CPPHTTPLIB_OPENSSL_SUPPORT
#ifdef __GNUC__
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
#include <httplib.h>
#ifdef __GNUC__
#pragma GCC diagnostic pop
#endif
#include <spdlog/spdlog.h>

namespace flowvisor {

using namespace httplib;

struct HttpConfig {
    bool tls_enabled{false};
    std::string cert;
    std::string key;
};

class HttpServer
{
    std::unique_ptr<httplib::Server> _svr;

public:
    explicit HttpServer(const HttpConfig &config)
    {
        if (config.tls_enabled) {
            _svr = std::make_unique<httplib::SSLServer>(config.cert.c_str(), config.key.c_str());
            if (!_svr->is_valid()) {
                throw std::runtime_error("invalid TLS configuration: cert " + config.cert + ", key " + config.key);
            }
        } else {
            _svr = std::make_unique<httplib::Server>();
        }
        _svr->set_socket_options(std::bind(&HttpServer::socket_options, this, std::placeholders::_1));
    }

    inline void socket_options(socket_t sock)
    {
        int yes = 1;
        setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<void *>(&yes), sizeof(yes));
    }

    void set_logger(Logger logger)
    {
        _svr->set_logger(std::move(logger));
    }

    bool bind_to_port(const char *host, int port, int socket_flags = 0)
    {
        return _svr->bind_to_port(host, port, socket_flags);
    }

    // binds an ephemeral port, returns it or -1
    int bind_to_any_port(const char *host, int socket_flags = 0)
    {
        return _svr->bind_to_any_port(host, socket_flags);
    }

    bool listen_after_bind()
    {
        return _svr->listen_after_bind();
    }

    void stop()
    {
        _svr->stop();
    }

    Server &Get(const char *pattern, Server::Handler handler)
    {
        if (auto logger = spdlog::get("flowvisor")) {
            logger->info("Registering GET {}", pattern);
        }
        return _svr->Get(pattern, handler);
    }

    bool is_running() const
    {
        return _svr->is_running();
    }
};
}
