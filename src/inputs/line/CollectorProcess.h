/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <csignal>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <string>
#include <sys/types.h>
#include <vector>

namespace flowvisor::input::line {

class CollectorException : public std::runtime_error
{
public:
    explicit CollectorException(const std::string &msg)
        : std::runtime_error(msg)
    {
    }
};

/**
 * Runs the external flow collector (pmacctd in JSON print mode) as a child process with its stdout on a pipe.
 * stderr is inherited.
 */
class CollectorProcess
{
    std::vector<std::string> _argv;
    pid_t _pid{-1};
    int _stdout_fd{-1};
    std::shared_ptr<spdlog::logger> _logger;

public:
    inline static const std::string DEFAULT_COMMAND = "pmacctd -r 1 -c src_host,dst_host -P print -O json";

    explicit CollectorProcess(std::vector<std::string> argv);
    ~CollectorProcess();

    CollectorProcess(const CollectorProcess &) = delete;
    CollectorProcess &operator=(const CollectorProcess &) = delete;

    /**
     * split a command line on whitespace, no shell quoting
     */
    static std::vector<std::string> split_command(const std::string &command);

    /**
     * fork and exec the collector, searching PATH
     * @throws CollectorException if the pipe, fork or exec fails
     */
    void spawn();

    /**
     * hand the read end of the collector's stdout to the caller, who then owns it
     */
    int release_stdout();

    /**
     * send a signal to the collector; async-signal-safe
     */
    void interrupt(int signal = SIGINT) const;

    /**
     * reap the collector
     * @return its exit code, or 128 + signal number if it was killed
     */
    int wait();

    bool running() const
    {
        return _pid > 0;
    }

    pid_t pid() const
    {
        return _pid;
    }

    std::string command() const;
};

}
