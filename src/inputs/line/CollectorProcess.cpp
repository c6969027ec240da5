/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "CollectorProcess.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <sstream>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <sys/wait.h>
#include <unistd.h>

namespace flowvisor::input::line {

CollectorProcess::CollectorProcess(std::vector<std::string> argv)
    : _argv(std::move(argv))
{
    if (_argv.empty() || _argv.front().empty()) {
        throw CollectorException("empty collector command");
    }
    _logger = spdlog::get("flowvisor");
    if (!_logger) {
        _logger = spdlog::stderr_color_mt("flowvisor");
    }
}

CollectorProcess::~CollectorProcess()
{
    if (_stdout_fd >= 0) {
        close(_stdout_fd);
    }
    if (running()) {
        interrupt(SIGTERM);
        wait();
    }
}

std::vector<std::string> CollectorProcess::split_command(const std::string &command)
{
    std::vector<std::string> argv;
    std::istringstream ss(command);
    std::string word;
    while (ss >> word) {
        argv.push_back(word);
    }
    return argv;
}

std::string CollectorProcess::command() const
{
    return fmt::format("{}", fmt::join(_argv, " "));
}

void CollectorProcess::spawn()
{
    if (running()) {
        throw CollectorException("collector already running");
    }

    int out[2];
    if (pipe(out) == -1) {
        throw CollectorException(fmt::format("pipe() failed: {}", std::strerror(errno)));
    }
    // exec failures are reported back through a close-on-exec pipe: EOF means exec succeeded
    int err[2];
    if (pipe(err) == -1) {
        close(out[0]);
        close(out[1]);
        throw CollectorException(fmt::format("pipe() failed: {}", std::strerror(errno)));
    }
    fcntl(out[0], F_SETFD, FD_CLOEXEC);
    fcntl(err[0], F_SETFD, FD_CLOEXEC);
    fcntl(err[1], F_SETFD, FD_CLOEXEC);

    std::vector<char *> c_argv;
    for (auto &arg : _argv) {
        c_argv.push_back(arg.data());
    }
    c_argv.push_back(nullptr);

    auto pid = fork();
    switch (pid) {
    case -1: {
        auto e = errno;
        close(out[0]);
        close(out[1]);
        close(err[0]);
        close(err[1]);
        throw CollectorException(fmt::format("fork() failed: {}", std::strerror(e)));
    }
    case 0:
        // child: only async-signal-safe calls from here on
        if (dup2(out[1], STDOUT_FILENO) == -1) {
            int e = errno;
            [[maybe_unused]] auto r = write(err[1], &e, sizeof(e));
            _exit(127);
        }
        close(out[1]);
        execvp(c_argv[0], c_argv.data());
        {
            int e = errno;
            [[maybe_unused]] auto r = write(err[1], &e, sizeof(e));
        }
        _exit(127);
    default:
        break;
    }

    close(out[1]);
    close(err[1]);

    int child_errno{0};
    ssize_t n;
    do {
        n = read(err[0], &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    close(err[0]);

    if (n == sizeof(child_errno)) {
        close(out[0]);
        int status;
        waitpid(pid, &status, 0);
        throw CollectorException(fmt::format("unable to run {}: {}", _argv.front(), std::strerror(child_errno)));
    }

    _pid = pid;
    _stdout_fd = out[0];
    _logger->info("collector started with PID {}: {}", _pid, command());
}

int CollectorProcess::release_stdout()
{
    auto fd = _stdout_fd;
    _stdout_fd = -1;
    return fd;
}

void CollectorProcess::interrupt(int signal) const
{
    if (_pid > 0) {
        kill(_pid, signal);
    }
}

int CollectorProcess::wait()
{
    if (!running()) {
        return 0;
    }

    int status{0};
    pid_t r;
    do {
        r = waitpid(_pid, &status, 0);
    } while (r == -1 && errno == EINTR);

    auto pid = _pid;
    _pid = -1;

    if (r == -1) {
        _logger->error("waitpid({}) failed: {}", pid, std::strerror(errno));
        return 1;
    }
    if (WIFEXITED(status)) {
        _logger->info("collector PID {} exited with status {}", pid, WEXITSTATUS(status));
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        _logger->info("collector PID {} killed by signal {}", pid, WTERMSIG(status));
        return 128 + WTERMSIG(status);
    }
    return 1;
}

}
