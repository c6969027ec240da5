/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#include "LineSource.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fmt/format.h>
#include <poll.h>
#include <unistd.h>

namespace flowvisor::input::line {

static constexpr size_t READ_CHUNK_SIZE = 4096;

FdLineSource::FdLineSource(int fd, bool owns_fd, std::string description)
    : _fd(fd)
    , _owns_fd(owns_fd)
    , _description(std::move(description))
{
    if (pipe(_wakeup) == -1) {
        throw LineSourceException(fmt::format("unable to create wakeup pipe: {}", std::strerror(errno)));
    }
    fcntl(_wakeup[0], F_SETFD, FD_CLOEXEC);
    fcntl(_wakeup[1], F_SETFD, FD_CLOEXEC);
}

FdLineSource::~FdLineSource()
{
    ::close(_wakeup[0]);
    ::close(_wakeup[1]);
    if (_owns_fd && _fd >= 0) {
        ::close(_fd);
    }
}

void FdLineSource::close()
{
    // write(2) is async-signal-safe
    char b{0};
    [[maybe_unused]] auto r = ::write(_wakeup[1], &b, 1);
}

bool FdLineSource::read_line(std::string &line)
{
    while (true) {
        auto nl = _buffer.find('\n');
        if (nl != std::string::npos) {
            line.assign(_buffer, 0, nl);
            _buffer.erase(0, nl + 1);
            return true;
        }
        if (_eof) {
            // trailing line without a terminator
            if (_buffer.empty()) {
                return false;
            }
            line.swap(_buffer);
            _buffer.clear();
            return true;
        }

        struct pollfd fds[2];
        fds[0] = {_fd, POLLIN, 0};
        fds[1] = {_wakeup[0], POLLIN, 0};
        if (poll(fds, 2, -1) == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw LineSourceException(fmt::format("{}: poll failed: {}", _description, std::strerror(errno)));
        }
        if (fds[1].revents) {
            // closed: drop whatever is buffered
            _buffer.clear();
            _eof = true;
            return false;
        }
        if (!fds[0].revents) {
            continue;
        }

        char chunk[READ_CHUNK_SIZE];
        auto n = ::read(_fd, chunk, sizeof(chunk));
        if (n == -1) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            throw LineSourceException(fmt::format("{}: read failed: {}", _description, std::strerror(errno)));
        }
        if (n == 0) {
            _eof = true;
            continue;
        }
        _buffer.append(chunk, static_cast<size_t>(n));
    }
}

}
