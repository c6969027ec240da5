/* This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/. */

#pragma once

#include <atomic>
#include <istream>
#include <stdexcept>
#include <string>

namespace flowvisor::input::line {

class LineSourceException : public std::runtime_error
{
public:
    explicit LineSourceException(const std::string &msg)
        : std::runtime_error(msg)
    {
    }
};

/**
 * A blocking source of text lines. read_line() returns false at end of stream, which is also what a reader
 * sees after close() has been called from another thread.
 */
class LineSource
{
public:
    virtual ~LineSource() = default;

    /**
     * read the next line without its terminator
     * @throws LineSourceException on read errors
     */
    virtual bool read_line(std::string &line) = 0;

    virtual void close() = 0;

    virtual std::string description() const = 0;
};

/**
 * Lines from a file descriptor (a collector's stdout pipe, or stdin). A blocked reader is woken by close()
 * through a self-pipe, so close() is safe to call from a signal handler.
 */
class FdLineSource final : public LineSource
{
    int _fd;
    bool _owns_fd;
    int _wakeup[2]{-1, -1};
    std::string _buffer;
    bool _eof{false};
    std::string _description;

public:
    FdLineSource(int fd, bool owns_fd, std::string description);
    ~FdLineSource();

    FdLineSource(const FdLineSource &) = delete;
    FdLineSource &operator=(const FdLineSource &) = delete;

    bool read_line(std::string &line) override;
    void close() override;

    std::string description() const override
    {
        return _description;
    }
};

/**
 * Lines from a std::istream, mostly useful for replaying captured collector output
 */
class StreamLineSource final : public LineSource
{
    std::istream &_stream;
    std::atomic_bool _closed{false};

public:
    explicit StreamLineSource(std::istream &stream)
        : _stream(stream)
    {
    }

    bool read_line(std::string &line) override
    {
        if (_closed) {
            return false;
        }
        return static_cast<bool>(std::getline(_stream, line));
    }

    void close() override
    {
        _closed = true;
    }

    std::string description() const override
    {
        return "stream";
    }
};

}
