// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <devbridge/process.hpp>
#include <devbridge/transport.hpp>
#include <string>

namespace devbridge
{

// =============================================================================
// PipeTransport - Transport adapter for Process pipes
// =============================================================================

/// Transport that wraps Process ReadPipe and WritePipe
///
/// This adapter lets the RPC client talk to a child process over its
/// stdin/stdout. The pipes are owned by the Process, so this transport doesn't
/// close them.
class PipeTransport : public ITransport
{
  public:
    /// Construct from WritePipe (for writing) and ReadPipe (for reading)
    /// @param write_pipe Reference to the process stdin pipe
    /// @param read_pipe Reference to the process stdout pipe
    /// @param read_timeout Bound on each wait for data (0 = wait forever)
    /// @note The pipes must outlive this transport
    PipeTransport(
        WritePipe& write_pipe,
        ReadPipe& read_pipe,
        std::chrono::milliseconds read_timeout = std::chrono::milliseconds{0}
    )
        : write_pipe_(&write_pipe), read_pipe_(&read_pipe), read_timeout_(read_timeout),
          open_(true)
    {
    }

    ~PipeTransport() override
    {
        // Don't close pipes - they're owned by Process
        open_ = false;
    }

    // Non-copyable, non-movable (references to external pipes)
    PipeTransport(const PipeTransport&) = delete;
    PipeTransport& operator=(const PipeTransport&) = delete;
    PipeTransport(PipeTransport&&) = delete;
    PipeTransport& operator=(PipeTransport&&) = delete;

    size_t read(char* buffer, size_t size) override
    {
        if (!open_ || !read_pipe_)
            throw ConnectionClosedError();
        try
        {
            wait_readable();

            size_t bytes_read = read_pipe_->read(buffer, size);
            if (bytes_read == 0)
                open_ = false;
            return bytes_read;
        }
        catch (const ProcessError& e)
        {
            open_ = false;
            throw TransportError(std::string("IO error: ") + e.what());
        }
    }

    void write(const char* data, size_t size) override
    {
        if (!open_ || !write_pipe_)
            throw ConnectionClosedError();
        try
        {
            write_pipe_->write(data, size);
        }
        catch (const ProcessError& e)
        {
            open_ = false;
            throw TransportError(std::string("IO error: ") + e.what());
        }
    }

    void close() override
    {
        open_ = false;
        // Don't close pipes - they're owned by Process
    }

    /// Wakes a blocked read within one poll slice, even if another process
    /// still holds the write end of the pipe
    void shutdown() override
    {
        open_ = false;
    }

    bool is_open() const override
    {
        return open_;
    }

    /// Longest single wait before a blocked read re-checks for shutdown
    static constexpr std::chrono::milliseconds kPollSlice{50};

  private:
    /// Wait until the read pipe is readable, in slices of kPollSlice
    /// @throws ConnectionClosedError if shutdown() is called while waiting
    /// @throws TimeoutError if read_timeout_ elapses first
    void wait_readable()
    {
        using clock = std::chrono::steady_clock;
        const bool bounded = read_timeout_.count() > 0;
        const auto deadline = clock::now() + read_timeout_;

        while (true)
        {
            auto slice = kPollSlice;
            if (bounded)
            {
                auto remaining =
                    std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
                if (remaining.count() <= 0)
                {
                    throw TimeoutError(
                        "No response from backend within " +
                        std::to_string(read_timeout_.count()) + " ms"
                    );
                }
                slice = std::min(slice, remaining);
            }

            if (read_pipe_->has_data(static_cast<int>(slice.count())))
                return;
            if (!open_ || !read_pipe_->is_open())
                throw ConnectionClosedError("Transport shut down while waiting for a response");
        }
    }

    WritePipe* write_pipe_;
    ReadPipe* read_pipe_;
    std::chrono::milliseconds read_timeout_;
    std::atomic<bool> open_;
};

} // namespace devbridge
