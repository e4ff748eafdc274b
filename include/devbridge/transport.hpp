// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

#include <algorithm>
#include <cstddef>
#include <devbridge/errors.hpp>
#include <string>
#include <vector>

namespace devbridge
{

// =============================================================================
// Transport Interface
// =============================================================================

/// Abstract interface for raw byte I/O transport
///
/// Implementations provide the underlying byte stream (process pipes, TCP
/// sockets). The transport is responsible for reading/writing raw bytes;
/// framing is handled separately by LineFramer.
class ITransport
{
  public:
    virtual ~ITransport() = default;

    /// Read up to `size` bytes into buffer
    /// @param buffer Destination buffer
    /// @param size Maximum bytes to read
    /// @return Number of bytes actually read (0 indicates EOF)
    /// @throws TransportError on read failure
    /// @throws TimeoutError if no data arrived within the read bound
    virtual size_t read(char* buffer, size_t size) = 0;

    /// Write all bytes to the transport
    /// @param data Source data
    /// @param size Number of bytes to write
    /// @throws TransportError on write failure
    virtual void write(const char* data, size_t size) = 0;

    /// Close the transport
    virtual void close() = 0;

    /// Wake a read or write blocked on another thread without releasing the
    /// underlying handle (no-op where the medium cannot be interrupted)
    virtual void shutdown() {}

    /// Check if transport is open
    virtual bool is_open() const = 0;

    // Convenience overload
    void write(const std::string& data)
    {
        write(data.data(), data.size());
    }
};

// =============================================================================
// Newline Message Framer
// =============================================================================

/// Reads and writes newline-delimited messages over an ITransport
///
/// Message format:
/// ```
/// <json-rpc-message>\n
/// ```
///
/// Bytes after a newline stay buffered for the next read_line().
class LineFramer
{
  public:
    /// Upper bound on a single line, so a peer that never sends a newline
    /// cannot grow the buffer without limit
    static constexpr size_t kMaxLineSize = 16 * 1024 * 1024;

    explicit LineFramer(ITransport& transport) : transport_(transport) {}

    /// Read one line
    /// @return The line without its terminating "\n" (a trailing "\r" is removed)
    /// @throws ConnectionClosedError if the stream ends before a newline
    /// @throws TransportError on read failure or an oversized line
    std::string read_line();

    /// Write a message followed by "\n" unless it already ends with one
    /// @throws TransportError on write failure
    void write_line(const std::string& message);

    /// Drop any buffered bytes
    void reset()
    {
        buffer_pos_ = 0;
        buffer_len_ = 0;
    }

  private:
    ITransport& transport_;
    std::vector<char> buffer_;
    size_t buffer_pos_ = 0;
    size_t buffer_len_ = 0;

    /// Refill the buffer; returns false on EOF
    bool fill_buffer();
};

// =============================================================================
// Inline implementations
// =============================================================================

inline std::string LineFramer::read_line()
{
    std::string line;

    while (true)
    {
        if (buffer_pos_ >= buffer_len_)
        {
            if (!fill_buffer())
            {
                throw ConnectionClosedError(
                    line.empty() ? "Connection closed" : "Connection closed while reading message"
                );
            }
        }

        auto begin = buffer_.begin() + static_cast<std::ptrdiff_t>(buffer_pos_);
        auto end = buffer_.begin() + static_cast<std::ptrdiff_t>(buffer_len_);
        auto newline = std::find(begin, end, '\n');

        line.append(begin, newline);
        buffer_pos_ = static_cast<size_t>(newline - buffer_.begin());

        if (line.size() > kMaxLineSize)
            throw TransportError("Message exceeds " + std::to_string(kMaxLineSize) + " bytes");

        if (newline != end)
        {
            ++buffer_pos_; // consume '\n'
            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            return line;
        }
    }
}

inline void LineFramer::write_line(const std::string& message)
{
    if (!message.empty() && message.back() == '\n')
        transport_.write(message);
    else
        transport_.write(message + "\n");
}

inline bool LineFramer::fill_buffer()
{
    constexpr size_t kMinBufferSize = 4096;
    if (buffer_.size() < kMinBufferSize)
        buffer_.resize(kMinBufferSize);

    buffer_pos_ = 0;
    buffer_len_ = transport_.read(buffer_.data(), buffer_.size());
    return buffer_len_ > 0;
}

} // namespace devbridge
