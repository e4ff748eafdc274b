// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file rpc_client.hpp
/// @brief Blocking request/response clients over stdio pipes and TCP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <devbridge/jsonrpc.hpp>
#include <devbridge/process.hpp>
#include <devbridge/transport.hpp>
#include <devbridge/types.hpp>
#include <memory>
#include <mutex>
#include <string>

namespace devbridge
{

// =============================================================================
// RPC Client Interface
// =============================================================================

/// One duplex RPC channel to the backend
///
/// Every call is a strict write-then-read pair: one request line out, one
/// response line back. There is no multiplexing; callers that share a client
/// must serialize their calls.
class IRpcClient
{
  public:
    virtual ~IRpcClient() = default;

    /// Call a backend method and wait for its result
    /// @param method Dotted method name, e.g. "config.get"
    /// @param params Parameters (null for none)
    /// @return The response "result" value
    /// @throws NotConnectedError if no channel is installed
    /// @throws TransportError / TimeoutError on I/O failure
    /// @throws DecodeError / InvalidResponseError on protocol violations
    /// @throws JsonRpcError if the backend returned an error object
    virtual json call(const std::string& method, const json& params = nullptr) = 0;

    /// Drop the channel; later calls fail with NotConnectedError
    ///
    /// Safe to call repeatedly and while another thread is inside call().
    virtual void disconnect() = 0;

    virtual bool is_connected() const = 0;

    /// Liveness check ("system.ping" without params)
    json ping()
    {
        return call(kPingMethod);
    }
};

// =============================================================================
// LineRpcClient - shared call path
// =============================================================================

/// Newline-framed JSON-RPC over a writer/reader transport pair
///
/// Writes and reads are guarded by independent mutexes. Request ids start at 1
/// and increase by one per call for the lifetime of the client.
class LineRpcClient : public IRpcClient
{
  public:
    ~LineRpcClient() override = default;

    json call(const std::string& method, const json& params = nullptr) override;
    void disconnect() override;
    bool is_connected() const override;

    /// Id the next call will use
    uint64_t next_id() const
    {
        return next_id_.load();
    }

  protected:
    LineRpcClient() = default;

    /// Install a channel, replacing any previous one
    /// @param writer Transport requests are written to
    /// @param reader Transport responses are read from (may be the same object)
    void install(std::shared_ptr<ITransport> writer, std::shared_ptr<ITransport> reader);

  private:
    struct Channel
    {
        Channel(std::shared_ptr<ITransport> w, std::shared_ptr<ITransport> r)
            : writer(std::move(w)), reader(std::move(r)), framer(*reader)
        {
        }

        std::shared_ptr<ITransport> writer;
        std::shared_ptr<ITransport> reader;
        LineFramer framer;
    };

    std::shared_ptr<Channel> channel() const;

    mutable std::mutex channel_mutex_;
    std::shared_ptr<Channel> channel_;

    std::mutex write_mutex_;
    std::mutex read_mutex_;
    std::atomic<uint64_t> next_id_{1};
};

// =============================================================================
// StdioRpcClient
// =============================================================================

/// RPC client over a child process's stdin (requests) and stdout (responses)
class StdioRpcClient : public LineRpcClient
{
  public:
    /// @param read_timeout Bound on each wait for response bytes (0 = none)
    explicit StdioRpcClient(std::chrono::milliseconds read_timeout = Timeouts{}.read)
        : read_timeout_(read_timeout)
    {
    }

    ~StdioRpcClient() override
    {
        disconnect();
    }

    StdioRpcClient(const StdioRpcClient&) = delete;
    StdioRpcClient& operator=(const StdioRpcClient&) = delete;

    /// Install the process pipes
    /// @param input Pipe to the backend's stdin
    /// @param output Pipe from the backend's stdout
    /// @note The pipes must outlive the connection
    void connect(WritePipe& input, ReadPipe& output);

  private:
    std::chrono::milliseconds read_timeout_;
};

// =============================================================================
// TcpRpcClient
// =============================================================================

/// RPC client over a TCP connection to a long-lived backend service
class TcpRpcClient : public LineRpcClient
{
  public:
    explicit TcpRpcClient(Timeouts timeouts = {}) : timeouts_(timeouts) {}

    ~TcpRpcClient() override
    {
        disconnect();
    }

    TcpRpcClient(const TcpRpcClient&) = delete;
    TcpRpcClient& operator=(const TcpRpcClient&) = delete;

    /// Connect to the backend service
    ///
    /// Disables Nagle, applies the read/write timeouts, and opens a second
    /// handle on the socket so reads and writes are guarded independently.
    /// @throws TimeoutError if the connect timeout elapses
    /// @throws TransportError on any other failure
    void connect(const std::string& host, uint16_t port);

    void disconnect() override;

    const Timeouts& timeouts() const
    {
        return timeouts_;
    }

  private:
    Timeouts timeouts_;
    std::string address_;
};

} // namespace devbridge
