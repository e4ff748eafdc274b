// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file errors.hpp
/// @brief Exception hierarchy for the bridge layer

#include <cstdint>
#include <exception>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

namespace devbridge
{

/// Classification of bridge failures
enum class ErrorKind
{
    Io,
    Timeout,
    NotConnected,
    NotRunning,
    Decode,
    InvalidResponse,
    Rpc,
    StartFailed,
    Usage,
    Process
};

/// Name of an error kind, e.g. "timeout"
inline const char* to_string(ErrorKind kind);

/// True if an error of this kind means the RPC channel itself is unusable
///
/// NotConnected is not listed here: on its own it is a usage error. The
/// supervisor still demotes on it, since a Running bridge without a connected
/// client is broken.
inline bool is_channel_fatal(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Io:
    case ErrorKind::Timeout:
    case ErrorKind::Decode:
    case ErrorKind::InvalidResponse:
        return true;
    default:
        return false;
    }
}

// =============================================================================
// Base
// =============================================================================

/// Base class for every exception thrown by the bridge layer
class Error : public std::runtime_error
{
  public:
    Error(ErrorKind kind, const std::string& message) : std::runtime_error(message), kind_(kind)
    {
    }

    ErrorKind kind() const
    {
        return kind_;
    }

  private:
    ErrorKind kind_;
};

// =============================================================================
// Transport Exceptions
// =============================================================================

/// Pipe or socket read/write failure
class TransportError : public Error
{
  public:
    explicit TransportError(const std::string& message) : Error(ErrorKind::Io, message) {}

  protected:
    TransportError(ErrorKind kind, const std::string& message) : Error(kind, message) {}
};

/// Peer closed the stream
class ConnectionClosedError : public TransportError
{
  public:
    ConnectionClosedError() : TransportError("Connection closed") {}
    explicit ConnectionClosedError(const std::string& message) : TransportError(message) {}
};

/// Connect, read or write exceeded its bound
class TimeoutError : public TransportError
{
  public:
    explicit TimeoutError(const std::string& message) : TransportError(ErrorKind::Timeout, message)
    {
    }
};

/// Call attempted on a client with no transport installed
class NotConnectedError : public Error
{
  public:
    NotConnectedError() : Error(ErrorKind::NotConnected, "Bridge not connected") {}
};

// =============================================================================
// Protocol Exceptions
// =============================================================================

/// Malformed JSON or a response missing required fields
class DecodeError : public Error
{
  public:
    explicit DecodeError(const std::string& message) : Error(ErrorKind::Decode, message) {}
};

/// Well-formed JSON that violates the response contract (id mismatch,
/// neither or both of result/error)
class InvalidResponseError : public Error
{
  public:
    explicit InvalidResponseError(const std::string& message)
        : Error(ErrorKind::InvalidResponse, "Invalid response: " + message)
    {
    }
};

/// Structured error returned by the backend
///
/// The backend understood the call and rejected it; the channel is healthy.
class JsonRpcError : public Error
{
  public:
    JsonRpcError(int64_t code, const std::string& message, const nlohmann::json& data = nullptr)
        : Error(ErrorKind::Rpc, "RPC error " + std::to_string(code) + ": " + message), code_(code),
          message_(message), data_(data)
    {
    }

    int64_t code() const
    {
        return code_;
    }

    /// Message exactly as the backend sent it
    const std::string& message() const
    {
        return message_;
    }

    const nlohmann::json& data() const
    {
        return data_;
    }

  private:
    int64_t code_;
    std::string message_;
    nlohmann::json data_;
};

// =============================================================================
// Supervisor Exceptions
// =============================================================================

/// Call attempted while the bridge is not Running
class NotRunningError : public Error
{
  public:
    NotRunningError() : Error(ErrorKind::NotRunning, "Bridge not running") {}
};

/// Spawn, connect or liveness check failed during start()
class StartFailedError : public Error
{
  public:
    StartFailedError(const std::string& message, std::exception_ptr cause = nullptr)
        : Error(ErrorKind::StartFailed, "Failed to start bridge: " + message), cause_(cause)
    {
    }

    /// The underlying failure, if one was captured
    std::exception_ptr cause() const
    {
        return cause_;
    }

  private:
    std::exception_ptr cause_;
};

/// Operation not permitted in the current state
class UsageError : public Error
{
  public:
    explicit UsageError(const std::string& message) : Error(ErrorKind::Usage, message) {}
};

/// Exception thrown when process operations fail
class ProcessError : public Error
{
  public:
    explicit ProcessError(const std::string& message) : Error(ErrorKind::Process, message) {}
};

inline const char* to_string(ErrorKind kind)
{
    switch (kind)
    {
    case ErrorKind::Io:
        return "io";
    case ErrorKind::Timeout:
        return "timeout";
    case ErrorKind::NotConnected:
        return "not_connected";
    case ErrorKind::NotRunning:
        return "not_running";
    case ErrorKind::Decode:
        return "decode";
    case ErrorKind::InvalidResponse:
        return "invalid_response";
    case ErrorKind::Rpc:
        return "rpc";
    case ErrorKind::StartFailed:
        return "start_failed";
    case ErrorKind::Usage:
        return "usage";
    case ErrorKind::Process:
        return "process";
    }
    return "unknown";
}

} // namespace devbridge
