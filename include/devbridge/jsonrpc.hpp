// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file jsonrpc.hpp
/// @brief Line-delimited JSON-RPC 2.0 message types and codec
///
/// Each message is exactly one newline-terminated line of JSON text. There is
/// no length prefix and no batching. The codec holds no state and performs no
/// I/O.

#include <cstdint>
#include <devbridge/errors.hpp>
#include <devbridge/types.hpp>
#include <optional>
#include <string>

namespace devbridge
{

/// Standard JSON-RPC error codes and the ones the backend defines
enum class JsonRpcErrorCode : int64_t
{
    // Standard JSON-RPC 2.0 errors
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    InternalError = -32603,

    // Backend errors (-32000 to -32099)
    ConfigError = -32000,
    ProjectError = -32001,
    InfraError = -32002,
    DatabaseError = -32003,
    DeployError = -32004,
    SecretsError = -32005,
    DevError = -32006,
    SystemError = -32007,
};

// =============================================================================
// JSON-RPC 2.0 Message Types
// =============================================================================

/// JSON-RPC 2.0 Request
struct JsonRpcRequest
{
    std::string method;
    json params; // null when the call carries no params
    uint64_t id = 0;

    /// Always carries "params" (null when absent) and "id"
    json to_json() const
    {
        return json{{"jsonrpc", kProtocolVersion}, {"method", method}, {"params", params}, {"id", id}};
    }
};

/// JSON-RPC 2.0 Error object
struct JsonRpcErrorObject
{
    int64_t code = 0;
    std::string message;
    json data;

    json to_json() const
    {
        json j = {{"code", code}, {"message", message}};
        if (!data.is_null())
            j["data"] = data;
        return j;
    }

    static JsonRpcErrorObject from_json(const json& j);
};

/// JSON-RPC 2.0 Response
struct JsonRpcResponse
{
    std::optional<json> result;
    std::optional<JsonRpcErrorObject> error;
    std::optional<uint64_t> id;

    json to_json() const
    {
        json j = {{"jsonrpc", kProtocolVersion}};
        if (result)
            j["result"] = *result;
        if (error)
            j["error"] = error->to_json();
        j["id"] = id ? json(*id) : json(nullptr);
        return j;
    }

    /// Build from a parsed JSON value
    /// @throws DecodeError on a non-object or mistyped members
    /// @throws InvalidResponseError if both or neither of result/error are present
    static JsonRpcResponse from_json(const json& j);

    bool is_error() const
    {
        return error.has_value();
    }

    /// Turn an error response into a JsonRpcError, or return the result
    json into_result() const;
};

// =============================================================================
// Codec
// =============================================================================

/// Encode a request as one newline-terminated line
std::string encode_request(const std::string& method, const json& params, uint64_t id);

/// Decode a single response line (trailing "\n" or "\r\n" allowed)
/// @throws DecodeError on malformed JSON or missing/mistyped fields
/// @throws InvalidResponseError if both or neither of result/error are present
JsonRpcResponse decode_response(const std::string& line);

/// Check that a response answers request `expected_id`
/// @throws InvalidResponseError naming both ids on mismatch
void verify_response_id(const JsonRpcResponse& response, uint64_t expected_id);

} // namespace devbridge
