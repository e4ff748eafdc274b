// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <devbridge/jsonrpc.hpp>

#include <limits>

namespace devbridge
{

namespace
{

std::string id_to_string(const std::optional<uint64_t>& id)
{
    return id ? std::to_string(*id) : std::string("null");
}

} // namespace

// =============================================================================
// Message Types
// =============================================================================

JsonRpcErrorObject JsonRpcErrorObject::from_json(const json& j)
{
    if (!j.is_object())
        throw DecodeError("JSON error: \"error\" must be an object");
    if (!j.contains("code") || !j.at("code").is_number_integer())
        throw DecodeError("JSON error: error object is missing an integer \"code\"");
    const json& code = j.at("code");
    if (code.is_number_unsigned() &&
        code.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
        throw DecodeError("JSON error: error \"code\" " + code.dump() + " is out of range");
    if (!j.contains("message") || !j.at("message").is_string())
        throw DecodeError("JSON error: error object is missing a string \"message\"");

    JsonRpcErrorObject err;
    err.code = code.get<int64_t>();
    err.message = j.at("message").get<std::string>();
    if (j.contains("data"))
        err.data = j.at("data");
    return err;
}

JsonRpcResponse JsonRpcResponse::from_json(const json& j)
{
    if (!j.is_object())
        throw DecodeError("JSON error: response must be an object");
    if (!j.contains("jsonrpc") || !j.at("jsonrpc").is_string())
        throw DecodeError("JSON error: response is missing \"jsonrpc\"");

    JsonRpcResponse resp;

    if (j.contains("id") && !j.at("id").is_null())
    {
        const auto& id = j.at("id");
        if (id.is_number_unsigned())
            resp.id = id.get<uint64_t>();
        else
            throw DecodeError("JSON error: response \"id\" must be an unsigned integer");
    }

    if (j.contains("error") && !j.at("error").is_null())
        resp.error = JsonRpcErrorObject::from_json(j.at("error"));

    // A null result next to an error is how some servers spell "no result"
    if (j.contains("result") && !(resp.error && j.at("result").is_null()))
        resp.result = j.at("result");

    if (resp.result && resp.error)
        throw InvalidResponseError("Response has both result and error");
    if (!resp.result && !resp.error)
        throw InvalidResponseError("Response has neither result nor error");

    return resp;
}

json JsonRpcResponse::into_result() const
{
    if (error)
        throw JsonRpcError(error->code, error->message, error->data);
    return *result;
}

// =============================================================================
// Codec
// =============================================================================

std::string encode_request(const std::string& method, const json& params, uint64_t id)
{
    JsonRpcRequest request{method, params, id};
    // dump() escapes control characters, so the line never contains a raw newline.
    // Invalid UTF-8 in params is replaced rather than thrown.
    return request.to_json().dump(-1, ' ', false, json::error_handler_t::replace) + "\n";
}

JsonRpcResponse decode_response(const std::string& line)
{
    std::string text = line;
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
        text.pop_back();

    json j;
    try
    {
        j = json::parse(text);
    }
    catch (const json::parse_error& e)
    {
        throw DecodeError(std::string("JSON error: ") + e.what());
    }

    return JsonRpcResponse::from_json(j);
}

void verify_response_id(const JsonRpcResponse& response, uint64_t expected_id)
{
    if (response.id != expected_id)
    {
        throw InvalidResponseError(
            "Response ID " + id_to_string(response.id) + " doesn't match request ID " +
            std::to_string(expected_id)
        );
    }
}

} // namespace devbridge
