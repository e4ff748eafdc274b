// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include <devbridge/logging.hpp>
#include <devbridge/rpc_client.hpp>
#include <devbridge/transport_stdio.hpp>
#include <devbridge/transport_tcp.hpp>

namespace devbridge
{

// =============================================================================
// LineRpcClient
// =============================================================================

std::shared_ptr<LineRpcClient::Channel> LineRpcClient::channel() const
{
    std::lock_guard<std::mutex> lock(channel_mutex_);
    return channel_;
}

void LineRpcClient::install(std::shared_ptr<ITransport> writer, std::shared_ptr<ITransport> reader)
{
    auto channel = std::make_shared<Channel>(std::move(writer), std::move(reader));

    std::shared_ptr<Channel> previous;
    {
        std::lock_guard<std::mutex> lock(channel_mutex_);
        previous = std::move(channel_);
        channel_ = std::move(channel);
    }
    if (previous)
    {
        previous->writer->shutdown();
        previous->reader->shutdown();
    }
}

void LineRpcClient::disconnect()
{
    std::shared_ptr<Channel> channel;
    {
        std::lock_guard<std::mutex> lock(channel_mutex_);
        channel = std::move(channel_);
    }
    if (!channel)
        return;

    // Wake any in-flight call; the handles are released once it lets go
    channel->writer->shutdown();
    channel->reader->shutdown();
}

bool LineRpcClient::is_connected() const
{
    return channel() != nullptr;
}

json LineRpcClient::call(const std::string& method, const json& params)
{
    auto channel = this->channel();
    if (!channel)
        throw NotConnectedError();

    const uint64_t id = next_id_++;
    const std::string request = encode_request(method, params, id);
    logger()->debug("RPC request: {}", request.substr(0, request.size() - 1));

    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        channel->writer->write(request);
    }

    std::string line;
    {
        std::lock_guard<std::mutex> lock(read_mutex_);
        line = channel->framer.read_line();
    }
    logger()->debug("RPC response: {}", line);

    auto response = decode_response(line);
    verify_response_id(response, id);
    return response.into_result();
}

// =============================================================================
// StdioRpcClient
// =============================================================================

void StdioRpcClient::connect(WritePipe& input, ReadPipe& output)
{
    auto pipes = std::make_shared<PipeTransport>(input, output, read_timeout_);
    install(pipes, pipes);
}

// =============================================================================
// TcpRpcClient
// =============================================================================

void TcpRpcClient::connect(const std::string& host, uint16_t port)
{
    disconnect();

    address_ = host + ":" + std::to_string(port);
    logger()->info("Connecting to backend service at {}", address_);

    auto writer = std::make_shared<TcpTransport>();
    writer->connect(host, port, timeouts_.connect);
    writer->set_timeouts(timeouts_.read, timeouts_.write);

    std::shared_ptr<TcpTransport> reader = writer->duplicate();
    install(std::move(writer), std::move(reader));

    logger()->info("Connected to backend service at {}", address_);
}

void TcpRpcClient::disconnect()
{
    if (!is_connected())
        return;
    LineRpcClient::disconnect();
    logger()->info("Disconnected from backend service at {}", address_);
}

} // namespace devbridge
