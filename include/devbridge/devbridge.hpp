// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#pragma once

/// @file devbridge.hpp
/// @brief Master include for devbridge
///
/// This header includes all public API headers for convenience.
/// You can also include individual headers for finer-grained control.

#include <devbridge/bridge.hpp>
#include <devbridge/commands.hpp>
#include <devbridge/config.hpp>
#include <devbridge/errors.hpp>
#include <devbridge/jsonrpc.hpp>
#include <devbridge/logging.hpp>
#include <devbridge/process.hpp>
#include <devbridge/rpc_client.hpp>
#include <devbridge/transport.hpp>
#include <devbridge/transport_stdio.hpp>
#include <devbridge/transport_tcp.hpp>
#include <devbridge/types.hpp>

namespace devbridge
{

/// Library version string
inline constexpr const char* kVersion = "0.1.0";

} // namespace devbridge
