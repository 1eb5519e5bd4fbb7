//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Common tool transport contract and the request/response channel used during handshakes
//==========================================================================================================

#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <boost/asio/awaitable.hpp>

#include "mcphost/JSONRPCTypes.h"
#include "mcphost/Protocol.h"
#include "mcphost/ServerDescriptor.h"

namespace mcphost {

namespace net = boost::asio;

//==========================================================================================================
// HandshakeResult
// Purpose: Outcome of a successful initialize exchange (or of the skip strategy).
// Fields:
//   strategy: Strategy that succeeded.
//   protocolVersion: Version reported by the server, or the version sent when the server omitted it.
//   serverName/serverVersion: serverInfo fields when present.
//   capabilities: Server capability map ({} when absent).
//   rawResponse: JSON text of the initialize response (empty for skip).
//==========================================================================================================
struct HandshakeResult {
    HandshakeStrategy strategy{HandshakeStrategy::Skip};
    std::string protocolVersion;
    std::string serverName;
    std::string serverVersion;
    JSONValue capabilities;
    std::string rawResponse;
};

//==========================================================================================================
// IHandshakeChannel
// Purpose: Minimal request/response surface the HandshakeNegotiator drives.
//==========================================================================================================
class IHandshakeChannel {
public:
    virtual ~IHandshakeChannel() = default;

    //======================================================================================================
    // Exchange
    // Purpose: Sends every request back-to-back (ids are assigned by the channel), then waits for answers.
    // Returns:
    //   The first successful response; otherwise the last error response once every request has been
    //   answered or the timeout elapsed; std::nullopt when nothing matching arrived in time.
    // Throws:
    //   TransportError for process exit, HTTP, connection and decode failures.
    //======================================================================================================
    virtual net::awaitable<std::optional<JSONRPCResponse>> Exchange(std::vector<JSONRPCRequest> requests,
                                                                     std::chrono::milliseconds timeout) = 0;

    // Sends a notification; no response is expected.
    virtual net::awaitable<void> Notify(JSONRPCNotification notification) = 0;

    // Captured diagnostic text (stderr tail) for error reports; empty when unavailable.
    virtual std::string DiagnosticText() const = 0;
};

//==========================================================================================================
// IToolTransport
// Purpose: Uniform contract over subprocess, SDK-delegate and HTTP tool servers.
// Notes:
//   Methods are sequential per instance; callers must not overlap them. Failures are TransportError.
//==========================================================================================================
class IToolTransport {
public:
    virtual ~IToolTransport() = default;

    // Establishes the channel and completes the handshake.
    virtual net::awaitable<HandshakeResult> Initialize() = 0;

    // Discovers the server's tools in server order.
    virtual net::awaitable<std::vector<ToolInfo>> ListTools() = 0;

    // Invokes one tool and returns the JSON-RPC result object verbatim.
    virtual net::awaitable<JSONValue> CallTool(std::string name, JSONValue arguments,
                                               std::chrono::milliseconds timeout) = 0;

    // Releases the process or connection. Safe to call more than once.
    virtual net::awaitable<void> Close() = 0;

    virtual TransportKind Kind() const = 0;
    virtual std::string DiagnosticText() const = 0;

    // True when the catalog for this server was synthesized from resources/list.
    virtual bool ResourceMode() const { return false; }
    // Number of resources seen by the last resources/list, when known.
    virtual std::optional<std::size_t> ResourceCount() const { return std::nullopt; }
};

} // namespace mcphost
