//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPTransport.hpp
// Purpose: JSON-RPC over HTTP POST with a keep-alive connection using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#pragma once

#include <memory>
#include <string>

#include "mcphost/HostOptions.h"
#include "mcphost/Transport.h"

namespace mcphost {

//==========================================================================================================
// HTTPTransport
// Purpose: One POST per JSON-RPC message to the descriptor's URL.
// Behavior:
//   - The connection is kept alive between requests and re-established when the server closed it.
//   - Non-2xx status -> TransportError(HttpStatus); read deadline -> Timeout; resolve/connect/TLS failure
//     -> ConnectionFailed; undecodable body -> DecodeError; JSON-RPC error on a call -> ProtocolError.
//   - Bodies delivered as text/event-stream are accepted; the response is taken from the data: lines.
//   - An Mcp-Session-Id header returned by the server is echoed on later requests.
// Notes:
//   Must be driven from a single executor; the transport does not retry on its own.
//==========================================================================================================
class HTTPTransport : public IToolTransport, public IHandshakeChannel {
public:
    HTTPTransport(ServerDescriptor descriptor, HostOptions options);
    ~HTTPTransport() override;

    HTTPTransport(const HTTPTransport&) = delete;
    HTTPTransport& operator=(const HTTPTransport&) = delete;

    ////////////////////////////////////////// IToolTransport //////////////////////////////////////////
    net::awaitable<HandshakeResult> Initialize() override;
    net::awaitable<std::vector<ToolInfo>> ListTools() override;
    net::awaitable<JSONValue> CallTool(std::string name, JSONValue arguments,
                                       std::chrono::milliseconds timeout) override;
    net::awaitable<void> Close() override;
    TransportKind Kind() const override { return TransportKind::Http; }
    std::string DiagnosticText() const override;

    //////////////////////////////////////// IHandshakeChannel ////////////////////////////////////////
    net::awaitable<std::optional<JSONRPCResponse>> Exchange(std::vector<JSONRPCRequest> requests,
                                                             std::chrono::milliseconds timeout) override;
    net::awaitable<void> Notify(JSONRPCNotification notification) override;

    // Number of TCP connections opened so far
    std::size_t ConnectionCount() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphost
