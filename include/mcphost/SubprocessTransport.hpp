//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SubprocessTransport.hpp
// Purpose: Tool transport over a child process's stdin/stdout with tolerant discovery
//==========================================================================================================

#pragma once

#include <memory>

#include <boost/asio/thread_pool.hpp>

#include "mcphost/HostOptions.h"
#include "mcphost/Transport.h"

namespace mcphost {

//==========================================================================================================
// SubprocessTransport
// Purpose: Launches the descriptor's command, frames JSON-RPC on its pipes and drains its stderr.
// Behavior:
//   - Blocking pipe operations run on the supplied thread pool; coroutines resume on their own executor.
//   - Every request carries a fresh integer id; responses with unknown ids (late answers to timed-out
//     requests, surplus compat replies) are discarded. Server-initiated messages are skipped, and
//     server requests are answered (ping with {}, anything else with MethodNotFound).
//   - ListTools tries tools/list and tools.list with params {}, omitted, {"cursor":null} and
//     {"cursor":""}, follows nextCursor, and falls back to resources/list, exposing resources_list and
//     resource_read when the server only offers resources.
//==========================================================================================================
class SubprocessTransport : public IToolTransport, public IHandshakeChannel {
public:
    SubprocessTransport(ServerDescriptor descriptor, HostOptions options, net::thread_pool& pool);
    ~SubprocessTransport() override;

    SubprocessTransport(const SubprocessTransport&) = delete;
    SubprocessTransport& operator=(const SubprocessTransport&) = delete;

    ////////////////////////////////////////// IToolTransport //////////////////////////////////////////
    net::awaitable<HandshakeResult> Initialize() override;
    net::awaitable<std::vector<ToolInfo>> ListTools() override;
    net::awaitable<JSONValue> CallTool(std::string name, JSONValue arguments,
                                       std::chrono::milliseconds timeout) override;
    net::awaitable<void> Close() override;
    TransportKind Kind() const override { return TransportKind::Subprocess; }
    std::string DiagnosticText() const override;
    bool ResourceMode() const override;
    std::optional<std::size_t> ResourceCount() const override;

    //////////////////////////////////////// IHandshakeChannel ////////////////////////////////////////
    net::awaitable<std::optional<JSONRPCResponse>> Exchange(std::vector<JSONRPCRequest> requests,
                                                             std::chrono::milliseconds timeout) override;
    net::awaitable<void> Notify(JSONRPCNotification notification) override;

    //==========================================================================================================
    // Start
    // Purpose: Launches the process and the stderr drain without handshaking. Initialize() calls it; it is
    //          public so delegating transports can reuse an already-configured instance.
    //==========================================================================================================
    net::awaitable<void> Start();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphost
