//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolHost.h
// Purpose: Server registry, session lifecycle and tool dispatch over every configured MCP server
//==========================================================================================================

#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/HostOptions.h"
#include "mcphost/InteractionLog.h"
#include "mcphost/ServerDescriptor.h"
#include "mcphost/ToolCatalog.h"
#include "mcphost/TransportError.h"
#include "mcphost/TransportFactory.h"

namespace mcphost {

enum class SessionState {
    Connecting,
    Ready,
    Closed
};

const char* SessionStateName(SessionState state);

//==========================================================================================================
// ServerStatus
// Purpose: Point-in-time view of one registered server.
//==========================================================================================================
struct ServerStatus {
    std::string name;
    std::string description;
    TransportKind transport{TransportKind::Subprocess};
    bool enabled{true};
    bool connected{false};
    std::optional<SessionState> state;
    std::size_t toolCount{0};
    std::optional<std::string> lastErrorKind;
    std::optional<std::string> lastError;

    // Capabilities summary
    bool supportsResources{false};
    std::optional<std::size_t> resourceCount;
    bool isRemote{false};
    std::string url;

    // From the handshake
    std::string serverName;
    std::string serverVersion;
    std::string protocolVersion;
    std::optional<HandshakeStrategy> handshakeStrategy;
    std::size_t reinitializations{0};
};

struct ConnectFailure {
    std::string server;
    std::string kind;
    std::string message;
};

struct ConnectReport {
    std::size_t attempted{0};
    std::size_t succeeded{0};
    std::size_t failed{0};
    std::vector<ConnectFailure> failures;
};

//==========================================================================================================
// ToolHost
// Purpose: Owns the event loop, the worker pool, the sessions and the tool catalog.
// Behavior:
//   - ConnectAll() connects every enabled server concurrently; one server's failure never affects another.
//   - CallTool()/CallToolById() never fail the future for call-time problems; they yield
//     {"error", "kind", "server", "tool"} (plus "diagnostics" in debug mode).
//   - HTTP sessions get exactly one close-reinitialize-retry after any failed call (timeouts, HTTP
//     status, decode and JSON-RPC errors alike); a failed reinitialize closes the session and drops
//     its tools.
//   - Calls on one session are strictly sequential.
// Notes:
//   Futures must not be waited on from inside the host's own event loop.
//==========================================================================================================
class ToolHost {
public:
    explicit ToolHost(HostOptions options = HostOptions(), TransportFactory factory = DefaultTransportFactory());
    ~ToolHost();

    ToolHost(const ToolHost&) = delete;
    ToolHost& operator=(const ToolHost&) = delete;

    ///////////////////////////////////////////// Registry /////////////////////////////////////////////
    // Throws std::invalid_argument for invalid descriptors and duplicate names.
    void AddServer(ServerDescriptor descriptor);
    // Disconnects first; throws std::invalid_argument for unknown names.
    std::future<void> RemoveServer(const std::string& name);
    std::vector<std::string> GetServerNames() const;

    //////////////////////////////////////////// Lifecycle ////////////////////////////////////////////
    std::future<ConnectReport> ConnectAll();
    // Reconnects when already connected; throws std::invalid_argument for unknown names.
    std::future<ConnectReport> ConnectServer(const std::string& name);
    std::future<void> DisconnectServer(const std::string& name);
    std::future<void> DisconnectAll();

    ///////////////////////////////////////////// Dispatch /////////////////////////////////////////////
    std::vector<ToolRecord> GetToolCatalog() const;
    std::future<JSONValue> CallTool(const std::string& server, const std::string& tool, JSONValue arguments);
    std::future<JSONValue> CallToolById(const std::string& id, JSONValue arguments);

    std::vector<ServerStatus> GetServerStatus() const;
    const InteractionLog& Interactions() const;
    const HostOptions& Options() const;

    // Builds the structured error value returned by failed calls.
    static JSONValue MakeErrorResult(const std::string& server, const std::string& tool, ErrorKind kind,
                                     const std::string& message,
                                     const std::optional<std::string>& diagnostics = std::nullopt);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphost
