//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Connects to one MCP server, lists its tools and optionally calls one
//==========================================================================================================
//
// Usage:
//   mcp_ping --config="transport=subprocess; command=/usr/bin/my-server; args=--stdio" [--name=srv]
//            [--call=<tool>] [--args={"key":"value"}] [--debug=1]
//==========================================================================================================

#include "logging/Logger.h"
#include "mcphost/ToolHost.h"
#include "mcphost/version.h"
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

using namespace mcphost;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--config")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos) {
            std::string k = a.substr(0, eq);
            std::string v = a.substr(eq + 1);
            if (k == key) {
                return v;
            }
        }
    }
    return std::nullopt;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);

    auto config = getArgValue(argc, argv, "--config");
    if (!config) {
        std::cerr << "usage: mcp_ping --config=<descriptor config> [--name=<server>] [--call=<tool>] "
                     "[--args=<json object>] [--debug=1]" << std::endl;
        return 2;
    }
    const std::string name = getArgValue(argc, argv, "--name").value_or("server");

    HostOptions options;
    options.clientName = "mcp_ping";
    options.clientVersion = getVersionString();
    ApplyEnvironmentOverrides(options);
    if (auto dbg = getArgValue(argc, argv, "--debug")) {
        options.debug = (*dbg == "1" || *dbg == "true");
    }

    JSONValue arguments(JSONValue::Object{});
    if (auto raw = getArgValue(argc, argv, "--args")) {
        try {
            arguments = ParseJSON(*raw);
        } catch (const std::runtime_error& e) {
            LOG_ERROR("--args is not valid JSON: {}", e.what());
            return 2;
        }
    }

    ToolHost host(options);
    try {
        host.AddServer(ServerDescriptorFactory::Create(name, *config));
    } catch (const std::invalid_argument& e) {
        LOG_ERROR("Invalid server config: {}", e.what());
        return 2;
    }

    ConnectReport report = host.ConnectAll().get();
    for (const auto& f : report.failures) {
        LOG_ERROR("Connect failed [{}] {}: {}", f.kind, f.server, f.message);
    }
    if (report.succeeded == 0) {
        return 1;
    }

    for (const auto& status : host.GetServerStatus()) {
        std::cout << status.name << ": " << status.serverName << " " << status.serverVersion
                  << " (protocol " << status.protocolVersion << ", "
                  << (status.handshakeStrategy ? HandshakeStrategyName(*status.handshakeStrategy) : "-")
                  << ")" << std::endl;
    }
    for (const auto& rec : host.GetToolCatalog()) {
        std::cout << "  " << rec.id << "  " << rec.description << std::endl;
    }

    int rc = 0;
    if (auto tool = getArgValue(argc, argv, "--call")) {
        JSONValue result = host.CallTool(name, *tool, std::move(arguments)).get();
        std::cout << SerializeJSON(result) << std::endl;
        if (result.Find("error") != nullptr && result.Find("kind") != nullptr) {
            rc = 1;
        }
    }

    host.DisconnectAll().get();
    return rc;
}
