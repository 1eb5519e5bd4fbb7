//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Multi-server host demo: registers servers, connects them, and dispatches by tool id
//==========================================================================================================
//
// Each server is given as `<name>: <descriptor config>`, either with a repeated --server option or one per
// line of a --servers file (blank lines and '#' comments skipped):
//   files: transport=subprocess; command=/usr/local/bin/files-server; framing=raw
//   web:   transport=http; url=https://tools.example.com/mcp; token=abc123
//
// Usage:
//   mcphost_demo [--server="<name>: <config>" ...] [--servers=<file>] [--call-id=<tool id>]
//                [--args=<json object>] [--log-file=<path>]
//==========================================================================================================

#include "logging/Logger.h"
#include "mcphost/ToolHost.h"
#include "mcphost/version.h"
#include <fstream>
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
//   key: Key string including leading dashes (e.g., "--servers")
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

static std::string trim(const std::string& s) {
    const auto b = s.find_first_not_of(" \t\r");
    if (b == std::string::npos) {
        return std::string();
    }
    const auto e = s.find_last_not_of(" \t\r");
    return s.substr(b, e - b + 1);
}

//==========================================================================================================
// addServer
// Purpose: Registers one `<name>: <config>` entry. Entries that fail validation are logged and skipped.
// Returns:
//   true when the server was registered
//==========================================================================================================
static bool addServer(ToolHost& host, const std::string& entry, const std::string& origin) {
    const auto colon = entry.find(':');
    if (colon == std::string::npos) {
        LOG_WARN("{}: expected `<name>: <config>`", origin);
        return false;
    }
    const std::string name = trim(entry.substr(0, colon));
    try {
        host.AddServer(ServerDescriptorFactory::Create(name, trim(entry.substr(colon + 1))));
        return true;
    } catch (const std::invalid_argument& e) {
        LOG_WARN("{}: skipping {}: {}", origin, name, e.what());
        return false;
    }
}

static std::size_t loadServersFile(ToolHost& host, const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_ERROR("Cannot open servers file: {}", path);
        return 0;
    }
    std::size_t added = 0;
    std::string line;
    std::size_t lineNo = 0;
    while (std::getline(in, line)) {
        ++lineNo;
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        added += addServer(host, line, path + ":" + std::to_string(lineNo)) ? 1 : 0;
    }
    return added;
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    Logger::setLogLevel(LogLevel::LOG_INFO_LEVEL);
    if (auto logFile = getArgValue(argc, argv, "--log-file")) {
        Logger::setLogFile(*logFile);
    }

    HostOptions options;
    options.clientName = "mcphost_demo";
    options.clientVersion = getVersionString();
    ApplyEnvironmentOverrides(options);

    ToolHost host(options);
    std::size_t registered = 0;
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a.rfind("--server=", 0) == 0) {
            registered += addServer(host, a.substr(9), "--server") ? 1 : 0;
        }
    }
    if (auto serversFile = getArgValue(argc, argv, "--servers")) {
        registered += loadServersFile(host, *serversFile);
    }
    if (registered == 0) {
        std::cerr << "usage: mcphost_demo [--server=\"<name>: <config>\" ...] [--servers=<file>] "
                     "[--call-id=<tool id>] [--args=<json object>]" << std::endl;
        return 2;
    }

    ConnectReport report = host.ConnectAll().get();
    LOG_INFO("Connected {}/{} servers", report.succeeded, report.attempted);
    for (const auto& f : report.failures) {
        LOG_WARN("  {} failed ({}): {}", f.server, f.kind, f.message);
    }

    std::cout << "Servers:" << std::endl;
    for (const auto& s : host.GetServerStatus()) {
        std::cout << "  " << s.name << " [" << TransportKindName(s.transport) << "] "
                  << (s.enabled ? (s.connected ? "connected" : "disconnected") : "disabled")
                  << ", tools=" << s.toolCount;
        if (s.supportsResources) {
            std::cout << ", resources=" << s.resourceCount.value_or(0);
        }
        if (s.lastErrorKind) {
            std::cout << ", last error " << *s.lastErrorKind << ": " << s.lastError.value_or("");
        }
        std::cout << std::endl;
    }

    std::cout << "Tools:" << std::endl;
    for (const auto& rec : host.GetToolCatalog()) {
        std::cout << "  " << rec.id << " -> " << rec.server << "/" << rec.tool << std::endl;
    }

    if (auto id = getArgValue(argc, argv, "--call-id")) {
        JSONValue arguments(JSONValue::Object{});
        if (auto raw = getArgValue(argc, argv, "--args")) {
            try {
                arguments = ParseJSON(*raw);
            } catch (const std::runtime_error& e) {
                LOG_ERROR("--args is not valid JSON: {}", e.what());
            }
        }
        JSONValue result = host.CallToolById(*id, std::move(arguments)).get();
        std::cout << SerializeJSON(result) << std::endl;
    }

    for (const auto& [type, count] : host.Interactions().Summary()) {
        LOG_INFO("interactions {}={}", type, count);
    }
    host.DisconnectAll().get();
    return 0;
}
