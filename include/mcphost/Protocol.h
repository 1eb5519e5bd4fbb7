//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP method names, protocol constants and the tool description type shared by all transports
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {

// MCP protocol version constants
namespace ProtocolVersions {
    // Known-good version used when a server rejects the configured one
    constexpr const char* Fallback = "2024-11-05";
    constexpr const char* Default = "2024-11-05";
}

// MCP method names
namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* ListToolsDotted = "tools.list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
}

// Names of the tools synthesized for servers that only expose resources
namespace SyntheticTools {
    constexpr const char* ResourcesList = "resources_list";
    constexpr const char* ResourceRead = "resource_read";
}

//==========================================================================================================
// ToolInfo
// Purpose: One tool as reported by a server's discovery call. inputSchema is passed through verbatim.
//==========================================================================================================
struct ToolInfo {
    std::string name;
    std::string description;
    JSONValue inputSchema;
};

//==========================================================================================================
// ToolInfosFromArray
// Purpose: Converts a "tools" array from a tools/list result into ToolInfo entries. Entries without a
//          string name are skipped. inputSchema (or legacy input_schema) is copied as-is; a tool without
//          one gets a null schema.
//==========================================================================================================
std::vector<ToolInfo> ToolInfosFromArray(const JSONValue::Array& tools);

//==========================================================================================================
// MakeResourceTools
// Purpose: Builds the two generic tools that stand in for a resources-only server.
//==========================================================================================================
std::vector<ToolInfo> MakeResourceTools(const std::string& serverName);

} // namespace mcphost
