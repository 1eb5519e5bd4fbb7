//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Tool list conversion helpers shared by transports
//==========================================================================================================

#include "mcphost/Protocol.h"
#include "logging/Logger.h"

namespace mcphost {

std::vector<ToolInfo> ToolInfosFromArray(const JSONValue::Array& tools) {
    std::vector<ToolInfo> out;
    out.reserve(tools.size());
    for (const auto& entry : tools) {
        if (!entry || !entry->IsObject()) {
            continue;
        }
        auto name = GetStringMember(*entry, "name");
        if (!name || name->empty()) {
            LOG_DEBUG("Protocol: skipping tool entry without a name");
            continue;
        }
        ToolInfo info;
        info.name = *name;
        info.description = GetStringMember(*entry, "description").value_or(std::string());
        if (const JSONValue* schema = entry->Find("inputSchema")) {
            info.inputSchema = *schema;
        } else if (const JSONValue* legacy = entry->Find("input_schema")) {
            info.inputSchema = *legacy;
        } else {
            info.inputSchema = JSONValue(nullptr);
        }
        out.push_back(std::move(info));
    }
    return out;
}

std::vector<ToolInfo> MakeResourceTools(const std::string& serverName) {
    std::vector<ToolInfo> tools;

    ToolInfo list;
    list.name = SyntheticTools::ResourcesList;
    list.description = "List the resources exposed by server '" + serverName + "'";
    list.inputSchema = MakeObject({
        {"type", JSONValue("object")},
        {"properties", JSONValue(JSONValue::Object{})}
    });
    tools.push_back(std::move(list));

    ToolInfo read;
    read.name = SyntheticTools::ResourceRead;
    read.description = "Read one resource from server '" + serverName + "' by URI";
    read.inputSchema = MakeObject({
        {"type", JSONValue("object")},
        {"properties", MakeObject({
            {"uri", MakeObject({
                {"type", JSONValue("string")},
                {"description", JSONValue("Resource URI as returned by resources_list")}
            })}
        })},
        {"required", MakeArray({JSONValue("uri")})}
    });
    tools.push_back(std::move(read));
    return tools;
}

} // namespace mcphost
