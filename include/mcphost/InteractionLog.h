//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InteractionLog.h
// Purpose: Structured per-server interaction records written through the Logger
//==========================================================================================================

#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {

enum class InteractionType {
    ConnectionAttempt,
    ConnectionSuccess,
    ConnectionFailure,
    ConnectionClosed,
    ToolCall,
    ToolResponse,
    Error
};

// CONNECTION_ATTEMPT, TOOL_CALL, ...
const char* InteractionTypeName(InteractionType type);

struct InteractionEntry {
    std::string timestamp; // ISO-8601 local time with milliseconds
    std::string server;
    InteractionType type{InteractionType::Error};
    std::optional<std::string> requestId;
    std::optional<double> durationMs;
    JSONValue data;

    JSONValue ToValue() const;
};

//==========================================================================================================
// InteractionLog
// Purpose: Emits one `MCP: {json}` INFO line per interaction and keeps a bounded in-memory history.
// Notes:
//   Payloads are sanitized before logging: strings longer than stringLimit are cut and suffixed with
//   "... [truncated]", arrays keep their first arrayLimit items. Thread-safe.
//==========================================================================================================
class InteractionLog {
public:
    InteractionLog(std::size_t stringLimit = 1000, std::size_t arrayLimit = 10, std::size_t history = 1000);

    void Record(const std::string& server, InteractionType type, const JSONValue& data,
                std::optional<std::string> requestId = std::nullopt,
                std::optional<double> durationMs = std::nullopt);

    void ConnectionEvent(const std::string& server, InteractionType type, const std::string& details);
    void ToolCall(const std::string& server, const std::string& tool, const JSONValue& arguments,
                  const std::string& requestId);
    void ToolResponse(const std::string& server, const std::string& tool, const JSONValue& result,
                      const std::string& requestId, double durationMs);
    void Failure(const std::string& server, const std::string& message, const JSONValue& context);

    JSONValue Sanitize(const JSONValue& value) const;

    // Most recent `limit` entries matching the filters, oldest first. An empty server matches all.
    std::vector<InteractionEntry> GetEntries(const std::string& server = std::string(),
                                             std::optional<InteractionType> type = std::nullopt,
                                             std::size_t limit = 50) const;

    // Count of retained entries per type name
    std::map<std::string, std::size_t> Summary() const;

    void Clear();

private:
    std::size_t stringLimit;
    std::size_t arrayLimit;
    std::size_t history;
    mutable std::mutex mutex;
    std::deque<InteractionEntry> entries;
};

} // namespace mcphost
