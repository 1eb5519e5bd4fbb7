//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InteractionLog.cpp
// Purpose: Structured per-server interaction records written through the Logger
//==========================================================================================================

#include <chrono>
#include <ctime>
#include <format>

#include "logging/Logger.h"
#include "mcphost/InteractionLog.h"

namespace mcphost {

namespace {
std::string isoTimestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::tm local{};
    localtime_r(&t, &local);
    return std::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}", local.tm_year + 1900, local.tm_mon + 1,
                       local.tm_mday, local.tm_hour, local.tm_min, local.tm_sec, ms);
}

const char* kTruncatedMarker = "... [truncated]";
} // namespace

const char* InteractionTypeName(InteractionType type) {
    switch (type) {
        case InteractionType::ConnectionAttempt: return "CONNECTION_ATTEMPT";
        case InteractionType::ConnectionSuccess: return "CONNECTION_SUCCESS";
        case InteractionType::ConnectionFailure: return "CONNECTION_FAILURE";
        case InteractionType::ConnectionClosed: return "CONNECTION_CLOSED";
        case InteractionType::ToolCall: return "TOOL_CALL";
        case InteractionType::ToolResponse: return "TOOL_RESPONSE";
        case InteractionType::Error: return "ERROR";
    }
    return "UNKNOWN";
}

JSONValue InteractionEntry::ToValue() const {
    return MakeObject({
        {"timestamp", JSONValue(timestamp)},
        {"server", JSONValue(server)},
        {"type", JSONValue(InteractionTypeName(type))},
        {"request_id", requestId ? JSONValue(*requestId) : JSONValue(nullptr)},
        {"duration_ms", durationMs ? JSONValue(*durationMs) : JSONValue(nullptr)},
        {"data", data}
    });
}

InteractionLog::InteractionLog(std::size_t stringLimit, std::size_t arrayLimit, std::size_t history)
    : stringLimit(stringLimit), arrayLimit(arrayLimit), history(history) {}

JSONValue InteractionLog::Sanitize(const JSONValue& value) const {
    if (std::holds_alternative<std::string>(value.value)) {
        const std::string& s = std::get<std::string>(value.value);
        if (s.size() > stringLimit) {
            return JSONValue(s.substr(0, stringLimit) + kTruncatedMarker);
        }
        return value;
    }
    if (std::holds_alternative<JSONValue::Object>(value.value)) {
        JSONValue::Object out;
        for (const auto& [key, member] : std::get<JSONValue::Object>(value.value)) {
            out[key] = std::make_shared<JSONValue>(member ? Sanitize(*member) : JSONValue(nullptr));
        }
        return JSONValue(out);
    }
    if (std::holds_alternative<JSONValue::Array>(value.value)) {
        JSONValue::Array out;
        for (const auto& item : std::get<JSONValue::Array>(value.value)) {
            if (out.size() >= arrayLimit) {
                break;
            }
            out.push_back(std::make_shared<JSONValue>(item ? Sanitize(*item) : JSONValue(nullptr)));
        }
        return JSONValue(out);
    }
    return value;
}

void InteractionLog::Record(const std::string& server, InteractionType type, const JSONValue& data,
                            std::optional<std::string> requestId, std::optional<double> durationMs) {
    InteractionEntry entry;
    entry.timestamp = isoTimestamp();
    entry.server = server;
    entry.type = type;
    entry.requestId = std::move(requestId);
    entry.durationMs = durationMs;
    entry.data = Sanitize(data);

    LOG_INFO("MCP: {}", SerializeJSON(entry.ToValue()));

    std::lock_guard<std::mutex> lk(mutex);
    entries.push_back(std::move(entry));
    while (entries.size() > history) {
        entries.pop_front();
    }
}

void InteractionLog::ConnectionEvent(const std::string& server, InteractionType type, const std::string& details) {
    Record(server, type, MakeObject({{"details", JSONValue(details)}}));
}

void InteractionLog::ToolCall(const std::string& server, const std::string& tool, const JSONValue& arguments,
                              const std::string& requestId) {
    Record(server, InteractionType::ToolCall,
           MakeObject({{"tool", JSONValue(tool)}, {"arguments", arguments}}), requestId);
}

void InteractionLog::ToolResponse(const std::string& server, const std::string& tool, const JSONValue& result,
                                  const std::string& requestId, double durationMs) {
    Record(server, InteractionType::ToolResponse,
           MakeObject({{"tool", JSONValue(tool)}, {"result", result}}), requestId, durationMs);
}

void InteractionLog::Failure(const std::string& server, const std::string& message, const JSONValue& context) {
    Record(server, InteractionType::Error,
           MakeObject({{"error", JSONValue(message)},
                       {"context", context.IsNull() ? JSONValue(JSONValue::Object{}) : context}}));
}

std::vector<InteractionEntry> InteractionLog::GetEntries(const std::string& server, std::optional<InteractionType> type,
                                                         std::size_t limit) const {
    std::lock_guard<std::mutex> lk(mutex);
    std::vector<InteractionEntry> matched;
    for (auto it = entries.rbegin(); it != entries.rend() && matched.size() < limit; ++it) {
        if (!server.empty() && it->server != server) {
            continue;
        }
        if (type && it->type != *type) {
            continue;
        }
        matched.push_back(*it);
    }
    return std::vector<InteractionEntry>(matched.rbegin(), matched.rend());
}

std::map<std::string, std::size_t> InteractionLog::Summary() const {
    std::lock_guard<std::mutex> lk(mutex);
    std::map<std::string, std::size_t> counts;
    for (const auto& e : entries) {
        counts[InteractionTypeName(e.type)] += 1;
    }
    return counts;
}

void InteractionLog::Clear() {
    std::lock_guard<std::mutex> lk(mutex);
    entries.clear();
}

} // namespace mcphost
