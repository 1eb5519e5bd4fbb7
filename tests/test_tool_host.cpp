//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_host.cpp
// Purpose: Tests for server registration, concurrent connect, catalog aggregation and tool dispatch
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

#include "TestSupport.h"
#include "mcphost/ToolHost.h"

using namespace mcphost;
using mcphost::testing::StubDescriptor;
using namespace std::chrono_literals;

namespace {

HostOptions fastOptions() {
    HostOptions o;
    o.initializeTimeout = 3000ms;
    o.compatTimeout = 3000ms;
    o.legacyTimeout = 1000ms;
    o.listTimeout = 3000ms;
    o.callTimeout = 3000ms;
    o.closeGrace = 300ms;
    return o;
}

std::string firstText(const JSONValue& result) {
    const JSONValue::Array* content = GetArrayMember(result, "content");
    if (!content || content->empty()) {
        return std::string();
    }
    return GetStringMember(*content->front(), "text").value_or(std::string());
}

std::string errorKind(const JSONValue& result) {
    return GetStringMember(result, "kind").value_or(std::string());
}

const ServerStatus* statusOf(const std::vector<ServerStatus>& all, const std::string& name) {
    auto it = std::find_if(all.begin(), all.end(), [&name](const ServerStatus& s) { return s.name == name; });
    return it == all.end() ? nullptr : &*it;
}

ServerDescriptor brokenDescriptor(const std::string& name) {
    ServerDescriptor d = StubDescriptor(name);
    d.launch.command = "/nonexistent/mcp-server";
    return d;
}

} // namespace

TEST(ToolHostTest, RegistrationValidatesAndRejectsDuplicates) {
    ToolHost host(fastOptions());
    host.AddServer(StubDescriptor("A"));
    EXPECT_THROW(host.AddServer(StubDescriptor("A")), std::invalid_argument);

    ServerDescriptor noCommand;
    noCommand.name = "empty";
    EXPECT_THROW(host.AddServer(noCommand), std::invalid_argument);

    EXPECT_EQ(host.GetServerNames(), std::vector<std::string>{"A"});
    EXPECT_THROW(host.ConnectServer("missing"), std::invalid_argument);
}

TEST(ToolHostTest, ConnectAllIsolatesFailuresAndSkipsDisabled) {
    ToolHost host(fastOptions());
    host.AddServer(StubDescriptor("A"));
    host.AddServer(brokenDescriptor("B"));
    ServerDescriptor off = StubDescriptor("C");
    off.enabled = false;
    host.AddServer(off);

    ConnectReport report = host.ConnectAll().get();
    EXPECT_EQ(report.attempted, 2u);
    EXPECT_EQ(report.succeeded, 1u);
    EXPECT_EQ(report.failed, 1u);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].server, "B");
    EXPECT_EQ(report.failures[0].kind, "connection-failed");

    auto catalog = host.GetToolCatalog();
    ASSERT_EQ(catalog.size(), 2u);
    EXPECT_EQ(catalog[0].id, "A_add");
    EXPECT_EQ(catalog[1].id, "A_echo");
    EXPECT_EQ(catalog[1].description, "Stub tool echo");
    EXPECT_NE(catalog[1].inputSchema.Find("properties"), nullptr);

    auto status = host.GetServerStatus();
    ASSERT_EQ(status.size(), 3u);
    const ServerStatus* a = statusOf(status, "A");
    ASSERT_NE(a, nullptr);
    EXPECT_TRUE(a->connected);
    EXPECT_EQ(a->toolCount, 2u);
    EXPECT_EQ(a->serverName, "stub");
    EXPECT_EQ(a->handshakeStrategy, HandshakeStrategy::Modern);
    const ServerStatus* b = statusOf(status, "B");
    ASSERT_NE(b, nullptr);
    EXPECT_FALSE(b->connected);
    EXPECT_EQ(b->lastErrorKind.value_or(""), "connection-failed");
    const ServerStatus* c = statusOf(status, "C");
    ASSERT_NE(c, nullptr);
    EXPECT_FALSE(c->enabled);
    EXPECT_FALSE(c->state.has_value());
}

TEST(ToolHostTest, CallByNameAndById) {
    ToolHost host(fastOptions());
    host.AddServer(StubDescriptor("A"));
    ASSERT_EQ(host.ConnectAll().get().succeeded, 1u);

    JSONValue byName = host.CallTool("A", "echo", MakeObject({{"value", JSONValue("x")}})).get();
    EXPECT_EQ(firstText(byName), R"(echo:{"value":"x"})");
    JSONValue byId = host.CallToolById("A_add", JSONValue(nullptr)).get();
    EXPECT_EQ(firstText(byId), "add:{}");
}

TEST(ToolHostTest, UnknownToolsAndServersYieldStructuredErrors) {
    ToolHost host(fastOptions());
    host.AddServer(StubDescriptor("A"));
    host.ConnectAll().get();

    JSONValue noTool = host.CallTool("A", "nope", JSONValue(JSONValue::Object{})).get();
    EXPECT_EQ(errorKind(noTool), "no-such-tool");
    EXPECT_EQ(GetStringMember(noTool, "server").value_or(""), "A");
    EXPECT_EQ(GetStringMember(noTool, "tool").value_or(""), "nope");
    EXPECT_TRUE(GetStringMember(noTool, "error").has_value());

    EXPECT_EQ(errorKind(host.CallToolById("A_nope", JSONValue(nullptr)).get()), "no-such-tool");
    EXPECT_EQ(errorKind(host.CallTool("Z", "echo", JSONValue(nullptr)).get()), "no-active-session");
}

TEST(ToolHostTest, DisconnectOneServerLeavesOthersUsable) {
    ToolHost host(fastOptions());
    host.AddServer(StubDescriptor("A"));
    host.AddServer(StubDescriptor("B", {}, FramingMode::Raw));
    ASSERT_EQ(host.ConnectAll().get().succeeded, 2u);
    ASSERT_EQ(host.GetToolCatalog().size(), 4u);

    host.DisconnectServer("A").get();
    auto catalog = host.GetToolCatalog();
    ASSERT_EQ(catalog.size(), 2u);
    for (const auto& rec : catalog) {
        EXPECT_EQ(rec.server, "B");
    }
    EXPECT_EQ(errorKind(host.CallTool("A", "echo", JSONValue(nullptr)).get()), "no-active-session");
    EXPECT_EQ(firstText(host.CallToolById("B_echo", JSONValue(nullptr)).get()), "echo:{}");

    // Reconnect restores the same ids
    ASSERT_EQ(host.ConnectServer("A").get().succeeded, 1u);
    EXPECT_EQ(host.GetToolCatalog().size(), 4u);
    EXPECT_EQ(firstText(host.CallToolById("A_echo", JSONValue(nullptr)).get()), "echo:{}");
}

TEST(ToolHostTest, RemoveServerDropsRegistrationAndTools) {
    ToolHost host(fastOptions());
    host.AddServer(StubDescriptor("A"));
    host.AddServer(StubDescriptor("B"));
    host.ConnectAll().get();

    host.RemoveServer("A").get();
    EXPECT_EQ(host.GetServerNames(), std::vector<std::string>{"B"});
    EXPECT_EQ(host.GetToolCatalog().size(), 2u);
    EXPECT_EQ(host.GetServerStatus().size(), 1u);
}

TEST(ToolHostTest, CollidingToolIdsAcrossServersAreDistinct) {
    ToolHost host(fastOptions());
    host.AddServer(StubDescriptor("a_b", {"--tools=c"}));
    host.AddServer(StubDescriptor("a", {"--tools=b_c"}));
    ASSERT_EQ(host.ConnectAll().get().succeeded, 2u);

    auto catalog = host.GetToolCatalog();
    ASSERT_EQ(catalog.size(), 2u);
    EXPECT_NE(catalog[0].id, catalog[1].id);
    const std::size_t cap = host.Options().toolIdCap;
    for (const auto& rec : catalog) {
        // Both servers connect concurrently; neither may keep the shared plain id
        EXPECT_EQ(rec.id, ToolCatalog::HashedId(rec.server, rec.tool, cap));
    }
    for (const auto& rec : catalog) {
        JSONValue r = host.CallToolById(rec.id, JSONValue(nullptr)).get();
        EXPECT_EQ(firstText(r), rec.tool + ":{}");
    }
}

TEST(ToolHostTest, ResourcesOnlyServerIsReportedInStatus) {
    ToolHost host(fastOptions());
    host.AddServer(StubDescriptor("R", {"--reject-tools-list", "--resources=3"}));
    ASSERT_EQ(host.ConnectAll().get().succeeded, 1u);

    auto catalog = host.GetToolCatalog();
    ASSERT_EQ(catalog.size(), 2u);
    EXPECT_EQ(catalog[0].id, "R_resource_read");
    EXPECT_EQ(catalog[1].id, "R_resources_list");

    auto status = host.GetServerStatus();
    const ServerStatus* r = statusOf(status, "R");
    ASSERT_NE(r, nullptr);
    EXPECT_TRUE(r->supportsResources);
    EXPECT_EQ(r->resourceCount.value_or(0), 3u);

    JSONValue read = host.CallToolById("R_resource_read", MakeObject({{"uri", JSONValue("stub://resource/2")}})).get();
    EXPECT_NE(read.Find("contents"), nullptr);
}

TEST(ToolHostTest, ProcessExitDuringCallIsStructuredError) {
    HostOptions debugOptions = fastOptions();
    debugOptions.debug = true;
    ToolHost host(debugOptions);
    host.AddServer(StubDescriptor("X", {"--exit-on-call"}));
    host.ConnectAll().get();

    JSONValue r = host.CallTool("X", "echo", JSONValue(nullptr)).get();
    EXPECT_EQ(errorKind(r), "process-exited");
    ASSERT_TRUE(GetStringMember(r, "diagnostics").has_value());
    EXPECT_NE(GetStringMember(r, "diagnostics")->find("exiting on tools/call"), std::string::npos);
}

TEST(ToolHostTest, DiagnosticsOmittedOutsideDebugMode) {
    ToolHost host(fastOptions());
    host.AddServer(StubDescriptor("X", {"--exit-on-call"}));
    host.ConnectAll().get();

    JSONValue r = host.CallTool("X", "echo", JSONValue(nullptr)).get();
    EXPECT_EQ(errorKind(r), "process-exited");
    EXPECT_EQ(r.Find("diagnostics"), nullptr);
}

TEST(ToolHostTest, ConcurrentCallsOnOneSessionAllComplete) {
    ToolHost host(fastOptions());
    host.AddServer(StubDescriptor("S", {"--call-delay-ms=50"}));
    host.ConnectAll().get();

    std::vector<std::future<JSONValue>> calls;
    for (int i = 0; i < 5; ++i) {
        calls.push_back(host.CallTool("S", "echo", MakeObject({{"value", JSONValue(std::to_string(i))}})));
    }
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(firstText(calls[i].get()), "echo:{\"value\":\"" + std::to_string(i) + "\"}");
    }
}

TEST(ToolHostTest, InteractionsRecordCallsAndConnections) {
    ToolHost host(fastOptions());
    host.AddServer(StubDescriptor("A"));
    host.ConnectAll().get();
    host.CallTool("A", "echo", JSONValue(nullptr)).get();

    const InteractionLog& log = host.Interactions();
    auto calls = log.GetEntries("A", InteractionType::ToolCall);
    ASSERT_EQ(calls.size(), 1u);
    auto responses = log.GetEntries("A", InteractionType::ToolResponse);
    ASSERT_EQ(responses.size(), 1u);
    EXPECT_EQ(calls[0].requestId, responses[0].requestId);
    EXPECT_TRUE(responses[0].durationMs.has_value());
    EXPECT_EQ(log.GetEntries("A", InteractionType::ConnectionSuccess).size(), 1u);
    EXPECT_EQ(log.Summary().at("TOOL_CALL"), 1u);
}
