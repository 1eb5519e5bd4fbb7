//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_subprocess_transport.cpp
// Purpose: End-to-end tests for the stdio subprocess transport against the stub server
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/thread_pool.hpp>

#include "TestSupport.h"
#include "mcphost/SubprocessTransport.hpp"
#include "mcphost/TransportError.h"

using namespace mcphost;
using mcphost::testing::RunAwaitable;
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
    o.closeGrace = 500ms;
    return o;
}

class SubprocessTransportTest : public ::testing::Test {
protected:
    std::unique_ptr<SubprocessTransport> Make(const std::string& name, std::vector<std::string> args,
                                              FramingMode framing = FramingMode::Lsp,
                                              HostOptions options = fastOptions()) {
        return std::make_unique<SubprocessTransport>(StubDescriptor(name, std::move(args), framing),
                                                     std::move(options), pool);
    }

    boost::asio::thread_pool pool{2};
};

std::string firstText(const JSONValue& result) {
    const JSONValue::Array* content = GetArrayMember(result, "content");
    if (!content || content->empty()) {
        return std::string();
    }
    return GetStringMember(*content->front(), "text").value_or(std::string());
}

} // namespace

TEST_F(SubprocessTransportTest, InitializeListAndCallWithContentLengthFraming) {
    auto t = Make("A", {});
    HandshakeResult hs = RunAwaitable(t->Initialize());
    EXPECT_EQ(hs.strategy, HandshakeStrategy::Modern);
    EXPECT_EQ(hs.serverName, "stub");
    EXPECT_EQ(hs.serverVersion, "0.1");

    auto tools = RunAwaitable(t->ListTools());
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "echo");
    EXPECT_EQ(tools[1].name, "add");
    EXPECT_EQ(tools[0].description, "Stub tool echo");
    EXPECT_NE(tools[0].inputSchema.Find("properties"), nullptr);

    JSONValue result = RunAwaitable(t->CallTool("echo", MakeObject({{"value", JSONValue("hi")}}), 3000ms));
    EXPECT_EQ(firstText(result), R"(echo:{"value":"hi"})");
    EXPECT_FALSE(t->ResourceMode());
    RunAwaitable(t->Close());
}

TEST_F(SubprocessTransportTest, NewlineFramingAndBannerNoise) {
    auto t = Make("raw", {"--banner"}, FramingMode::Raw);
    RunAwaitable(t->Initialize());
    auto tools = RunAwaitable(t->ListTools());
    EXPECT_EQ(tools.size(), 2u);
    RunAwaitable(t->Close());
}

TEST_F(SubprocessTransportTest, ServerPingDuringInitializeIsAnswered) {
    auto t = Make("ping", {"--ping-first"});
    HandshakeResult hs = RunAwaitable(t->Initialize());
    EXPECT_EQ(hs.strategy, HandshakeStrategy::Modern);
    RunAwaitable(t->Close());
}

TEST_F(SubprocessTransportTest, VersionRejectionFallsBackToKnownVersion) {
    ServerDescriptor d = StubDescriptor("ver", {"--reject-version=2099-01-01"});
    d.protocolVersion = "2099-01-01";
    SubprocessTransport t(d, fastOptions(), pool);
    HandshakeResult hs = RunAwaitable(t.Initialize());
    EXPECT_EQ(hs.protocolVersion, "2024-11-05");
    RunAwaitable(t.Close());
}

TEST_F(SubprocessTransportTest, PaginatedListingIsConcatenated) {
    auto t = Make("paged", {"--tools=a,b,c,d,e", "--page-size=2"});
    RunAwaitable(t->Initialize());
    auto tools = RunAwaitable(t->ListTools());
    ASSERT_EQ(tools.size(), 5u);
    EXPECT_EQ(tools[4].name, "e");
    RunAwaitable(t->Close());
}

TEST_F(SubprocessTransportTest, UndecodablePageEndsPaginationWithToolsSoFar) {
    HostOptions options = fastOptions();
    options.listTimeout = 500ms;
    auto t = Make("paged", {"--tools=a,b,c,d,e", "--page-size=2", "--garbage-on=tools/list-page"},
                  FramingMode::Lsp, options);
    RunAwaitable(t->Initialize());
    auto tools = RunAwaitable(t->ListTools());
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "a");
    EXPECT_EQ(tools[1].name, "b");
    RunAwaitable(t->Close());
}

TEST_F(SubprocessTransportTest, ResourcesOnlyServerGetsGenericResourceTools) {
    auto t = Make("res", {"--reject-tools-list", "--resources=3"});
    RunAwaitable(t->Initialize());
    auto tools = RunAwaitable(t->ListTools());
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "resources_list");
    EXPECT_EQ(tools[1].name, "resource_read");
    EXPECT_TRUE(t->ResourceMode());
    EXPECT_EQ(t->ResourceCount().value_or(0), 3u);

    JSONValue listed = RunAwaitable(t->CallTool("resources_list", JSONValue(JSONValue::Object{}), 3000ms));
    const JSONValue::Array* resources = GetArrayMember(listed, "resources");
    ASSERT_NE(resources, nullptr);
    EXPECT_EQ(resources->size(), 3u);

    JSONValue read = RunAwaitable(t->CallTool("resource_read", MakeObject({{"uri", JSONValue("stub://resource/1")}}), 3000ms));
    const JSONValue::Array* contents = GetArrayMember(read, "contents");
    ASSERT_NE(contents, nullptr);
    EXPECT_EQ(GetStringMember(*contents->front(), "text").value_or(""), "content of stub://resource/1");

    try {
        RunAwaitable(t->CallTool("resource_read", JSONValue(JSONValue::Object{}), 3000ms));
        FAIL() << "expected ProtocolError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::ProtocolError);
    }
    RunAwaitable(t->Close());
}

TEST_F(SubprocessTransportTest, NoToolsAndNoResourcesIsDiscoveryFailure) {
    auto t = Make("none", {"--reject-tools-list"});
    RunAwaitable(t->Initialize());
    try {
        RunAwaitable(t->ListTools());
        FAIL() << "expected DiscoveryFailure";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::DiscoveryFailure);
        EXPECT_TRUE(e.RawResponse().has_value());
    }
    RunAwaitable(t->Close());
}

TEST_F(SubprocessTransportTest, UndecodableResourceListingIsDiscoveryFailure) {
    HostOptions options = fastOptions();
    options.listTimeout = 300ms;
    auto t = Make("broken", {"--reject-tools-list", "--resources=2", "--garbage-on=resources/list"},
                  FramingMode::Lsp, options);
    RunAwaitable(t->Initialize());
    try {
        RunAwaitable(t->ListTools());
        FAIL() << "expected DiscoveryFailure";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::DiscoveryFailure);
        EXPECT_NE(std::string(e.what()).find("resources/list"), std::string::npos) << e.what();
    }
    EXPECT_FALSE(t->ResourceMode());
    RunAwaitable(t->Close());
}

TEST_F(SubprocessTransportTest, ToolErrorResponseIsProtocolError) {
    auto t = Make("err", {});
    RunAwaitable(t->Initialize());
    try {
        RunAwaitable(t->CallTool("missing", JSONValue(JSONValue::Object{}), 3000ms));
        FAIL() << "expected ProtocolError";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::ProtocolError);
        EXPECT_NE(std::string(e.what()).find("Unknown tool"), std::string::npos);
    }
    RunAwaitable(t->Close());
}

TEST_F(SubprocessTransportTest, ExitDuringCallIsProcessExitedWithStderr) {
    auto t = Make("crash", {"--exit-on-call"});
    RunAwaitable(t->Initialize());
    try {
        RunAwaitable(t->CallTool("echo", JSONValue(JSONValue::Object{}), 3000ms));
        FAIL() << "expected ProcessExited";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::ProcessExited);
        ASSERT_TRUE(e.Diagnostics().has_value());
        EXPECT_NE(e.Diagnostics()->find("exiting on tools/call"), std::string::npos);
    }
    RunAwaitable(t->Close());
}

TEST_F(SubprocessTransportTest, SlowCallTimesOut) {
    auto t = Make("slow", {"--call-delay-ms=1500"});
    RunAwaitable(t->Initialize());
    try {
        RunAwaitable(t->CallTool("echo", JSONValue(JSONValue::Object{}), 200ms));
        FAIL() << "expected Timeout";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::Timeout);
    }
    RunAwaitable(t->Close());
}

TEST_F(SubprocessTransportTest, StderrIsCapturedWithoutBlockingTheServer) {
    // Enough stderr output to fill an undrained pipe several times over
    auto t = Make("noisy", {"--stderr-lines=20000"});
    RunAwaitable(t->Initialize());
    auto tools = RunAwaitable(t->ListTools());
    EXPECT_EQ(tools.size(), 2u);
    const std::string diag = t->DiagnosticText();
    EXPECT_NE(diag.find("stub diagnostic line"), std::string::npos);
    EXPECT_LE(diag.size(), fastOptions().stderrCapacity);
    RunAwaitable(t->Close());
}

TEST_F(SubprocessTransportTest, SilentServerFailsHandshake) {
    HostOptions o = fastOptions();
    o.initializeTimeout = 200ms;
    o.compatTimeout = 200ms;
    o.legacyTimeout = 200ms;
    auto t = Make("mute", {"--silent-initialize"}, FramingMode::Lsp, o);
    try {
        RunAwaitable(t->Initialize());
        FAIL() << "expected HandshakeFailure";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::HandshakeFailure);
    }
    RunAwaitable(t->Close());
}

TEST_F(SubprocessTransportTest, MissingExecutableIsConnectionFailure) {
    ServerDescriptor d = StubDescriptor("ghost");
    d.launch.command = "/nonexistent/mcp-server-binary";
    SubprocessTransport t(d, fastOptions(), pool);
    try {
        RunAwaitable(t.Initialize());
        FAIL() << "expected ConnectionFailed";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::ConnectionFailed);
    }
    RunAwaitable(t.Close());
}
