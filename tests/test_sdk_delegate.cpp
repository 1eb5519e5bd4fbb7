//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_sdk_delegate.cpp
// Purpose: Tests for the SDK-delegating transport and its framed-subprocess fallback
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <stdexcept>
#include <string>

#include <boost/asio/thread_pool.hpp>

#include "TestSupport.h"
#include "mcphost/SdkDelegateTransport.hpp"
#include "mcphost/TransportError.h"

using namespace mcphost;
using mcphost::testing::RunAwaitable;
using mcphost::testing::StubDescriptor;
using namespace std::chrono_literals;

namespace {

struct FakeCounters {
    std::atomic<int> created{0};
    std::atomic<int> initializes{0};
    std::atomic<int> lists{0};
    std::atomic<int> calls{0};
    std::atomic<int> closes{0};
};

class FakeSdkClient : public ISdkClient {
public:
    FakeSdkClient(std::shared_ptr<FakeCounters> counters, bool failInitialize, bool failList)
        : counters(std::move(counters)), failInitialize(failInitialize), failList(failList) {}

    HandshakeResult Initialize() override {
        counters->initializes++;
        if (failInitialize) {
            throw std::runtime_error("sdk rejected the handshake");
        }
        HandshakeResult r;
        r.strategy = HandshakeStrategy::Modern;
        r.serverName = "sdk-fake";
        r.protocolVersion = "2024-11-05";
        return r;
    }

    std::vector<ToolInfo> ListTools() override {
        counters->lists++;
        if (failList) {
            throw std::runtime_error("sdk could not list tools");
        }
        ToolInfo t;
        t.name = "sdk_tool";
        t.description = "From the sdk";
        t.inputSchema = MakeObject({{"type", JSONValue("object")}});
        return {t};
    }

    JSONValue CallTool(const std::string& name, const JSONValue&, std::chrono::milliseconds) override {
        counters->calls++;
        return MakeObject({{"called", JSONValue(name)}});
    }

    void Close() override { counters->closes++; }
    std::string DiagnosticText() const override { return "fake sdk diagnostics"; }

private:
    std::shared_ptr<FakeCounters> counters;
    bool failInitialize;
    bool failList;
};

SdkClientFactory fakeFactory(std::shared_ptr<FakeCounters> counters, bool failInitialize, bool failList) {
    return [counters, failInitialize, failList](const ServerDescriptor&, const HostOptions&) {
        counters->created++;
        return std::make_unique<FakeSdkClient>(counters, failInitialize, failList);
    };
}

ServerDescriptor sdkDescriptor(const std::string& name, std::vector<std::string> args = {}) {
    ServerDescriptor d = StubDescriptor(name, std::move(args));
    d.transport = TransportKind::SdkDelegate;
    return d;
}

HostOptions fastOptions() {
    HostOptions o;
    o.initializeTimeout = 3000ms;
    o.listTimeout = 3000ms;
    o.closeGrace = 500ms;
    return o;
}

std::string firstText(const JSONValue& result) {
    const JSONValue::Array* content = GetArrayMember(result, "content");
    if (!content || content->empty()) {
        return std::string();
    }
    return GetStringMember(*content->front(), "text").value_or(std::string());
}

} // namespace

class SdkDelegateTest : public ::testing::Test {
protected:
    boost::asio::thread_pool pool{2};
};

TEST_F(SdkDelegateTest, WorkingClientServesEverything) {
    auto counters = std::make_shared<FakeCounters>();
    SdkDelegateTransport t(sdkDescriptor("sdk"), fastOptions(), pool, fakeFactory(counters, false, false));

    HandshakeResult hs = RunAwaitable(t.Initialize());
    EXPECT_EQ(hs.serverName, "sdk-fake");
    auto tools = RunAwaitable(t.ListTools());
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0].name, "sdk_tool");
    JSONValue r = RunAwaitable(t.CallTool("sdk_tool", JSONValue(nullptr), 1000ms));
    EXPECT_EQ(GetStringMember(r, "called").value_or(""), "sdk_tool");
    EXPECT_FALSE(t.UsingFallback());
    EXPECT_EQ(t.DiagnosticText(), "fake sdk diagnostics");

    RunAwaitable(t.Close());
    EXPECT_EQ(counters->closes.load(), 1);
    EXPECT_EQ(t.DiagnosticText(), "fake sdk diagnostics");
}

TEST_F(SdkDelegateTest, InitializeFailureFallsBackToFramedSubprocess) {
    auto counters = std::make_shared<FakeCounters>();
    SdkDelegateTransport t(sdkDescriptor("sdk"), fastOptions(), pool, fakeFactory(counters, true, false));

    HandshakeResult hs = RunAwaitable(t.Initialize());
    EXPECT_TRUE(t.UsingFallback());
    EXPECT_EQ(hs.serverName, "stub");
    EXPECT_EQ(counters->closes.load(), 1);

    auto tools = RunAwaitable(t.ListTools());
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "echo");
    JSONValue r = RunAwaitable(t.CallTool("add", MakeObject({{"value", JSONValue("1")}}), 3000ms));
    EXPECT_EQ(firstText(r), R"(add:{"value":"1"})");
    EXPECT_EQ(counters->calls.load(), 0);
    RunAwaitable(t.Close());
}

TEST_F(SdkDelegateTest, ListFailureFallsBackToFramedSubprocess) {
    auto counters = std::make_shared<FakeCounters>();
    SdkDelegateTransport t(sdkDescriptor("sdk"), fastOptions(), pool, fakeFactory(counters, false, true));

    RunAwaitable(t.Initialize());
    EXPECT_FALSE(t.UsingFallback());
    auto tools = RunAwaitable(t.ListTools());
    EXPECT_TRUE(t.UsingFallback());
    EXPECT_EQ(tools.size(), 2u);
    EXPECT_EQ(counters->lists.load(), 1);
    RunAwaitable(t.Close());
}

TEST_F(SdkDelegateTest, StrictClientWorksWithWellBehavedServer) {
    SdkDelegateTransport t(sdkDescriptor("strict"), fastOptions(), pool);
    RunAwaitable(t.Initialize());
    auto tools = RunAwaitable(t.ListTools());
    EXPECT_EQ(tools.size(), 2u);
    EXPECT_FALSE(t.UsingFallback());
    JSONValue r = RunAwaitable(t.CallTool("echo", JSONValue(JSONValue::Object{}), 3000ms));
    EXPECT_EQ(firstText(r), "echo:{}");
    RunAwaitable(t.Close());
}

TEST_F(SdkDelegateTest, StrictClientFallsBackOnServerInitiatedTraffic) {
    SdkDelegateTransport t(sdkDescriptor("chatty", {"--ping-first"}), fastOptions(), pool);
    RunAwaitable(t.Initialize());
    EXPECT_TRUE(t.UsingFallback());
    auto tools = RunAwaitable(t.ListTools());
    EXPECT_EQ(tools.size(), 2u);
    RunAwaitable(t.Close());
}
