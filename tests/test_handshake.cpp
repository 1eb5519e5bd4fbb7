//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_handshake.cpp
// Purpose: Tests for the initialize strategy loop against a scripted channel
//==========================================================================================================

#include <gtest/gtest.h>

#include <deque>
#include <functional>
#include <string>
#include <vector>

#include "TestSupport.h"
#include "mcphost/HandshakeNegotiator.h"
#include "mcphost/TransportError.h"

using namespace mcphost;
using mcphost::testing::RunAwaitable;

namespace {

using Reply = std::function<std::optional<JSONRPCResponse>(const std::vector<JSONRPCRequest>&)>;

class ScriptedChannel : public IHandshakeChannel {
public:
    net::awaitable<std::optional<JSONRPCResponse>> Exchange(std::vector<JSONRPCRequest> requests,
                                                           std::chrono::milliseconds timeout) override {
        batches.push_back(requests);
        timeouts.push_back(timeout);
        if (replies.empty()) {
            co_return std::nullopt;
        }
        Reply next = std::move(replies.front());
        replies.pop_front();
        co_return next(requests);
    }

    net::awaitable<void> Notify(JSONRPCNotification notification) override {
        notifications.push_back(notification.method);
        co_return;
    }

    std::string DiagnosticText() const override { return "stderr tail"; }

    std::deque<Reply> replies;
    std::vector<std::vector<JSONRPCRequest>> batches;
    std::vector<std::chrono::milliseconds> timeouts;
    std::vector<std::string> notifications;
};

JSONRPCResponse success(const std::string& version) {
    JSONRPCResponse r;
    r.id = static_cast<int64_t>(1);
    r.result = MakeObject({
        {"protocolVersion", JSONValue(version)},
        {"capabilities", MakeObject({{"tools", JSONValue(JSONValue::Object{})}})},
        {"serverInfo", MakeObject({{"name", JSONValue("fake")}, {"version", JSONValue("2.0")}})}
    });
    return r;
}

JSONRPCResponse failure(int code, const std::string& message) {
    JSONRPCResponse r;
    r.id = static_cast<int64_t>(1);
    r.error = CreateErrorObject(code, message);
    return r;
}

std::string requestedVersion(const JSONRPCRequest& req) {
    return req.params ? GetStringMember(*req.params, "protocolVersion").value_or("") : "";
}

HandshakeSettings settings(const std::string& version = "2025-06-18") {
    HandshakeSettings s;
    s.protocolVersion = version;
    s.fallbackVersion = "2024-11-05";
    s.clientName = "test-host";
    s.clientVersion = "9.9";
    s.modernTimeout = std::chrono::milliseconds(100);
    s.compatTimeout = std::chrono::milliseconds(200);
    s.legacyTimeout = std::chrono::milliseconds(50);
    return s;
}

const std::vector<HandshakeStrategy> kAll{HandshakeStrategy::Modern, HandshakeStrategy::Compat,
                                          HandshakeStrategy::LegacyMinimal};

} // namespace

TEST(HandshakeTest, ModernSuccessSendsInitializedOnce) {
    ScriptedChannel ch;
    ch.replies.push_back([](const auto& reqs) { return success(requestedVersion(reqs[0])); });
    HandshakeNegotiator neg(ch, settings());

    HandshakeResult r = RunAwaitable(neg.Negotiate(kAll));
    EXPECT_EQ(r.strategy, HandshakeStrategy::Modern);
    EXPECT_EQ(r.protocolVersion, "2025-06-18");
    EXPECT_EQ(r.serverName, "fake");
    EXPECT_EQ(r.serverVersion, "2.0");
    EXPECT_NE(r.capabilities.Find("tools"), nullptr);
    EXPECT_FALSE(r.rawResponse.empty());

    ASSERT_EQ(ch.batches.size(), 1u);
    ASSERT_EQ(ch.batches[0].size(), 1u);
    const JSONRPCRequest& init = ch.batches[0][0];
    EXPECT_EQ(init.method, "initialize");
    const JSONValue* info = init.params->Find("clientInfo");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(GetStringMember(*info, "name").value_or(""), "test-host");
    EXPECT_EQ(ch.timeouts[0], std::chrono::milliseconds(100));
    ASSERT_EQ(ch.notifications.size(), 1u);
    EXPECT_EQ(ch.notifications[0], "notifications/initialized");
}

TEST(HandshakeTest, VersionRejectionRetriesWithFallbackVersionOnce) {
    ScriptedChannel ch;
    ch.replies.push_back([](const auto&) { return failure(JSONRPCErrorCodes::InvalidParams, "Unsupported protocol version"); });
    ch.replies.push_back([](const auto& reqs) { return success(requestedVersion(reqs[0])); });
    HandshakeNegotiator neg(ch, settings());

    HandshakeResult r = RunAwaitable(neg.Negotiate(kAll));
    EXPECT_EQ(r.strategy, HandshakeStrategy::Modern);
    EXPECT_EQ(r.protocolVersion, "2024-11-05");
    ASSERT_EQ(ch.batches.size(), 2u);
    EXPECT_EQ(requestedVersion(ch.batches[0][0]), "2025-06-18");
    EXPECT_EQ(requestedVersion(ch.batches[1][0]), "2024-11-05");
}

TEST(HandshakeTest, SilentModernFallsThroughToCompatBatch) {
    ScriptedChannel ch;
    ch.replies.push_back([](const auto&) { return std::optional<JSONRPCResponse>(); });
    ch.replies.push_back([](const auto& reqs) { return success(requestedVersion(reqs[0])); });
    HandshakeNegotiator neg(ch, settings("2024-11-05"));

    HandshakeResult r = RunAwaitable(neg.Negotiate(kAll));
    EXPECT_EQ(r.strategy, HandshakeStrategy::Compat);
    ASSERT_EQ(ch.batches.size(), 2u);
    EXPECT_EQ(ch.batches[1].size(), 3u);
    EXPECT_EQ(ch.timeouts[1], std::chrono::milliseconds(200));
    EXPECT_EQ(ch.notifications.size(), 1u);
}

TEST(HandshakeTest, AllStrategiesFailingRaisesHandshakeFailureWithLastResponse) {
    ScriptedChannel ch;
    for (int i = 0; i < 3; ++i) {
        ch.replies.push_back([](const auto&) { return failure(JSONRPCErrorCodes::InternalError, "boom"); });
    }
    HandshakeNegotiator neg(ch, settings("2024-11-05"));

    try {
        RunAwaitable(neg.Negotiate(kAll));
        FAIL() << "expected HandshakeFailure";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::HandshakeFailure);
        ASSERT_TRUE(e.RawResponse().has_value());
        EXPECT_NE(e.RawResponse()->find("boom"), std::string::npos);
        EXPECT_EQ(e.Diagnostics().value_or(""), "stderr tail");
    }
    EXPECT_EQ(ch.batches.size(), 3u);
    EXPECT_TRUE(ch.notifications.empty());
}

TEST(HandshakeTest, ProcessExitAbortsRemainingStrategies) {
    ScriptedChannel ch;
    ch.replies.push_back([](const auto&) -> std::optional<JSONRPCResponse> {
        throw TransportError(ErrorKind::ProcessExited, "child exited");
    });
    HandshakeNegotiator neg(ch, settings());

    try {
        RunAwaitable(neg.Negotiate(kAll));
        FAIL() << "expected HandshakeFailure";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::HandshakeFailure);
        EXPECT_NE(std::string(e.what()).find("child exited"), std::string::npos);
    }
    EXPECT_EQ(ch.batches.size(), 1u);
}

TEST(HandshakeTest, SkipStrategySendsNothing) {
    ScriptedChannel ch;
    HandshakeNegotiator neg(ch, settings());

    HandshakeResult r = RunAwaitable(neg.Negotiate({HandshakeStrategy::Skip}));
    EXPECT_EQ(r.strategy, HandshakeStrategy::Skip);
    EXPECT_TRUE(ch.batches.empty());
    EXPECT_TRUE(ch.notifications.empty());
}

TEST(HandshakeTest, VersionRejectionDetection) {
    EXPECT_TRUE(HandshakeNegotiator::IsVersionRejection(failure(JSONRPCErrorCodes::InvalidParams, "bad")));
    EXPECT_TRUE(HandshakeNegotiator::IsVersionRejection(failure(-32000, "Unsupported Version")));
    EXPECT_FALSE(HandshakeNegotiator::IsVersionRejection(failure(-32000, "boom")));
    EXPECT_FALSE(HandshakeNegotiator::IsVersionRejection(success("2024-11-05")));
}
