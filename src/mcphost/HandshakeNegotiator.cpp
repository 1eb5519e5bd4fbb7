//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HandshakeNegotiator.cpp
// Purpose: Strategy loop for the MCP initialize exchange
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <format>

#include "logging/Logger.h"
#include "mcphost/HandshakeNegotiator.h"
#include "mcphost/TransportError.h"
#include "mcphost/version.h"

namespace mcphost {

namespace {
std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

JSONValue clientInfo(const std::string& name, const std::string& version) {
    return MakeObject({
        {"name", JSONValue(name)},
        {"version", JSONValue(version.empty() ? getVersionString() : version)}
    });
}

JSONRPCRequest initializeRequest(JSONValue params) {
    return JSONRPCRequest(static_cast<int64_t>(0), Methods::Initialize, std::move(params));
}
} // namespace

HandshakeSettings HandshakeSettings::From(const ServerDescriptor& descriptor, const HostOptions& options) {
    HandshakeSettings s;
    s.protocolVersion = descriptor.protocolVersion.empty() ? std::string(ProtocolVersions::Default)
                                                           : descriptor.protocolVersion;
    s.fallbackVersion = options.fallbackProtocolVersion;
    s.clientName = options.clientName;
    s.clientVersion = options.clientVersion;
    s.modernTimeout = options.initializeTimeout;
    s.compatTimeout = options.compatTimeout;
    s.legacyTimeout = options.legacyTimeout;
    return s;
}

HandshakeNegotiator::HandshakeNegotiator(IHandshakeChannel& channel, HandshakeSettings settings)
    : channel(channel), settings(std::move(settings)) {}

JSONValue HandshakeNegotiator::ModernParams(const std::string& version, const std::string& clientName,
                                            const std::string& clientVersion) {
    return MakeObject({
        {"protocolVersion", JSONValue(version)},
        {"capabilities", JSONValue(JSONValue::Object{})},
        {"clientInfo", clientInfo(clientName, clientVersion)}
    });
}

std::vector<JSONValue> HandshakeNegotiator::CompatParams(const std::string& version, const std::string& clientName,
                                                         const std::string& clientVersion) {
    std::vector<JSONValue> variants;
    variants.push_back(MakeObject({
        {"protocolVersion", JSONValue(version)}
    }));
    variants.push_back(MakeObject({
        {"protocolVersion", JSONValue(version)},
        {"capabilities", JSONValue(JSONValue::Object{})}
    }));
    variants.push_back(MakeObject({
        {"protocolVersion", JSONValue(version)},
        {"capabilities", MakeObject({
            {"roots", MakeObject({{"listChanged", JSONValue(true)}})},
            {"sampling", JSONValue(JSONValue::Object{})}
        })},
        {"clientInfo", clientInfo(clientName, clientVersion)}
    }));
    return variants;
}

JSONValue HandshakeNegotiator::MinimalParams(const std::string& version) {
    return MakeObject({{"protocolVersion", JSONValue(version)}});
}

bool HandshakeNegotiator::IsVersionRejection(const JSONRPCResponse& response) {
    if (!response.IsError()) {
        return false;
    }
    if (response.ErrorCode() == JSONRPCErrorCodes::InvalidParams) {
        return true;
    }
    const std::string msg = toLower(response.ErrorMessage());
    return msg.find("version") != std::string::npos;
}

net::awaitable<std::optional<JSONRPCResponse>> HandshakeNegotiator::attempt(HandshakeStrategy strategy,
                                                                           const std::string& version) {
    std::vector<JSONRPCRequest> requests;
    std::chrono::milliseconds timeout = settings.modernTimeout;
    switch (strategy) {
        case HandshakeStrategy::Modern:
            requests.push_back(initializeRequest(ModernParams(version, settings.clientName, settings.clientVersion)));
            break;
        case HandshakeStrategy::Compat:
            for (auto& params : CompatParams(version, settings.clientName, settings.clientVersion)) {
                requests.push_back(initializeRequest(std::move(params)));
            }
            timeout = settings.compatTimeout;
            break;
        case HandshakeStrategy::LegacyMinimal:
            requests.push_back(initializeRequest(MinimalParams(version)));
            timeout = settings.legacyTimeout;
            break;
        case HandshakeStrategy::Skip:
            co_return std::nullopt;
    }
    co_return co_await channel.Exchange(std::move(requests), timeout);
}

HandshakeResult HandshakeNegotiator::buildResult(HandshakeStrategy strategy, const std::string& version,
                                                 const JSONRPCResponse& response) {
    HandshakeResult r;
    r.strategy = strategy;
    r.rawResponse = response.Serialize();
    const JSONValue& result = response.result.value();
    r.protocolVersion = GetStringMember(result, "protocolVersion").value_or(version);
    if (const JSONValue* info = result.Find("serverInfo")) {
        r.serverName = GetStringMember(*info, "name").value_or(std::string());
        r.serverVersion = GetStringMember(*info, "version").value_or(std::string());
    }
    if (const JSONValue* caps = result.Find("capabilities"); caps && caps->IsObject()) {
        r.capabilities = *caps;
    } else {
        r.capabilities = JSONValue(JSONValue::Object{});
    }
    return r;
}

net::awaitable<HandshakeResult> HandshakeNegotiator::Negotiate(const std::vector<HandshakeStrategy>& order) {
    FUNC_SCOPE();
    std::string version = settings.protocolVersion;
    bool fallbackUsed = false;
    bool aborted = false;
    std::string lastRaw;
    std::string lastError = "no handshake strategy configured";

    for (HandshakeStrategy strategy : order) {
        if (strategy == HandshakeStrategy::Skip) {
            LOG_INFO("Handshake: skipping initialize");
            HandshakeResult skipped;
            skipped.strategy = HandshakeStrategy::Skip;
            skipped.protocolVersion = version;
            skipped.capabilities = JSONValue(JSONValue::Object{});
            co_return skipped;
        }

        bool retryWithFallback = true;
        while (retryWithFallback) {
            retryWithFallback = false;
            std::optional<JSONRPCResponse> response;
            bool failed = false;
            try {
                response = co_await attempt(strategy, version);
            } catch (const TransportError& e) {
                failed = true;
                lastError = std::format("{} strategy: {} ({})", HandshakeStrategyName(strategy), e.what(), e.KindName());
                if (e.RawResponse()) {
                    lastRaw = *e.RawResponse();
                }
                aborted = (e.Kind() == ErrorKind::ProcessExited || e.Kind() == ErrorKind::ConnectionFailed);
            }
            if (!failed && !response) {
                lastError = std::format("{} strategy: no initialize response", HandshakeStrategyName(strategy));
            }
            if (!response) {
                LOG_WARN("Handshake: {}", lastError);
                break;
            }
            lastRaw = response->Serialize();
            if (response->IsError()) {
                lastError = std::format("{} strategy: server error {}: {}", HandshakeStrategyName(strategy),
                                        response->ErrorCode(), response->ErrorMessage());
                LOG_WARN("Handshake: {}", lastError);
                if (!fallbackUsed && version != settings.fallbackVersion && IsVersionRejection(*response)) {
                    LOG_INFO("Handshake: protocol version {} rejected; retrying with {}", version, settings.fallbackVersion);
                    fallbackUsed = true;
                    version = settings.fallbackVersion;
                    retryWithFallback = true;
                }
                continue;
            }
            if (!response->result || !response->result->IsObject()) {
                lastError = std::format("{} strategy: initialize result is not an object", HandshakeStrategyName(strategy));
                LOG_WARN("Handshake: {}", lastError);
                continue;
            }

            co_await channel.Notify(JSONRPCNotification(Methods::Initialized, JSONValue(JSONValue::Object{})));
            HandshakeResult r = buildResult(strategy, version, *response);
            LOG_INFO("Handshake: {} strategy succeeded (server={} version={} protocol={})",
                     HandshakeStrategyName(strategy), r.serverName, r.serverVersion, r.protocolVersion);
            co_return r;
        }
        if (aborted) {
            break;
        }
    }

    TransportError err(ErrorKind::HandshakeFailure, "handshake failed: " + lastError);
    err.WithRawResponse(lastRaw).WithDiagnostics(channel.DiagnosticText());
    throw err;
}

} // namespace mcphost
