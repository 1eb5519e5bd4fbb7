//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HandshakeNegotiator.h
// Purpose: initialize/initialized exchange with ordered compatibility strategies and version fallback
//==========================================================================================================

#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "mcphost/HostOptions.h"
#include "mcphost/Transport.h"

namespace mcphost {

//==========================================================================================================
// HandshakeSettings
// Purpose: Inputs of one negotiation; normally derived from a ServerDescriptor and HostOptions.
//==========================================================================================================
struct HandshakeSettings {
    std::string protocolVersion{ProtocolVersions::Default};
    std::string fallbackVersion{ProtocolVersions::Fallback};
    std::string clientName{"mcphost"};
    std::string clientVersion;
    std::chrono::milliseconds modernTimeout{10000};
    std::chrono::milliseconds compatTimeout{20000};
    std::chrono::milliseconds legacyTimeout{3000};

    static HandshakeSettings From(const ServerDescriptor& descriptor, const HostOptions& options);
};

//==========================================================================================================
// HandshakeNegotiator
// Purpose: Tries each strategy in order until one yields an initialize result.
// Strategies:
//   modern: one complete payload, then notifications/initialized.
//   compat: three increasingly complete payloads sent back-to-back, one read with compatTimeout.
//   legacy-minimal: protocolVersion only, legacyTimeout.
//   skip: no initialize at all.
// Notes:
//   A version rejection (code -32602 or a message mentioning the version) is retried once with the
//   fallback version, which then sticks for the remaining strategies.
//   When every strategy fails, throws TransportError(HandshakeFailure) carrying the last raw response and
//   the channel's diagnostic text. A process exit aborts negotiation immediately with the same kind.
//==========================================================================================================
class HandshakeNegotiator {
public:
    HandshakeNegotiator(IHandshakeChannel& channel, HandshakeSettings settings);

    net::awaitable<HandshakeResult> Negotiate(const std::vector<HandshakeStrategy>& order);

    static JSONValue ModernParams(const std::string& version, const std::string& clientName,
                                  const std::string& clientVersion);
    static std::vector<JSONValue> CompatParams(const std::string& version, const std::string& clientName,
                                               const std::string& clientVersion);
    static JSONValue MinimalParams(const std::string& version);
    static bool IsVersionRejection(const JSONRPCResponse& response);

private:
    net::awaitable<std::optional<JSONRPCResponse>> attempt(HandshakeStrategy strategy, const std::string& version);
    static HandshakeResult buildResult(HandshakeStrategy strategy, const std::string& version,
                                       const JSONRPCResponse& response);

    IHandshakeChannel& channel;
    HandshakeSettings settings;
};

} // namespace mcphost
