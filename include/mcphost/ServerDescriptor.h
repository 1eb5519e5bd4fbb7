//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerDescriptor.h
// Purpose: Immutable registration of one tool server and its config-string factory
//==========================================================================================================

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "mcphost/ChildProcess.hpp"
#include "mcphost/FrameCodec.h"

namespace mcphost {

enum class TransportKind {
    Subprocess,
    SdkDelegate,
    Http
};

const char* TransportKindName(TransportKind kind);

//==========================================================================================================
// HandshakeStrategy
// Purpose: One way of completing initialize/initialized. See HandshakeNegotiator.
//==========================================================================================================
enum class HandshakeStrategy {
    Modern,
    Compat,
    LegacyMinimal,
    Skip
};

const char* HandshakeStrategyName(HandshakeStrategy strategy);
std::optional<HandshakeStrategy> HandshakeStrategyFromString(const std::string& name);

//==========================================================================================================
// HttpEndpoint
// Purpose: Where and how to reach an HTTP tool server.
// Fields:
//   url: Base URL receiving JSON-RPC POSTs (http:// or https://).
//   headers: Extra static request headers.
//   bearerToken: Optional token sent as "Authorization: Bearer <token>".
//   caFile/caPath: Optional trust store for https; the system store is used otherwise.
//==========================================================================================================
struct HttpEndpoint {
    std::string url;
    std::map<std::string, std::string> headers;
    std::optional<std::string> bearerToken;
    std::string caFile;
    std::string caPath;
};

//==========================================================================================================
// ServerDescriptor
// Purpose: Registration of one server. Exactly one of `launch` (subprocess, sdk-delegate) or `endpoint`
//          (http) is meaningful, selected by `transport`.
//==========================================================================================================
struct ServerDescriptor {
    std::string name;
    TransportKind transport{TransportKind::Subprocess};
    LaunchSpec launch;
    HttpEndpoint endpoint;
    std::string protocolVersion{"2024-11-05"};
    std::vector<HandshakeStrategy> handshake{HandshakeStrategy::Modern, HandshakeStrategy::Compat,
                                             HandshakeStrategy::LegacyMinimal};
    FramingMode framing{FramingMode::Lsp};
    bool enabled{true};
    std::string description;
};

//==========================================================================================================
// ValidateDescriptor
// Purpose: Throws std::invalid_argument when the descriptor cannot be connected (empty name, missing
//          command for stdio kinds, missing or non-http(s) URL for http, empty handshake list).
//==========================================================================================================
void ValidateDescriptor(const ServerDescriptor& descriptor);

//==========================================================================================================
// ServerDescriptorFactory
// Purpose: Parses semicolon-delimited key=value configuration into a ServerDescriptor.
// Keys:
//   transport=subprocess|sdk|http, command=, args=a,b,c, cwd=, env.<NAME>=, url=, header.<NAME>=, token=,
//   caFile=, caPath=, framing=lsp|raw, handshake=modern,compat,legacy-minimal,skip, protocolVersion=,
//   enabled=true|false, description=
// Notes:
//   Unknown keys are logged and ignored. Invalid values throw std::invalid_argument.
//==========================================================================================================
class ServerDescriptorFactory {
public:
    static ServerDescriptor Create(const std::string& name, const std::string& config);
};

} // namespace mcphost
