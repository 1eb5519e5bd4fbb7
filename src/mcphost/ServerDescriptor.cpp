//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerDescriptor.cpp
// Purpose: Descriptor validation and key=value configuration parsing
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include "logging/Logger.h"
#include "mcphost/ServerDescriptor.h"

namespace mcphost {

namespace {
std::string trim(std::string s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) {
        ++b;
    }
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
        --e;
    }
    return s.substr(b, e - b);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> splitList(const std::string& s) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= s.size()) {
        std::size_t sep = s.find(',', start);
        if (sep == std::string::npos) { sep = s.size(); }
        std::string item = trim(s.substr(start, sep - start));
        if (!item.empty()) {
            out.push_back(item);
        }
        start = sep + 1;
    }
    return out;
}

bool parseBool(const std::string& key, const std::string& val) {
    const std::string v = toLower(val);
    if (v == "1" || v == "true" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "0" || v == "false" || v == "no" || v == "off") {
        return false;
    }
    throw std::invalid_argument("invalid boolean for '" + key + "': " + val);
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}
} // namespace

const char* TransportKindName(TransportKind kind) {
    switch (kind) {
        case TransportKind::Subprocess: return "subprocess";
        case TransportKind::SdkDelegate: return "sdk";
        case TransportKind::Http: return "http";
    }
    return "unknown";
}

const char* HandshakeStrategyName(HandshakeStrategy strategy) {
    switch (strategy) {
        case HandshakeStrategy::Modern: return "modern";
        case HandshakeStrategy::Compat: return "compat";
        case HandshakeStrategy::LegacyMinimal: return "legacy-minimal";
        case HandshakeStrategy::Skip: return "skip";
    }
    return "unknown";
}

std::optional<HandshakeStrategy> HandshakeStrategyFromString(const std::string& name) {
    const std::string n = toLower(trim(name));
    if (n == "modern") return HandshakeStrategy::Modern;
    if (n == "compat") return HandshakeStrategy::Compat;
    if (n == "legacy-minimal" || n == "legacy" || n == "minimal") return HandshakeStrategy::LegacyMinimal;
    if (n == "skip" || n == "none") return HandshakeStrategy::Skip;
    return std::nullopt;
}

void ValidateDescriptor(const ServerDescriptor& d) {
    if (d.name.empty()) {
        throw std::invalid_argument("server descriptor has an empty name");
    }
    if (d.handshake.empty()) {
        throw std::invalid_argument("server '" + d.name + "' has no handshake strategy");
    }
    if (d.transport == TransportKind::Http) {
        if (!startsWith(d.endpoint.url, "http://") && !startsWith(d.endpoint.url, "https://")) {
            throw std::invalid_argument("server '" + d.name + "' needs an http:// or https:// url");
        }
        return;
    }
    if (d.launch.command.empty()) {
        throw std::invalid_argument("server '" + d.name + "' has no command");
    }
}

ServerDescriptor ServerDescriptorFactory::Create(const std::string& name, const std::string& config) {
    FUNC_SCOPE();
    ServerDescriptor d;
    d.name = name;

    std::size_t start = 0;
    while (start < config.size()) {
        std::size_t sep = config.find(';', start);
        if (sep == std::string::npos) { sep = config.size(); }
        std::string kv = trim(config.substr(start, sep - start));
        start = sep + 1;
        if (kv.empty()) {
            continue;
        }
        std::size_t eq = kv.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument("expected key=value in server config: " + kv);
        }
        std::string key = trim(kv.substr(0, eq));
        std::string val = trim(kv.substr(eq + 1));

        if (key == "transport") {
            const std::string t = toLower(val);
            if (t == "subprocess" || t == "stdio") {
                d.transport = TransportKind::Subprocess;
            } else if (t == "sdk" || t == "sdk-delegate") {
                d.transport = TransportKind::SdkDelegate;
            } else if (t == "http" || t == "https") {
                d.transport = TransportKind::Http;
            } else {
                throw std::invalid_argument("unknown transport: " + val);
            }
        }
        else if (key == "command") {
            d.launch.command = val;
        }
        else if (key == "args") {
            d.launch.args = splitList(val);
        }
        else if (key == "cwd") {
            d.launch.workingDirectory = val;
        }
        else if (startsWith(key, "env.")) {
            d.launch.environment[key.substr(4)] = val;
        }
        else if (key == "url") {
            d.endpoint.url = val;
        }
        else if (startsWith(key, "header.")) {
            d.endpoint.headers[key.substr(7)] = val;
        }
        else if (key == "token" || key == "bearerToken") {
            if (!val.empty()) {
                d.endpoint.bearerToken = val;
            }
        }
        else if (key == "caFile") {
            d.endpoint.caFile = val;
        }
        else if (key == "caPath") {
            d.endpoint.caPath = val;
        }
        else if (key == "framing") {
            auto mode = FramingModeFromString(val);
            if (!mode) {
                throw std::invalid_argument("unknown framing: " + val);
            }
            d.framing = *mode;
        }
        else if (key == "handshake") {
            std::vector<HandshakeStrategy> order;
            for (const auto& item : splitList(val)) {
                auto s = HandshakeStrategyFromString(item);
                if (!s) {
                    throw std::invalid_argument("unknown handshake strategy: " + item);
                }
                order.push_back(*s);
            }
            d.handshake = std::move(order);
        }
        else if (key == "protocolVersion") {
            d.protocolVersion = val;
        }
        else if (key == "enabled") {
            d.enabled = parseBool(key, val);
        }
        else if (key == "description") {
            d.description = val;
        }
        else {
            LOG_WARN("ServerDescriptorFactory: ignoring unknown key '{}' for server '{}'", key, name);
        }
    }
    ValidateDescriptor(d);
    return d;
}

} // namespace mcphost
