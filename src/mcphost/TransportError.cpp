//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TransportError.cpp
// Purpose: ErrorKind names
//==========================================================================================================

#include "mcphost/TransportError.h"

namespace mcphost {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::HandshakeFailure: return "handshake-failure";
        case ErrorKind::DiscoveryFailure: return "discovery-failure";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::ProcessExited: return "process-exited";
        case ErrorKind::HttpStatus: return "http-status";
        case ErrorKind::ProtocolError: return "protocol-error";
        case ErrorKind::DecodeError: return "decode-error";
        case ErrorKind::ConnectionFailed: return "connection-failed";
        case ErrorKind::ResourceExhausted: return "resource-exhausted";
        case ErrorKind::NoSuchTool: return "no-such-tool";
        case ErrorKind::NoActiveSession: return "no-active-session";
    }
    return "unknown";
}

} // namespace mcphost
