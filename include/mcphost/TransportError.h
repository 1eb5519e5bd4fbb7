//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TransportError.h
// Purpose: Error taxonomy raised by transports and reported by the dispatcher
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace mcphost {

// Categorization of every failure the host can report for a server or a call.
enum class ErrorKind {
    HandshakeFailure,
    DiscoveryFailure,
    Timeout,
    ProcessExited,
    HttpStatus,
    ProtocolError,
    DecodeError,
    ConnectionFailed,
    ResourceExhausted,
    NoSuchTool,
    NoActiveSession
};

// Stable, hyphenated name of an ErrorKind (e.g. "process-exited").
const char* ErrorKindName(ErrorKind kind);

//==========================================================================================================
// TransportError
// Purpose: Exception thrown by transports, the handshake negotiator and the frame channel.
// Fields:
//   kind: Taxonomy entry.
//   diagnostics: Captured stderr text of the server process, when any.
//   httpStatus: HTTP status code for ErrorKind::HttpStatus.
//   rawResponse: Last raw JSON response observed before the failure, when any.
//==========================================================================================================
class TransportError : public std::runtime_error {
public:
    TransportError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), errorKind(kind) {}

    ErrorKind Kind() const noexcept { return errorKind; }
    const char* KindName() const noexcept { return ErrorKindName(errorKind); }

    const std::optional<std::string>& Diagnostics() const noexcept { return diagnosticText; }
    std::optional<int> HttpStatusCode() const noexcept { return httpStatus; }
    const std::optional<std::string>& RawResponse() const noexcept { return rawText; }

    TransportError& WithDiagnostics(std::string text) {
        if (!text.empty()) {
            diagnosticText = std::move(text);
        }
        return *this;
    }
    TransportError& WithHttpStatus(int status) { httpStatus = status; return *this; }
    TransportError& WithRawResponse(std::string raw) {
        if (!raw.empty()) {
            rawText = std::move(raw);
        }
        return *this;
    }

private:
    ErrorKind errorKind;
    std::optional<std::string> diagnosticText;
    std::optional<int> httpStatus;
    std::optional<std::string> rawText;
};

} // namespace mcphost
