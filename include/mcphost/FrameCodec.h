//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FrameCodec.h
// Purpose: Encoding and deadline-bounded decoding of JSON-RPC messages on a byte stream
//========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include "mcphost/JSONRPCTypes.h"

namespace mcphost {

//========================================================================================================
// FramingMode
// Purpose: Wire framing used towards a server.
//   Lsp: "Content-Length: <n>\r\n\r\n" followed by exactly n bytes of UTF-8 JSON.
//   Raw: one JSON document followed by "\n".
//========================================================================================================
enum class FramingMode {
    Lsp,
    Raw
};

const char* FramingModeName(FramingMode mode);
std::optional<FramingMode> FramingModeFromString(const std::string& name);

std::string EncodeFrame(const std::string& json, FramingMode framing);
std::string EncodeFrame(const JSONValue& message, FramingMode framing);
std::string EncodeFrame(const JSONRPCMessage& message, FramingMode framing);

//========================================================================================================
// IByteSource
// Purpose: Readable byte stream with deadline-bounded reads.
// Notes:
//   ReadSome never blocks past the deadline. Closed is sticky once reported.
//========================================================================================================
class IByteSource {
public:
    using Clock = std::chrono::steady_clock;

    enum class ReadStatus {
        Data,
        Timeout,
        Closed
    };
    struct ReadResult {
        ReadStatus status;
        std::size_t bytes{0};
    };

    virtual ~IByteSource() = default;
    virtual ReadResult ReadSome(char* buffer, std::size_t capacity, Clock::time_point deadline) = 0;
};

//========================================================================================================
// FdByteSource
// Purpose: IByteSource over a readable file descriptor (pipe). Waits in slices of at most 100 ms and
//          reports Closed on EOF, on a read error, or when the optional liveness check returns false
//          while no data is pending.
//========================================================================================================
class FdByteSource : public IByteSource {
public:
    explicit FdByteSource(int fd, std::function<bool()> alive = {});

    ReadResult ReadSome(char* buffer, std::size_t capacity, Clock::time_point deadline) override;

private:
    int fd;
    std::function<bool()> alive;
    bool closed{false};
};

//========================================================================================================
// FrameDecoder
// Purpose: Stateful line-oriented decoder accepting both framings on input.
// Behavior:
//   - A line starting with '{' is parsed directly as one JSON message.
//   - "name: value" lines are headers until a blank line; the body is then exactly Content-Length bytes.
//   - Other lines (banners, log output) are skipped.
//   - Partial input is retained across calls, so a timed-out call can be resumed.
//   - Bodies above maxContentLength are drained and reported as Malformed.
//========================================================================================================
class FrameDecoder {
public:
    static constexpr std::size_t kDefaultMaxContentLength = 16u * 1024u * 1024u;
    static constexpr std::size_t kMaxLineLength = 1024u * 1024u;

    enum class DecodeStatus {
        Ok,
        Timeout,
        StreamClosed,
        Malformed
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<JSONValue> message; // present when status==Ok
        std::string raw;                  // JSON text of the message or of the malformed body
    };

    explicit FrameDecoder(IByteSource& source, std::size_t maxContentLength = kDefaultMaxContentLength);

    DecodeResult Decode(std::chrono::milliseconds timeout);
    DecodeResult DecodeUntil(IByteSource::Clock::time_point deadline);

    // Bytes buffered but not yet consumed (diagnostics and tests)
    std::size_t Pending() const { return buffer.size(); }

private:
    std::optional<DecodeResult> handleLine(const std::string& line);
    bool fill(IByteSource::Clock::time_point deadline, DecodeStatus& status);
    static DecodeResult parseBody(std::string body);

    IByteSource& source;
    std::size_t maxContentLength;
    std::string buffer;
    std::optional<std::size_t> contentLength;
    std::optional<std::size_t> bodyLength;
    std::size_t discardRemaining{0};
    bool closed{false};
};

} // namespace mcphost
