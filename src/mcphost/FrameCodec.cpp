//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FrameCodec.cpp
// Purpose: Content-Length and newline framing for JSON-RPC over child process pipes
//========================================================================================================

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cstring>

#include <poll.h>
#include <unistd.h>

#include "logging/Logger.h"
#include "mcphost/FrameCodec.h"

namespace mcphost {

namespace {
constexpr auto kPollSlice = std::chrono::milliseconds(100);

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) {
        ++b;
    }
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) {
        --e;
    }
    return s.substr(b, e - b);
}

// RFC 7230 token characters; header names never contain spaces
bool isHeaderName(const std::string& name) {
    if (name.empty()) {
        return false;
    }
    for (char c : name) {
        const unsigned char u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '-' || c == '_' || c == '.') {
            continue;
        }
        return false;
    }
    return true;
}
} // namespace

const char* FramingModeName(FramingMode mode) {
    return mode == FramingMode::Lsp ? "lsp" : "raw";
}

std::optional<FramingMode> FramingModeFromString(const std::string& name) {
    const std::string n = toLower(trim(name));
    if (n == "lsp" || n == "content-length") {
        return FramingMode::Lsp;
    }
    if (n == "raw" || n == "ndjson" || n == "newline") {
        return FramingMode::Raw;
    }
    return std::nullopt;
}

std::string EncodeFrame(const std::string& json, FramingMode framing) {
    if (framing == FramingMode::Raw) {
        std::string frame; frame.reserve(json.size() + 1);
        frame.append(json);
        frame.push_back('\n');
        return frame;
    }
    std::string header = "Content-Length: " + std::to_string(json.size()) + "\r\n\r\n";
    std::string frame; frame.reserve(header.size() + json.size());
    frame.append(header);
    frame.append(json);
    return frame;
}

std::string EncodeFrame(const JSONValue& message, FramingMode framing) {
    return EncodeFrame(SerializeJSON(message), framing);
}

std::string EncodeFrame(const JSONRPCMessage& message, FramingMode framing) {
    return EncodeFrame(message.Serialize(), framing);
}

//--------------------------------------------------------------------------------------------------------
// FdByteSource
//--------------------------------------------------------------------------------------------------------
FdByteSource::FdByteSource(int fd, std::function<bool()> alive)
    : fd(fd), alive(std::move(alive)) {}

IByteSource::ReadResult FdByteSource::ReadSome(char* buffer, std::size_t capacity, Clock::time_point deadline) {
    if (closed || fd < 0) {
        return { ReadStatus::Closed, 0 };
    }
    while (true) {
        const auto now = Clock::now();
        auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
        if (remaining.count() < 0) {
            remaining = std::chrono::milliseconds(0);
        }
        const auto slice = std::min(remaining, std::chrono::milliseconds(kPollSlice));

        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, static_cast<int>(slice.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("FdByteSource: poll failed (errno={} msg={})", errno, ::strerror(errno));
            closed = true;
            return { ReadStatus::Closed, 0 };
        }
        if (rc == 0) {
            if (alive && !alive()) {
                LOG_DEBUG("FdByteSource: peer no longer alive (fd={})", fd);
                closed = true;
                return { ReadStatus::Closed, 0 };
            }
            if (Clock::now() >= deadline) {
                return { ReadStatus::Timeout, 0 };
            }
            continue;
        }
        ssize_t n = 0;
        do {
            n = ::read(fd, buffer, capacity);
        } while (n < 0 && errno == EINTR);
        if (n > 0) {
            return { ReadStatus::Data, static_cast<std::size_t>(n) };
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            continue;
        }
        if (n < 0) {
            LOG_WARN("FdByteSource: read failed (errno={} msg={})", errno, ::strerror(errno));
        }
        closed = true;
        return { ReadStatus::Closed, 0 };
    }
}

//--------------------------------------------------------------------------------------------------------
// FrameDecoder
//--------------------------------------------------------------------------------------------------------
FrameDecoder::FrameDecoder(IByteSource& source, std::size_t maxContentLength)
    : source(source), maxContentLength(maxContentLength) {}

FrameDecoder::DecodeResult FrameDecoder::Decode(std::chrono::milliseconds timeout) {
    return DecodeUntil(IByteSource::Clock::now() + timeout);
}

FrameDecoder::DecodeResult FrameDecoder::DecodeUntil(IByteSource::Clock::time_point deadline) {
    FUNC_SCOPE();
    DecodeStatus status = DecodeStatus::Timeout;
    while (true) {
        if (discardRemaining > 0) {
            const std::size_t n = std::min(discardRemaining, buffer.size());
            buffer.erase(0, n);
            discardRemaining -= n;
            if (discardRemaining == 0) {
                return { DecodeStatus::Malformed, std::nullopt, std::string() };
            }
            if (!fill(deadline, status)) {
                return { status, std::nullopt, std::string() };
            }
            continue;
        }

        if (bodyLength.has_value()) {
            if (buffer.size() >= bodyLength.value()) {
                std::string body = buffer.substr(0, bodyLength.value());
                buffer.erase(0, bodyLength.value());
                bodyLength.reset();
                return parseBody(std::move(body));
            }
            if (!fill(deadline, status)) {
                return { status, std::nullopt, std::string() };
            }
            continue;
        }

        std::size_t eol = buffer.find('\n');
        if (eol == std::string::npos) {
            if (buffer.size() > kMaxLineLength) {
                LOG_WARN("FrameDecoder: dropping {} bytes without a line terminator", buffer.size());
                buffer.clear();
                contentLength.reset();
            }
            if (!fill(deadline, status)) {
                if (status == DecodeStatus::StreamClosed && !buffer.empty()) {
                    // Last line of a closed stream may lack its terminator
                    buffer.push_back('\n');
                    continue;
                }
                return { status, std::nullopt, std::string() };
            }
            continue;
        }

        std::string line = buffer.substr(0, eol);
        buffer.erase(0, eol + 1);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (auto r = handleLine(line)) {
            return std::move(*r);
        }
    }
}

std::optional<FrameDecoder::DecodeResult> FrameDecoder::handleLine(const std::string& line) {
    const std::string trimmed = trim(line);
    if (trimmed.empty()) {
        if (!contentLength.has_value()) {
            return std::nullopt;
        }
        const std::size_t len = contentLength.value();
        contentLength.reset();
        if (len > maxContentLength) {
            LOG_WARN("FrameDecoder: Content-Length {} exceeds limit {}; draining body", len, maxContentLength);
            discardRemaining = len;
            return std::nullopt;
        }
        bodyLength = len;
        return std::nullopt;
    }

    if (trimmed.front() == '{') {
        contentLength.reset();
        return parseBody(trimmed);
    }

    const std::size_t colon = trimmed.find(':');
    if (colon != std::string::npos && isHeaderName(trimmed.substr(0, colon))) {
        const std::string name = toLower(trimmed.substr(0, colon));
        if (name == "content-length") {
            const std::string value = trim(trimmed.substr(colon + 1));
            std::size_t len = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), len);
            if (value.empty() || ec != std::errc() || ptr != value.data() + value.size()) {
                LOG_DEBUG("FrameDecoder: ignoring invalid Content-Length '{}'", value);
                contentLength.reset();
            } else {
                contentLength = len;
            }
        }
        return std::nullopt;
    }

    LOG_DEBUG("FrameDecoder: skipping non-protocol output: {}", trimmed.substr(0, 200));
    contentLength.reset();
    return std::nullopt;
}

bool FrameDecoder::fill(IByteSource::Clock::time_point deadline, DecodeStatus& status) {
    if (closed) {
        status = DecodeStatus::StreamClosed;
        return false;
    }
    if (IByteSource::Clock::now() >= deadline) {
        status = DecodeStatus::Timeout;
        return false;
    }
    char tmp[8192];
    IByteSource::ReadResult r = source.ReadSome(tmp, sizeof(tmp), deadline);
    switch (r.status) {
        case IByteSource::ReadStatus::Data:
            buffer.append(tmp, r.bytes);
            return true;
        case IByteSource::ReadStatus::Timeout:
            status = DecodeStatus::Timeout;
            return false;
        case IByteSource::ReadStatus::Closed:
            closed = true;
            status = DecodeStatus::StreamClosed;
            return false;
    }
    status = DecodeStatus::StreamClosed;
    return false;
}

FrameDecoder::DecodeResult FrameDecoder::parseBody(std::string body) {
    try {
        JSONValue v = ParseJSON(body);
        if (!v.IsObject()) {
            LOG_WARN("FrameDecoder: message body is not a JSON object");
            return { DecodeStatus::Malformed, std::nullopt, std::move(body) };
        }
        return { DecodeStatus::Ok, std::make_optional(std::move(v)), std::move(body) };
    } catch (const std::exception& e) {
        LOG_WARN("FrameDecoder: malformed message body: {}", e.what());
        return { DecodeStatus::Malformed, std::nullopt, std::move(body) };
    }
}

} // namespace mcphost
