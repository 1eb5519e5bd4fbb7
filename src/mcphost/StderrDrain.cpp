//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StderrDrain.cpp
// Purpose: Stderr ring buffer reader thread
//==========================================================================================================

#include <cerrno>
#include <chrono>
#include <cstring>
#include <system_error>

#include <poll.h>
#include <unistd.h>

#include "logging/Logger.h"
#include "mcphost/StderrDrain.hpp"
#include "mcphost/TransportError.h"

namespace mcphost {

namespace {
constexpr int kPollSliceMs = 100;
constexpr int kStartAttempts = 3;
}

StderrDrain::StderrDrain(int fd, std::size_t capacity, std::string label)
    : fd(fd), capacity(capacity == 0 ? 1 : capacity), label(std::move(label)) {
    ring.resize(this->capacity);
}

StderrDrain::~StderrDrain() {
    Stop();
}

void StderrDrain::Start() {
    FUNC_SCOPE();
    if (worker.joinable()) {
        return;
    }
    stopRequested.store(false);
    running.store(true);
    for (int attempt = 1; attempt <= kStartAttempts; ++attempt) {
        try {
            worker = std::thread([this]() { run(); });
            return;
        } catch (const std::system_error& e) {
            LOG_WARN("StderrDrain[{}]: thread start attempt {} failed: {}", label, attempt, e.what());
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * attempt));
        }
    }
    running.store(false);
    throw TransportError(ErrorKind::ResourceExhausted,
                         "unable to start stderr drain thread for '" + label + "'");
}

void StderrDrain::Stop() {
    stopRequested.store(true);
    if (worker.joinable()) {
        worker.join();
    }
    running.store(false);
}

bool StderrDrain::WaitForEof(std::chrono::milliseconds timeout) const {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (running.load()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

std::string StderrDrain::Snapshot() const {
    std::lock_guard<std::mutex> lk(ringMutex);
    if (!wrapped) {
        return ring.substr(0, head);
    }
    std::string out;
    out.reserve(capacity);
    out.append(ring, head, std::string::npos);
    out.append(ring, 0, head);
    return out;
}

void StderrDrain::append(const char* data, std::size_t n) {
    totalBytes.fetch_add(n);
    std::lock_guard<std::mutex> lk(ringMutex);
    if (n >= capacity) {
        // Only the tail fits
        ring.assign(data + (n - capacity), capacity);
        head = 0;
        wrapped = true;
        return;
    }
    for (std::size_t i = 0; i < n; ++i) {
        ring[head] = data[i];
        head += 1;
        if (head == capacity) {
            head = 0;
            wrapped = true;
        }
    }
}

void StderrDrain::run() {
    char buf[4096];
    while (!stopRequested.load()) {
        struct pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, kPollSliceMs);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN("StderrDrain[{}]: poll failed (errno={} msg={})", label, errno, ::strerror(errno));
            break;
        }
        if (rc == 0) {
            continue;
        }
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            append(buf, static_cast<std::size_t>(n));
            LOG_DEBUG("StderrDrain[{}]: {} bytes", label, n);
            continue;
        }
        if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) {
            continue;
        }
        // EOF: the child closed stderr
        break;
    }
    running.store(false);
}

} // namespace mcphost
