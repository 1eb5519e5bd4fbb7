//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StderrDrain.hpp
// Purpose: Background reader that keeps a child's stderr pipe empty and retains its most recent output
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>

namespace mcphost {

//==========================================================================================================
// StderrDrain
// Purpose: Owns one thread that reads a file descriptor until EOF or Stop(), storing the newest
//          `capacity` bytes in a ring buffer. Snapshot() may be called from any thread.
// Notes:
//   Start() retries thread creation three times and throws TransportError(ResourceExhausted) after that.
//   The descriptor is not closed by the drain.
//==========================================================================================================
class StderrDrain {
public:
    static constexpr std::size_t kDefaultCapacity = 64u * 1024u;

    explicit StderrDrain(int fd, std::size_t capacity = kDefaultCapacity, std::string label = std::string());
    ~StderrDrain();

    StderrDrain(const StderrDrain&) = delete;
    StderrDrain& operator=(const StderrDrain&) = delete;

    void Start();
    void Stop();

    // Most recent bytes in arrival order
    std::string Snapshot() const;
    // Total bytes observed since Start(), including overwritten ones
    std::size_t TotalBytes() const { return totalBytes.load(); }
    bool Running() const { return running.load(); }
    // Waits until the child closes stderr; false when still open after `timeout`.
    bool WaitForEof(std::chrono::milliseconds timeout) const;

private:
    void run();
    void append(const char* data, std::size_t n);

    int fd;
    std::size_t capacity;
    std::string label;

    mutable std::mutex ringMutex;
    std::string ring;
    std::size_t head{0};
    bool wrapped{false};

    std::atomic<bool> stopRequested{false};
    std::atomic<bool> running{false};
    std::atomic<std::size_t> totalBytes{0};
    std::thread worker;
};

} // namespace mcphost
