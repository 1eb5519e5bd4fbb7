//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_child_process.cpp
// Purpose: Tests for child process launch/termination and the stderr ring buffer
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include <unistd.h>

#include "mcphost/ChildProcess.hpp"
#include "mcphost/FrameCodec.h"
#include "mcphost/StderrDrain.hpp"
#include "mcphost/TransportError.h"

using namespace mcphost;
using namespace std::chrono_literals;

namespace {

std::string readAll(int fd, std::chrono::milliseconds timeout) {
    FdByteSource src(fd);
    std::string out;
    char buf[256];
    const auto deadline = IByteSource::Clock::now() + timeout;
    while (true) {
        auto r = src.ReadSome(buf, sizeof(buf), deadline);
        if (r.status != IByteSource::ReadStatus::Data) {
            return out;
        }
        out.append(buf, r.bytes);
    }
}

std::optional<int> waitForExit(ChildProcess& proc, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (proc.Running() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    return proc.ExitStatus();
}

} // namespace

TEST(ChildProcessTest, CapturesStdoutStderrAndExitStatus) {
    LaunchSpec spec;
    spec.command = "/bin/sh";
    spec.args = {"-c", "echo out; echo err 1>&2; exit 7"};
    auto proc = ChildProcess::Spawn(spec);
    ASSERT_GT(proc->Pid(), 0);

    StderrDrain drain(proc->StderrFd());
    drain.Start();
    EXPECT_EQ(readAll(proc->StdoutFd(), 2s), "out\n");
    EXPECT_EQ(waitForExit(*proc, 2s).value_or(-1), 7);
    EXPECT_TRUE(drain.WaitForEof(2s));
    EXPECT_EQ(drain.Snapshot(), "err\n");
    drain.Stop();
}

TEST(ChildProcessTest, EnvironmentAndWorkingDirectoryApply) {
    LaunchSpec spec;
    spec.command = "/bin/sh";
    spec.args = {"-c", "echo \"$MCPHOST_TEST_VALUE\"; pwd"};
    spec.environment["MCPHOST_TEST_VALUE"] = "from-host";
    spec.workingDirectory = "/";
    auto proc = ChildProcess::Spawn(spec);
    EXPECT_EQ(readAll(proc->StdoutFd(), 2s), "from-host\n/\n");
}

TEST(ChildProcessTest, MissingCommandIsConnectionFailure) {
    LaunchSpec spec;
    spec.command = "/nonexistent/definitely-not-here";
    try {
        ChildProcess::Spawn(spec);
        FAIL() << "expected ConnectionFailed";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::ConnectionFailed);
    }
}

TEST(ChildProcessTest, BadWorkingDirectoryIsConnectionFailure) {
    LaunchSpec spec;
    spec.command = "/bin/sh";
    spec.args = {"-c", "true"};
    spec.workingDirectory = "/nonexistent/dir";
    EXPECT_THROW(ChildProcess::Spawn(spec), TransportError);
}

TEST(ChildProcessTest, TerminateEscalatesAfterGrace) {
    LaunchSpec spec;
    spec.command = "/bin/sh";
    spec.args = {"-c", "trap '' HUP; while true; do sleep 1; done"};
    auto proc = ChildProcess::Spawn(spec);
    const auto start = std::chrono::steady_clock::now();
    proc->Terminate(100ms);
    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_FALSE(proc->Running());
    EXPECT_TRUE(proc->ExitStatus().has_value());
    // Second call is a no-op
    proc->Terminate(100ms);
}

TEST(ChildProcessTest, WriteAfterExitIsProcessExited) {
    LaunchSpec spec;
    spec.command = "/bin/sh";
    spec.args = {"-c", "exit 0"};
    auto proc = ChildProcess::Spawn(spec);
    waitForExit(*proc, 2s);
    try {
        for (int i = 0; i < 64; ++i) {
            proc->WriteAll(std::string(4096, 'x'), ChildProcess::Clock::now() + 1s);
        }
        FAIL() << "expected ProcessExited";
    } catch (const TransportError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::ProcessExited);
    }
}

TEST(StderrDrainTest, RingKeepsMostRecentBytes) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    StderrDrain drain(fds[0], 16, "ring");
    drain.Start();
    const std::string text = "0123456789abcdefXYZ";
    ASSERT_EQ(::write(fds[1], text.data(), text.size()), static_cast<ssize_t>(text.size()));
    ::close(fds[1]);
    EXPECT_TRUE(drain.WaitForEof(2s));
    EXPECT_EQ(drain.Snapshot(), "3456789abcdefXYZ");
    EXPECT_EQ(drain.TotalBytes(), text.size());
    drain.Stop();
    ::close(fds[0]);
}

TEST(StderrDrainTest, SnapshotBeforeWrapIsInOrder) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    StderrDrain drain(fds[0], 64, "small");
    drain.Start();
    ASSERT_EQ(::write(fds[1], "abc", 3), 3);
    ASSERT_EQ(::write(fds[1], "def", 3), 3);
    ::close(fds[1]);
    EXPECT_TRUE(drain.WaitForEof(2s));
    EXPECT_EQ(drain.Snapshot(), "abcdef");
    drain.Stop();
    EXPECT_FALSE(drain.Running());
    ::close(fds[0]);
}
