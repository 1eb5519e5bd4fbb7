//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.hpp
// Purpose: POSIX child process with piped stdin/stdout/stderr used by the subprocess transports
//==========================================================================================================

#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

namespace mcphost {

//==========================================================================================================
// LaunchSpec
// Purpose: How to start a stdio tool server.
// Fields:
//   command: Executable name or path; resolved through PATH when it contains no '/'.
//   args: Arguments after argv[0].
//   workingDirectory: Directory to chdir into before exec; empty keeps the host's directory.
//   environment: Variables added to (or replacing those in) the host's environment.
//==========================================================================================================
struct LaunchSpec {
    std::string command;
    std::vector<std::string> args;
    std::string workingDirectory;
    std::map<std::string, std::string> environment;
};

//==========================================================================================================
// ChildProcess
// Purpose: Owns a forked child and the parent ends of its three pipes. Destruction terminates, reaps and
//          closes the pipes.
//==========================================================================================================
class ChildProcess {
public:
    using Clock = std::chrono::steady_clock;

    // Throws TransportError(ConnectionFailed) when pipes cannot be created or exec fails.
    static std::unique_ptr<ChildProcess> Spawn(const LaunchSpec& spec);

    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t Pid() const { return pid; }
    int StdoutFd() const { return stdoutFd; }
    int StderrFd() const { return stderrFd; }

    //======================================================================================================
    // WriteAll
    // Purpose: Writes every byte to the child's stdin before the deadline.
    // Throws:
    //   TransportError(Timeout) when the pipe stays full past the deadline.
    //   TransportError(ProcessExited) when the child closed its stdin or exited.
    //======================================================================================================
    void WriteAll(const std::string& data, Clock::time_point deadline);

    void CloseStdin();

    // Non-blocking liveness check; reaps the child when it has exited.
    bool Running();
    std::optional<int> ExitStatus();

    //======================================================================================================
    // Terminate
    // Purpose: Closes stdin, waits up to `grace` for a voluntary exit, then SIGTERM, then SIGKILL.
    //          Always reaps the child. stdout/stderr stay open until destruction so readers can finish.
    //======================================================================================================
    void Terminate(std::chrono::milliseconds grace);

    std::string Describe() const;

private:
    ChildProcess() = default;
    bool reapLocked(bool block);
    bool waitExit(std::chrono::milliseconds timeout);

    std::string command;
    pid_t pid{-1};
    int stdinFd{-1};
    int stdoutFd{-1};
    int stderrFd{-1};

    std::mutex stateMutex;
    bool reaped{false};
    std::optional<int> exitStatus;
};

} // namespace mcphost
