//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.cpp
// Purpose: fork/exec with three pipes, exec-failure reporting and graceful termination
//==========================================================================================================

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <format>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include "logging/Logger.h"
#include "mcphost/ChildProcess.hpp"
#include "mcphost/TransportError.h"

extern char** environ;

namespace mcphost {

namespace {
std::once_flag sigpipeOnce;

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void closePair(int fds[2]) {
    closeFd(fds[0]);
    closeFd(fds[1]);
}

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overlay) {
    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        const std::string entry(*e);
        const std::size_t eq = entry.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        merged[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (const auto& [k, v] : overlay) {
        merged[k] = v;
    }
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [k, v] : merged) {
        out.push_back(k + "=" + v);
    }
    return out;
}
} // namespace

std::unique_ptr<ChildProcess> ChildProcess::Spawn(const LaunchSpec& spec) {
    FUNC_SCOPE();
    if (spec.command.empty()) {
        throw TransportError(ErrorKind::ConnectionFailed, "launch spec has no command");
    }
    // A server that dies mid-write must surface as EPIPE, not kill the host
    std::call_once(sigpipeOnce, []() { ::signal(SIGPIPE, SIG_IGN); });

    int inPipe[2] = {-1, -1};
    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    int execPipe[2] = {-1, -1};
    if (::pipe2(inPipe, O_CLOEXEC) != 0 || ::pipe2(outPipe, O_CLOEXEC) != 0 ||
        ::pipe2(errPipe, O_CLOEXEC) != 0 || ::pipe2(execPipe, O_CLOEXEC) != 0) {
        const int err = errno;
        closePair(inPipe); closePair(outPipe); closePair(errPipe); closePair(execPipe);
        throw TransportError(ErrorKind::ConnectionFailed,
                             std::format("pipe creation failed for '{}': {}", spec.command, ::strerror(err)));
    }

    // Everything the child needs is prepared before fork
    std::vector<std::string> argvStore;
    argvStore.push_back(spec.command);
    argvStore.insert(argvStore.end(), spec.args.begin(), spec.args.end());
    std::vector<char*> argv;
    for (auto& a : argvStore) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);
    std::vector<std::string> envStore = buildEnvironment(spec.environment);
    std::vector<char*> envp;
    for (auto& e : envStore) {
        envp.push_back(e.data());
    }
    envp.push_back(nullptr);
    const char* cwd = spec.workingDirectory.empty() ? nullptr : spec.workingDirectory.c_str();

    pid_t child = ::fork();
    if (child < 0) {
        const int err = errno;
        closePair(inPipe); closePair(outPipe); closePair(errPipe); closePair(execPipe);
        throw TransportError(ErrorKind::ConnectionFailed,
                             std::format("fork failed for '{}': {}", spec.command, ::strerror(err)));
    }

    if (child == 0) {
        // Child: only async-signal-safe calls from here on
        ::signal(SIGPIPE, SIG_DFL);
        if (::dup2(inPipe[0], STDIN_FILENO) < 0 || ::dup2(outPipe[1], STDOUT_FILENO) < 0 ||
            ::dup2(errPipe[1], STDERR_FILENO) < 0) {
            int err = errno;
            (void)!::write(execPipe[1], &err, sizeof(err));
            ::_exit(127);
        }
        if (cwd && ::chdir(cwd) != 0) {
            int err = errno;
            (void)!::write(execPipe[1], &err, sizeof(err));
            ::_exit(127);
        }
        ::execvpe(argv[0], argv.data(), envp.data());
        int err = errno;
        (void)!::write(execPipe[1], &err, sizeof(err));
        ::_exit(127);
    }

    // Parent
    closeFd(inPipe[0]);
    closeFd(outPipe[1]);
    closeFd(errPipe[1]);
    closeFd(execPipe[1]);

    int childErr = 0;
    ssize_t n = 0;
    do {
        n = ::read(execPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    closeFd(execPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        int status = 0;
        while (::waitpid(child, &status, 0) < 0 && errno == EINTR) {}
        closeFd(inPipe[1]); closeFd(outPipe[0]); closeFd(errPipe[0]);
        throw TransportError(ErrorKind::ConnectionFailed,
                             std::format("failed to launch '{}'{}: {}", spec.command,
                                         cwd ? std::format(" in '{}'", spec.workingDirectory) : std::string(),
                                         ::strerror(childErr)));
    }

    const int flags = ::fcntl(inPipe[1], F_GETFL, 0);
    if (flags >= 0) {
        (void)::fcntl(inPipe[1], F_SETFL, flags | O_NONBLOCK);
    }

    std::unique_ptr<ChildProcess> proc(new ChildProcess());
    proc->command = spec.command;
    proc->pid = child;
    proc->stdinFd = inPipe[1];
    proc->stdoutFd = outPipe[0];
    proc->stderrFd = errPipe[0];
    LOG_INFO("ChildProcess: launched {} (pid={})", spec.command, child);
    return proc;
}

ChildProcess::~ChildProcess() {
    Terminate(std::chrono::milliseconds(0));
    closeFd(stdoutFd);
    closeFd(stderrFd);
}

std::string ChildProcess::Describe() const {
    return std::format("{} (pid={})", command, pid);
}

void ChildProcess::WriteAll(const std::string& data, Clock::time_point deadline) {
    std::size_t total = 0;
    while (total < data.size()) {
        if (stdinFd < 0) {
            throw TransportError(ErrorKind::ProcessExited, "stdin of " + Describe() + " is closed");
        }
        ssize_t w = ::write(stdinFd, data.data() + total, data.size() - total);
        if (w > 0) {
            total += static_cast<std::size_t>(w);
            continue;
        }
        if (w < 0 && errno == EINTR) {
            continue;
        }
        if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            auto now = Clock::now();
            if (now >= deadline) {
                throw TransportError(ErrorKind::Timeout, "timed out writing to " + Describe());
            }
            auto remaining = std::chrono::ceil<std::chrono::milliseconds>(deadline - now);
            struct pollfd pfd{};
            pfd.fd = stdinFd;
            pfd.events = POLLOUT;
            (void)::poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining.count(), 100)));
            if (!Running()) {
                throw TransportError(ErrorKind::ProcessExited, Describe() + " exited while writing");
            }
            continue;
        }
        if (w < 0 && errno == EPIPE) {
            throw TransportError(ErrorKind::ProcessExited, Describe() + " closed its stdin");
        }
        throw TransportError(ErrorKind::ProcessExited,
                             std::format("write to {} failed: {}", Describe(), ::strerror(errno)));
    }
}

void ChildProcess::CloseStdin() {
    closeFd(stdinFd);
}

bool ChildProcess::reapLocked(bool block) {
    if (reaped || pid <= 0) {
        return true;
    }
    int status = 0;
    pid_t r = 0;
    do {
        r = ::waitpid(pid, &status, block ? 0 : WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == pid) {
        reaped = true;
        if (WIFEXITED(status)) {
            exitStatus = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exitStatus = 128 + WTERMSIG(status);
        }
        LOG_DEBUG("ChildProcess: {} exited with status {}", Describe(), exitStatus.value_or(-1));
        return true;
    }
    if (r < 0) {
        // ECHILD: someone else reaped it
        reaped = true;
        return true;
    }
    return false;
}

bool ChildProcess::Running() {
    std::lock_guard<std::mutex> lk(stateMutex);
    return !reapLocked(false);
}

std::optional<int> ChildProcess::ExitStatus() {
    std::lock_guard<std::mutex> lk(stateMutex);
    reapLocked(false);
    return exitStatus;
}

bool ChildProcess::waitExit(std::chrono::milliseconds timeout) {
    const auto deadline = Clock::now() + timeout;
    while (true) {
        if (!Running()) {
            return true;
        }
        if (Clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

void ChildProcess::Terminate(std::chrono::milliseconds grace) {
    CloseStdin();
    if (pid > 0 && !waitExit(grace)) {
        LOG_DEBUG("ChildProcess: sending SIGTERM to {}", Describe());
        ::kill(pid, SIGTERM);
        if (!waitExit(std::chrono::milliseconds(500))) {
            LOG_WARN("ChildProcess: {} ignored SIGTERM; sending SIGKILL", Describe());
            ::kill(pid, SIGKILL);
            std::lock_guard<std::mutex> lk(stateMutex);
            reapLocked(true);
        }
    }
}

} // namespace mcphost
