//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SubprocessTransport.cpp
// Purpose: Framed JSON-RPC over child process pipes with request-id correlation and tolerant discovery
//==========================================================================================================

#include <atomic>
#include <format>
#include <mutex>
#include <set>

#include "logging/Logger.h"
#include "mcphost/ChildProcess.hpp"
#include "mcphost/FrameCodec.h"
#include "mcphost/HandshakeNegotiator.h"
#include "mcphost/StderrDrain.hpp"
#include "mcphost/SubprocessTransport.hpp"
#include "mcphost/TransportError.h"
#include "mcphost/async/Offload.h"

namespace mcphost {

namespace {
constexpr int kMaxToolPages = 32;
constexpr auto kExitDrainWait = std::chrono::milliseconds(250);
}

class SubprocessTransport::Impl {
public:
    using Clock = std::chrono::steady_clock;

    ServerDescriptor descriptor;
    HostOptions options;
    net::thread_pool& pool;

    std::mutex ioMutex;
    std::unique_ptr<ChildProcess> child;
    std::unique_ptr<StderrDrain> drain;
    std::unique_ptr<FdByteSource> source;
    std::unique_ptr<FrameDecoder> decoder;

    std::atomic<int64_t> nextId{1};
    std::atomic<bool> started{false};
    std::atomic<bool> closed{false};
    std::atomic<bool> resourceMode{false};
    std::atomic<bool> haveResourceCount{false};
    std::atomic<std::size_t> resourceCount{0};

    Impl(ServerDescriptor d, HostOptions o, net::thread_pool& p)
        : descriptor(std::move(d)), options(std::move(o)), pool(p) {}

    ~Impl() {
        closeBlocking();
    }

    std::string diagnostics() const {
        return drain ? drain->Snapshot() : std::string();
    }

    TransportError exited(const std::string& context) {
        if (drain) {
            // The last words on stderr usually explain the exit
            drain->WaitForEof(kExitDrainWait);
        }
        std::string status = "unknown status";
        if (child) {
            if (auto code = child->ExitStatus()) {
                status = std::format("status {}", *code);
            } else {
                status = "stdout closed";
            }
        }
        TransportError err(ErrorKind::ProcessExited,
                           std::format("server '{}' exited ({}) {}", descriptor.name, status, context));
        err.WithDiagnostics(diagnostics());
        return err;
    }

    void startBlocking() {
        std::lock_guard<std::mutex> lk(ioMutex);
        if (started.load()) {
            return;
        }
        if (closed.load()) {
            throw TransportError(ErrorKind::ConnectionFailed, "transport for '" + descriptor.name + "' is closed");
        }
        child = ChildProcess::Spawn(descriptor.launch);
        drain = std::make_unique<StderrDrain>(child->StderrFd(), options.stderrCapacity, descriptor.name);
        try {
            drain->Start();
        } catch (const TransportError&) {
            child->Terminate(std::chrono::milliseconds(0));
            throw;
        }
        ChildProcess* proc = child.get();
        source = std::make_unique<FdByteSource>(child->StdoutFd(), [proc]() { return proc->Running(); });
        decoder = std::make_unique<FrameDecoder>(*source);
        started.store(true);
    }

    void ensureRunning(const std::string& context) {
        if (!started.load() || closed.load() || !child) {
            throw TransportError(ErrorKind::ProcessExited,
                                 "server '" + descriptor.name + "' is not running (" + context + ")");
        }
    }

    void writeFrames(const std::string& payload, Clock::time_point deadline) {
        try {
            child->WriteAll(payload, deadline);
        } catch (TransportError& e) {
            e.WithDiagnostics(diagnostics());
            throw;
        }
    }

    // Replies to requests the server sends us so it never stalls waiting on the host
    void answerServerRequest(const JSONValue& msg, Clock::time_point deadline) {
        JSONRPCRequest req;
        if (!req.FromValue(msg)) {
            LOG_DEBUG("SubprocessTransport[{}]: ignoring server notification {}", descriptor.name,
                      GetStringMember(msg, "method").value_or(std::string("?")));
            return;
        }
        JSONRPCResponse reply;
        reply.id = req.id;
        if (req.method == "ping") {
            reply.result = JSONValue(JSONValue::Object{});
        } else {
            reply.error = CreateErrorObject(JSONRPCErrorCodes::MethodNotFound, "Method not supported by host: " + req.method);
        }
        LOG_DEBUG("SubprocessTransport[{}]: answering server request {}", descriptor.name, req.method);
        writeFrames(EncodeFrame(reply, descriptor.framing), std::max(deadline, Clock::now() + std::chrono::milliseconds(1000)));
    }

    std::optional<JSONRPCResponse> exchangeBlocking(std::vector<JSONRPCRequest> requests, std::chrono::milliseconds timeout) {
        std::lock_guard<std::mutex> lk(ioMutex);
        ensureRunning("exchange");
        const auto deadline = Clock::now() + timeout;

        std::set<std::string> pending;
        std::string payload;
        for (auto& r : requests) {
            r.id = nextId.fetch_add(1);
            pending.insert(IdToString(r.id));
            payload += EncodeFrame(r, descriptor.framing);
            LOG_DEBUG("SubprocessTransport[{}]: -> {} id={}", descriptor.name, r.method, IdToString(r.id));
        }
        writeFrames(payload, deadline);

        std::optional<JSONRPCResponse> lastError;
        std::size_t answered = 0;
        bool sawMalformed = false;
        std::string malformedRaw;
        while (true) {
            FrameDecoder::DecodeResult r = decoder->DecodeUntil(deadline);
            switch (r.status) {
                case FrameDecoder::DecodeStatus::Timeout:
                    if (lastError) {
                        return lastError;
                    }
                    if (sawMalformed) {
                        TransportError err(ErrorKind::DecodeError,
                                           "server '" + descriptor.name + "' sent an undecodable message");
                        err.WithRawResponse(malformedRaw.substr(0, 4096)).WithDiagnostics(diagnostics());
                        throw err;
                    }
                    return std::nullopt;
                case FrameDecoder::DecodeStatus::StreamClosed:
                    throw exited("while awaiting a response");
                case FrameDecoder::DecodeStatus::Malformed:
                    sawMalformed = true;
                    malformedRaw = std::move(r.raw);
                    continue;
                case FrameDecoder::DecodeStatus::Ok:
                    break;
            }

            const JSONValue& msg = r.message.value();
            if (msg.Find("method")) {
                answerServerRequest(msg, deadline);
                continue;
            }
            JSONRPCResponse resp;
            if (!resp.FromValue(msg)) {
                LOG_WARN("SubprocessTransport[{}]: discarding message that is not a response: {}", descriptor.name,
                         r.raw.substr(0, 200));
                continue;
            }
            const bool nullId = std::holds_alternative<std::nullptr_t>(resp.id);
            if (!nullId && pending.find(IdToString(resp.id)) == pending.end()) {
                LOG_DEBUG("SubprocessTransport[{}]: discarding response with stale id {}", descriptor.name,
                          IdToString(resp.id));
                continue;
            }
            if (!resp.IsError()) {
                return resp;
            }
            lastError = std::move(resp);
            answered += 1;
            if (answered >= pending.size()) {
                return lastError;
            }
        }
    }

    void notifyBlocking(const JSONRPCNotification& notification) {
        std::lock_guard<std::mutex> lk(ioMutex);
        ensureRunning("notify");
        LOG_DEBUG("SubprocessTransport[{}]: -> {} (notification)", descriptor.name, notification.method);
        writeFrames(EncodeFrame(notification, descriptor.framing), Clock::now() + options.initializeTimeout);
    }

    void closeBlocking() {
        std::lock_guard<std::mutex> lk(ioMutex);
        if (closed.exchange(true)) {
            return;
        }
        if (child) {
            child->Terminate(options.closeGrace);
            LOG_INFO("SubprocessTransport[{}]: closed {} (exit status {})", descriptor.name, child->Describe(),
                     child->ExitStatus().value_or(-1));
        }
        if (drain) {
            drain->Stop();
        }
    }

    net::awaitable<std::optional<JSONRPCResponse>> exchange(std::vector<JSONRPCRequest> requests,
                                                             std::chrono::milliseconds timeout) {
        co_return co_await async::RunBlocking(pool, [this, reqs = std::move(requests), timeout]() mutable {
            return exchangeBlocking(std::move(reqs), timeout);
        });
    }

    // One request whose error response or silence is a failure
    net::awaitable<JSONValue> request(std::string method, std::optional<JSONValue> params,
                                      std::chrono::milliseconds timeout) {
        std::vector<JSONRPCRequest> reqs;
        reqs.emplace_back(static_cast<int64_t>(0), method, std::move(params));
        std::optional<JSONRPCResponse> resp = co_await exchange(std::move(reqs), timeout);
        if (!resp) {
            TransportError err(ErrorKind::Timeout, std::format("{} on '{}' timed out after {} ms", method,
                                                                descriptor.name, timeout.count()));
            err.WithDiagnostics(diagnostics());
            throw err;
        }
        if (resp->IsError()) {
            TransportError err(ErrorKind::ProtocolError, std::format("{} on '{}' failed: {} (code {})", method,
                                                                      descriptor.name, resp->ErrorMessage(),
                                                                      resp->ErrorCode()));
            err.WithRawResponse(resp->Serialize()).WithDiagnostics(diagnostics());
            throw err;
        }
        co_return resp->result.value_or(JSONValue(nullptr));
    }
};

SubprocessTransport::SubprocessTransport(ServerDescriptor descriptor, HostOptions options, net::thread_pool& pool)
    : pImpl(std::make_unique<Impl>(std::move(descriptor), std::move(options), pool)) {}

SubprocessTransport::~SubprocessTransport() = default;

net::awaitable<void> SubprocessTransport::Start() {
    FUNC_SCOPE();
    Impl* impl = pImpl.get();
    co_await async::RunBlocking(impl->pool, [impl]() { impl->startBlocking(); });
}

net::awaitable<HandshakeResult> SubprocessTransport::Initialize() {
    FUNC_SCOPE();
    co_await Start();
    HandshakeNegotiator negotiator(*this, HandshakeSettings::From(pImpl->descriptor, pImpl->options));
    co_return co_await negotiator.Negotiate(pImpl->descriptor.handshake);
}

net::awaitable<std::vector<ToolInfo>> SubprocessTransport::ListTools() {
    FUNC_SCOPE();
    Impl* impl = pImpl.get();
    const std::string& server = impl->descriptor.name;
    const std::vector<const char*> methods = {Methods::ListTools, Methods::ListToolsDotted};
    const std::vector<std::optional<JSONValue>> shapes = {
        JSONValue(JSONValue::Object{}),
        std::nullopt,
        MakeObject({{"cursor", JSONValue(nullptr)}}),
        MakeObject({{"cursor", JSONValue("")}})
    };

    std::string lastError = "no variant attempted";
    std::string lastRaw;
    for (const char* method : methods) {
        for (const auto& shape : shapes) {
            std::vector<JSONRPCRequest> reqs;
            reqs.emplace_back(static_cast<int64_t>(0), method, shape);
            std::optional<JSONRPCResponse> resp;
            try {
                resp = co_await impl->exchange(std::move(reqs), impl->options.listTimeout);
            } catch (const TransportError& e) {
                if (e.Kind() == ErrorKind::ProcessExited) {
                    throw;
                }
                lastError = std::format("{}: {}", method, e.what());
                continue;
            }
            if (!resp) {
                lastError = std::format("{}: timed out", method);
                continue;
            }
            lastRaw = resp->Serialize();
            if (resp->IsError()) {
                lastError = std::format("{}: {} (code {})", method, resp->ErrorMessage(), resp->ErrorCode());
                continue;
            }
            const JSONValue::Array* tools = resp->result ? GetArrayMember(*resp->result, "tools") : nullptr;
            if (!tools) {
                lastError = std::format("{}: result has no tools array", method);
                continue;
            }

            std::vector<ToolInfo> out = ToolInfosFromArray(*tools);
            std::optional<std::string> cursor = GetStringMember(*resp->result, "nextCursor");
            int pages = 1;
            while (cursor && !cursor->empty() && pages < kMaxToolPages) {
                std::vector<JSONRPCRequest> pageReq;
                pageReq.emplace_back(static_cast<int64_t>(0), method, MakeObject({{"cursor", JSONValue(*cursor)}}));
                std::optional<JSONRPCResponse> page;
                try {
                    page = co_await impl->exchange(std::move(pageReq), impl->options.listTimeout);
                } catch (const TransportError& e) {
                    if (e.Kind() == ErrorKind::ProcessExited) {
                        throw;
                    }
                    LOG_WARN("SubprocessTransport[{}]: page {} of {} failed: {}", server, pages + 1, method, e.what());
                }
                const JSONValue::Array* more = (page && !page->IsError() && page->result)
                    ? GetArrayMember(*page->result, "tools") : nullptr;
                if (!more) {
                    LOG_WARN("SubprocessTransport[{}]: stopping pagination after {} page(s)", server, pages);
                    break;
                }
                for (auto& t : ToolInfosFromArray(*more)) {
                    out.push_back(std::move(t));
                }
                cursor = GetStringMember(*page->result, "nextCursor");
                pages += 1;
            }
            impl->resourceMode.store(false);
            LOG_INFO("SubprocessTransport[{}]: discovered {} tool(s) via {}", server, out.size(), method);
            co_return out;
        }
    }

    LOG_WARN("SubprocessTransport[{}]: tool discovery failed ({}); trying {}", server, lastError, Methods::ListResources);
    std::vector<JSONRPCRequest> resReq;
    resReq.emplace_back(static_cast<int64_t>(0), Methods::ListResources, JSONValue(JSONValue::Object{}));
    std::optional<JSONRPCResponse> resources;
    try {
        resources = co_await impl->exchange(std::move(resReq), impl->options.listTimeout);
    } catch (const TransportError& e) {
        if (e.Kind() == ErrorKind::ProcessExited) {
            throw;
        }
        lastError = std::format("{}; {}: {}", lastError, Methods::ListResources, e.what());
    }
    if (resources && !resources->IsError() && resources->result) {
        if (const JSONValue::Array* list = GetArrayMember(*resources->result, "resources")) {
            impl->resourceMode.store(true);
            impl->resourceCount.store(list->size());
            impl->haveResourceCount.store(true);
            LOG_INFO("SubprocessTransport[{}]: exposing {} resource(s) through generic resource tools", server, list->size());
            co_return MakeResourceTools(server);
        }
    }
    if (resources) {
        lastRaw = resources->Serialize();
    }
    TransportError err(ErrorKind::DiscoveryFailure,
                       std::format("tool discovery failed for '{}': {}", server, lastError));
    err.WithRawResponse(lastRaw).WithDiagnostics(impl->diagnostics());
    throw err;
}

net::awaitable<JSONValue> SubprocessTransport::CallTool(std::string name, JSONValue arguments,
                                                        std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    Impl* impl = pImpl.get();
    if (arguments.IsNull()) {
        arguments = JSONValue(JSONValue::Object{});
    }
    if (impl->resourceMode.load() && name == SyntheticTools::ResourcesList) {
        co_return co_await impl->request(Methods::ListResources, JSONValue(JSONValue::Object{}), timeout);
    }
    if (impl->resourceMode.load() && name == SyntheticTools::ResourceRead) {
        auto uri = GetStringMember(arguments, "uri");
        if (!uri) {
            throw TransportError(ErrorKind::ProtocolError, "resource_read requires a string 'uri' argument");
        }
        co_return co_await impl->request(Methods::ReadResource, MakeObject({{"uri", JSONValue(*uri)}}), timeout);
    }
    co_return co_await impl->request(Methods::CallTool,
                                     MakeObject({{"name", JSONValue(name)}, {"arguments", arguments}}), timeout);
}

net::awaitable<void> SubprocessTransport::Close() {
    FUNC_SCOPE();
    Impl* impl = pImpl.get();
    co_await async::RunBlocking(impl->pool, [impl]() { impl->closeBlocking(); });
}

std::string SubprocessTransport::DiagnosticText() const {
    return pImpl->diagnostics();
}

bool SubprocessTransport::ResourceMode() const {
    return pImpl->resourceMode.load();
}

std::optional<std::size_t> SubprocessTransport::ResourceCount() const {
    if (!pImpl->haveResourceCount.load()) {
        return std::nullopt;
    }
    return pImpl->resourceCount.load();
}

net::awaitable<std::optional<JSONRPCResponse>> SubprocessTransport::Exchange(std::vector<JSONRPCRequest> requests,
                                                                              std::chrono::milliseconds timeout) {
    co_return co_await pImpl->exchange(std::move(requests), timeout);
}

net::awaitable<void> SubprocessTransport::Notify(JSONRPCNotification notification) {
    Impl* impl = pImpl.get();
    co_await async::RunBlocking(impl->pool, [impl, n = std::move(notification)]() { impl->notifyBlocking(n); });
}

} // namespace mcphost
