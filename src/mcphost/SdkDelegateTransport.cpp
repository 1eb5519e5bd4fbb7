//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SdkDelegateTransport.cpp
// Purpose: SDK client delegation with subprocess fallback, and the strict default SDK client
//==========================================================================================================

#include <format>
#include <mutex>

#include "logging/Logger.h"
#include "mcphost/ChildProcess.hpp"
#include "mcphost/FrameCodec.h"
#include "mcphost/HandshakeNegotiator.h"
#include "mcphost/SdkDelegateTransport.hpp"
#include "mcphost/StderrDrain.hpp"
#include "mcphost/SubprocessTransport.hpp"
#include "mcphost/TransportError.h"
#include "mcphost/async/Offload.h"

namespace mcphost {

////////////////////////////////////////////// StrictSdkClient //////////////////////////////////////////////

class StrictSdkClient::Impl {
public:
    using Clock = std::chrono::steady_clock;

    ServerDescriptor descriptor;
    HostOptions options;
    std::mutex ioMutex;
    std::unique_ptr<ChildProcess> child;
    std::unique_ptr<StderrDrain> drain;
    std::unique_ptr<FdByteSource> source;
    std::unique_ptr<FrameDecoder> decoder;
    int64_t nextId{1};

    Impl(ServerDescriptor d, HostOptions o) : descriptor(std::move(d)), options(std::move(o)) {}

    void launch() {
        child = ChildProcess::Spawn(descriptor.launch);
        drain = std::make_unique<StderrDrain>(child->StderrFd(), options.stderrCapacity, descriptor.name + "/sdk");
        drain->Start();
        ChildProcess* proc = child.get();
        source = std::make_unique<FdByteSource>(child->StdoutFd(), [proc]() { return proc->Running(); });
        decoder = std::make_unique<FrameDecoder>(*source);
    }

    std::string diagnostics() const {
        return drain ? drain->Snapshot() : std::string();
    }

    JSONValue roundTrip(const std::string& method, JSONValue params, std::chrono::milliseconds timeout) {
        std::lock_guard<std::mutex> lk(ioMutex);
        if (!child) {
            throw TransportError(ErrorKind::ConnectionFailed, "sdk client is not connected");
        }
        const auto deadline = Clock::now() + timeout;
        JSONRPCRequest req(nextId++, method, std::move(params));
        child->WriteAll(EncodeFrame(req, FramingMode::Raw), deadline);

        FrameDecoder::DecodeResult r = decoder->DecodeUntil(deadline);
        switch (r.status) {
            case FrameDecoder::DecodeStatus::Timeout:
                throw TransportError(ErrorKind::Timeout, std::format("sdk client: {} timed out", method));
            case FrameDecoder::DecodeStatus::StreamClosed:
                throw TransportError(ErrorKind::ProcessExited, std::format("sdk client: server exited during {}", method));
            case FrameDecoder::DecodeStatus::Malformed:
                throw TransportError(ErrorKind::DecodeError, std::format("sdk client: malformed reply to {}", method))
                    .WithRawResponse(r.raw);
            case FrameDecoder::DecodeStatus::Ok:
                break;
        }
        JSONRPCResponse resp;
        if (!resp.FromValue(r.message.value()) || IdToString(resp.id) != IdToString(req.id)) {
            throw TransportError(ErrorKind::ProtocolError, std::format("sdk client: unexpected message in reply to {}", method))
                .WithRawResponse(r.raw);
        }
        if (resp.IsError() || !resp.result) {
            throw TransportError(ErrorKind::ProtocolError, std::format("sdk client: {} failed: {}", method, resp.ErrorMessage()))
                .WithRawResponse(r.raw);
        }
        return *resp.result;
    }
};

StrictSdkClient::StrictSdkClient(ServerDescriptor descriptor, HostOptions options)
    : pImpl(std::make_unique<Impl>(std::move(descriptor), std::move(options))) {}

StrictSdkClient::~StrictSdkClient() {
    Close();
}

HandshakeResult StrictSdkClient::Initialize() {
    FUNC_SCOPE();
    pImpl->launch();
    const std::string version = pImpl->descriptor.protocolVersion.empty()
        ? std::string(ProtocolVersions::Default) : pImpl->descriptor.protocolVersion;
    JSONValue result = pImpl->roundTrip(Methods::Initialize,
        HandshakeNegotiator::ModernParams(version, pImpl->options.clientName, pImpl->options.clientVersion),
        pImpl->options.initializeTimeout);
    if (!result.IsObject()) {
        throw TransportError(ErrorKind::HandshakeFailure, "sdk client: initialize result is not an object");
    }
    {
        std::lock_guard<std::mutex> lk(pImpl->ioMutex);
        JSONRPCNotification initialized(Methods::Initialized, JSONValue(JSONValue::Object{}));
        pImpl->child->WriteAll(EncodeFrame(initialized, FramingMode::Raw),
                               Impl::Clock::now() + pImpl->options.initializeTimeout);
    }
    HandshakeResult r;
    r.strategy = HandshakeStrategy::Modern;
    r.protocolVersion = GetStringMember(result, "protocolVersion").value_or(version);
    if (const JSONValue* info = result.Find("serverInfo")) {
        r.serverName = GetStringMember(*info, "name").value_or(std::string());
        r.serverVersion = GetStringMember(*info, "version").value_or(std::string());
    }
    const JSONValue* caps = result.Find("capabilities");
    r.capabilities = (caps && caps->IsObject()) ? *caps : JSONValue(JSONValue::Object{});
    r.rawResponse = SerializeJSON(result);
    return r;
}

std::vector<ToolInfo> StrictSdkClient::ListTools() {
    FUNC_SCOPE();
    JSONValue result = pImpl->roundTrip(Methods::ListTools, JSONValue(JSONValue::Object{}), pImpl->options.listTimeout);
    const JSONValue::Array* tools = GetArrayMember(result, "tools");
    if (!tools) {
        throw TransportError(ErrorKind::DiscoveryFailure, "sdk client: tools/list result has no tools array");
    }
    return ToolInfosFromArray(*tools);
}

JSONValue StrictSdkClient::CallTool(const std::string& name, const JSONValue& arguments,
                                    std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    return pImpl->roundTrip(Methods::CallTool,
                            MakeObject({{"name", JSONValue(name)}, {"arguments", arguments}}), timeout);
}

void StrictSdkClient::Close() {
    std::lock_guard<std::mutex> lk(pImpl->ioMutex);
    if (pImpl->child) {
        pImpl->child->Terminate(pImpl->options.closeGrace);
    }
    if (pImpl->drain) {
        pImpl->drain->Stop();
    }
    pImpl->decoder.reset();
    pImpl->source.reset();
    pImpl->child.reset();
}

std::string StrictSdkClient::DiagnosticText() const {
    return pImpl->diagnostics();
}

SdkClientFactory StrictSdkClient::Factory() {
    return [](const ServerDescriptor& descriptor, const HostOptions& options) -> std::unique_ptr<ISdkClient> {
        return std::make_unique<StrictSdkClient>(descriptor, options);
    };
}

//////////////////////////////////////////// SdkDelegateTransport ////////////////////////////////////////////

class SdkDelegateTransport::Impl {
public:
    ServerDescriptor descriptor;
    HostOptions options;
    net::thread_pool& pool;
    SdkClientFactory factory;

    std::shared_ptr<ISdkClient> client;
    std::unique_ptr<SubprocessTransport> fallback;
    std::string sdkDiagnostics;

    Impl(ServerDescriptor d, HostOptions o, net::thread_pool& p, SdkClientFactory f)
        : descriptor(std::move(d)), options(std::move(o)), pool(p), factory(std::move(f)) {}

    net::awaitable<void> dropClient() {
        std::shared_ptr<ISdkClient> c = std::move(client);
        if (!c) {
            co_return;
        }
        sdkDiagnostics = c->DiagnosticText();
        co_await async::RunBlocking(pool, [c]() { c->Close(); });
    }

    net::awaitable<HandshakeResult> startFallback(const std::string& reason) {
        LOG_WARN("SdkDelegateTransport[{}]: sdk client failed ({}); falling back to framed subprocess",
                 descriptor.name, reason);
        co_await dropClient();
        fallback = std::make_unique<SubprocessTransport>(descriptor, options, pool);
        co_return co_await fallback->Initialize();
    }
};

SdkDelegateTransport::SdkDelegateTransport(ServerDescriptor descriptor, HostOptions options, net::thread_pool& pool,
                                           SdkClientFactory factory)
    : pImpl(std::make_unique<Impl>(std::move(descriptor), std::move(options), pool, std::move(factory))) {}

SdkDelegateTransport::~SdkDelegateTransport() {
    if (pImpl->client) {
        pImpl->client->Close();
    }
}

net::awaitable<HandshakeResult> SdkDelegateTransport::Initialize() {
    FUNC_SCOPE();
    Impl* impl = pImpl.get();
    std::string failure;
    try {
        std::shared_ptr<ISdkClient> c(impl->factory(impl->descriptor, impl->options));
        if (!c) {
            throw TransportError(ErrorKind::ConnectionFailed, "sdk client factory returned no client");
        }
        impl->client = c;
        HandshakeResult r = co_await async::RunBlocking(impl->pool, [c]() { return c->Initialize(); });
        LOG_INFO("SdkDelegateTransport[{}]: sdk client initialized (server={})", impl->descriptor.name, r.serverName);
        co_return r;
    } catch (const std::exception& e) {
        failure = e.what();
    }
    co_return co_await impl->startFallback(failure);
}

net::awaitable<std::vector<ToolInfo>> SdkDelegateTransport::ListTools() {
    FUNC_SCOPE();
    Impl* impl = pImpl.get();
    if (!impl->fallback) {
        std::string failure = "sdk client is not initialized";
        if (std::shared_ptr<ISdkClient> c = impl->client) {
            try {
                co_return co_await async::RunBlocking(impl->pool, [c]() { return c->ListTools(); });
            } catch (const std::exception& e) {
                failure = e.what();
            }
        }
        co_await impl->startFallback(failure);
    }
    co_return co_await impl->fallback->ListTools();
}

net::awaitable<JSONValue> SdkDelegateTransport::CallTool(std::string name, JSONValue arguments,
                                                         std::chrono::milliseconds timeout) {
    Impl* impl = pImpl.get();
    if (impl->fallback) {
        co_return co_await impl->fallback->CallTool(std::move(name), std::move(arguments), timeout);
    }
    std::shared_ptr<ISdkClient> c = impl->client;
    if (!c) {
        throw TransportError(ErrorKind::NoActiveSession, "sdk client is closed");
    }
    if (arguments.IsNull()) {
        arguments = JSONValue(JSONValue::Object{});
    }
    co_return co_await async::RunBlocking(impl->pool, [c, n = std::move(name), a = std::move(arguments), timeout]() {
        return c->CallTool(n, a, timeout);
    });
}

net::awaitable<void> SdkDelegateTransport::Close() {
    FUNC_SCOPE();
    co_await pImpl->dropClient();
    if (pImpl->fallback) {
        co_await pImpl->fallback->Close();
    }
}

std::string SdkDelegateTransport::DiagnosticText() const {
    if (pImpl->fallback) {
        return pImpl->fallback->DiagnosticText();
    }
    if (pImpl->client) {
        return pImpl->client->DiagnosticText();
    }
    return pImpl->sdkDiagnostics;
}

bool SdkDelegateTransport::ResourceMode() const {
    return pImpl->fallback && pImpl->fallback->ResourceMode();
}

std::optional<std::size_t> SdkDelegateTransport::ResourceCount() const {
    return pImpl->fallback ? pImpl->fallback->ResourceCount() : std::nullopt;
}

bool SdkDelegateTransport::UsingFallback() const {
    return pImpl->fallback != nullptr;
}

} // namespace mcphost
