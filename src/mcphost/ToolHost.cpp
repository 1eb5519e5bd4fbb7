//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolHost.cpp
// Purpose: Server registry, session lifecycle and tool dispatch over every configured MCP server
//==========================================================================================================

#include <algorithm>
#include <atomic>
#include <format>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>

#include "logging/Logger.h"
#include "mcphost/ToolHost.h"
#include "mcphost/async/AsyncGate.h"
#include "mcphost/async/Offload.h"

namespace mcphost {

const char* SessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Connecting: return "connecting";
        case SessionState::Ready: return "ready";
        case SessionState::Closed: return "closed";
    }
    return "unknown";
}

namespace {

struct Session {
    ServerDescriptor descriptor;
    std::unique_ptr<IToolTransport> transport;
    std::atomic<SessionState> state{SessionState::Connecting};
    async::AsyncGate gate;

    // Guarded by the host mutex
    HandshakeResult handshake;
    bool resourceMode{false};
    std::optional<std::size_t> resourceCount;
    std::size_t reinitializations{0};
};

std::string describeTarget(const ServerDescriptor& d) {
    if (d.transport == TransportKind::Http) {
        return std::format("{} {}", TransportKindName(d.transport), d.endpoint.url);
    }
    return std::format("{} {}", TransportKindName(d.transport), d.launch.command);
}

std::string describeException(const std::exception_ptr& eptr) {
    try {
        std::rethrow_exception(eptr);
    } catch (const std::exception& e) {
        return e.what();
    }
    return "unknown error";
}

} // namespace

class ToolHost::Impl {
public:
    HostOptions options;
    TransportFactory factory;

    net::io_context ioc;
    net::executor_work_guard<net::io_context::executor_type> work;
    net::thread_pool pool;
    std::thread loop;

    ToolCatalog catalog;
    InteractionLog interactions;

    mutable std::mutex mutex;
    std::vector<std::string> order;
    std::map<std::string, ServerDescriptor> descriptors;
    std::map<std::string, std::shared_ptr<Session>> sessions;
    std::map<std::string, ConnectFailure> lastErrors;
    std::atomic<uint64_t> callCounter{0};

    Impl(HostOptions o, TransportFactory f)
        : options(std::move(o)),
          factory(std::move(f)),
          work(net::make_work_guard(ioc)),
          pool(std::max<std::size_t>(1, options.workerThreads)),
          catalog(options.toolIdCap),
          interactions(options.logStringLimit, options.logArrayLimit, options.logHistory) {
        loop = std::thread([this]() {
            try {
                ioc.run();
            } catch (const std::exception& e) {
                LOG_ERROR("ToolHost: event loop terminated: {}", e.what());
            }
        });
    }

    void shutdown() {
        work.reset();
        if (loop.joinable()) {
            loop.join();
        }
        pool.join();
    }

    std::shared_ptr<Session> findSession(const std::string& name) const {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = sessions.find(name);
        return it == sessions.end() ? nullptr : it->second;
    }

    void rememberFailure(const std::string& name, const TransportError& e) {
        std::lock_guard<std::mutex> lk(mutex);
        lastErrors[name] = ConnectFailure{name, e.KindName(), e.what()};
    }

    std::optional<std::string> diagnosticsFor(const TransportError& e) const {
        if (!options.debug) {
            return std::nullopt;
        }
        return e.Diagnostics();
    }

    net::awaitable<void> closeTransport(IToolTransport& transport, std::string name) {
        std::optional<std::string> failure;
        try {
            co_await transport.Close();
        } catch (const std::exception& e) {
            failure = e.what();
        }
        if (failure) {
            LOG_WARN("ToolHost: closing '{}' reported: {}", name, *failure);
        }
    }

    // Initialize (and optionally list tools) on a fresh transport; errors are returned, not thrown
    net::awaitable<std::optional<TransportError>> establish(std::shared_ptr<Session> session, bool listTools,
                                                            std::vector<ToolInfo>& tools) {
        std::optional<TransportError> failure;
        try {
            session->transport = factory(session->descriptor, options, pool);
            HandshakeResult hs = co_await session->transport->Initialize();
            if (listTools) {
                tools = co_await session->transport->ListTools();
            }
            std::lock_guard<std::mutex> lk(mutex);
            session->handshake = std::move(hs);
            session->resourceMode = session->transport->ResourceMode();
            session->resourceCount = session->transport->ResourceCount();
        } catch (const TransportError& e) {
            failure = e;
        } catch (const std::exception& e) {
            failure = TransportError(ErrorKind::ConnectionFailed, e.what());
        }
        if (failure && session->transport) {
            co_await closeTransport(*session->transport, session->descriptor.name);
        }
        co_return failure;
    }

    net::awaitable<void> disconnectOne(std::string name) {
        std::shared_ptr<Session> session;
        {
            std::lock_guard<std::mutex> lk(mutex);
            auto it = sessions.find(name);
            if (it != sessions.end()) {
                session = it->second;
                sessions.erase(it);
            }
        }
        if (!session) {
            catalog.RemoveServer(name);
            co_return;
        }
        session->state.store(SessionState::Closed);
        auto holder = co_await session->gate.Acquire();
        const std::size_t removed = catalog.RemoveServer(name);
        if (session->transport) {
            co_await closeTransport(*session->transport, name);
        }
        interactions.ConnectionEvent(name, InteractionType::ConnectionClosed,
                                     std::format("disconnected; {} tool(s) removed", removed));
        LOG_INFO("ToolHost: disconnected '{}'", name);
    }

    net::awaitable<std::optional<ConnectFailure>> connectOne(std::string name) {
        std::optional<ServerDescriptor> descriptor;
        {
            std::lock_guard<std::mutex> lk(mutex);
            auto it = descriptors.find(name);
            if (it != descriptors.end()) {
                descriptor = it->second;
            }
        }
        if (!descriptor) {
            co_return ConnectFailure{name, ErrorKindName(ErrorKind::ConnectionFailed), "server is not registered"};
        }
        if (findSession(name)) {
            co_await disconnectOne(name);
        }

        auto session = std::make_shared<Session>();
        session->descriptor = *descriptor;
        auto holder = co_await session->gate.Acquire();
        {
            std::lock_guard<std::mutex> lk(mutex);
            sessions[name] = session;
        }
        interactions.ConnectionEvent(name, InteractionType::ConnectionAttempt, describeTarget(*descriptor));
        LOG_INFO("ToolHost: connecting '{}' ({})", name, describeTarget(*descriptor));

        std::vector<ToolInfo> tools;
        std::optional<TransportError> failure = co_await establish(session, true, tools);
        if (!failure && session->state.load() == SessionState::Closed) {
            co_await closeTransport(*session->transport, name);
            failure = TransportError(ErrorKind::ConnectionFailed, "disconnected while connecting");
        }
        if (failure) {
            session->state.store(SessionState::Closed);
            {
                std::lock_guard<std::mutex> lk(mutex);
                auto it = sessions.find(name);
                if (it != sessions.end() && it->second == session) {
                    sessions.erase(it);
                }
            }
            rememberFailure(name, *failure);
            LOG_ERROR("ToolHost: connecting '{}' failed [{}]: {}", name, failure->KindName(), failure->what());
            interactions.Record(name, InteractionType::ConnectionFailure, MakeObject({
                {"details", JSONValue(std::string(failure->what()))},
                {"kind", JSONValue(failure->KindName())}
            }));
            co_return ConnectFailure{name, failure->KindName(), failure->what()};
        }

        std::vector<ToolRecord> records = catalog.ReplaceServerTools(name, tools);
        {
            std::lock_guard<std::mutex> lk(mutex);
            lastErrors.erase(name);
        }
        session->state.store(SessionState::Ready);
        interactions.ConnectionEvent(name, InteractionType::ConnectionSuccess,
                                     std::format("{} tool(s) available", records.size()));
        LOG_INFO("ToolHost: '{}' ready with {} tool(s)", name, records.size());
        co_return std::nullopt;
    }

    // Replaces a failed HTTP session with a freshly initialized one; nullptr when that fails too
    net::awaitable<std::shared_ptr<Session>> reinitialize(std::shared_ptr<Session> old, TransportError& error) {
        const std::string name = old->descriptor.name;
        old->state.store(SessionState::Closed);
        co_await closeTransport(*old->transport, name);

        auto fresh = std::make_shared<Session>();
        fresh->descriptor = old->descriptor;
        std::vector<ToolInfo> unused;
        std::optional<TransportError> failure = co_await establish(fresh, false, unused);
        if (failure) {
            {
                std::lock_guard<std::mutex> lk(mutex);
                auto it = sessions.find(name);
                if (it != sessions.end() && it->second == old) {
                    sessions.erase(it);
                }
            }
            catalog.RemoveServer(name);
            rememberFailure(name, *failure);
            interactions.Record(name, InteractionType::ConnectionFailure, MakeObject({
                {"details", JSONValue("reinitialize failed: " + std::string(failure->what()))},
                {"kind", JSONValue(failure->KindName())}
            }));
            LOG_ERROR("ToolHost: reinitializing '{}' failed; session closed", name);
            error = *failure;
            co_return nullptr;
        }
        {
            std::lock_guard<std::mutex> lk(mutex);
            fresh->reinitializations = old->reinitializations + 1;
            sessions[name] = fresh;
        }
        fresh->state.store(SessionState::Ready);
        LOG_INFO("ToolHost: '{}' reinitialized", name);
        co_return fresh;
    }

    net::awaitable<JSONValue> dispatch(std::string server, std::string tool, JSONValue arguments) {
        const std::string requestId = std::format("call-{}", callCounter.fetch_add(1) + 1);
        std::shared_ptr<Session> session = findSession(server);
        if (!session || session->state.load() != SessionState::Ready) {
            co_return MakeErrorResult(server, tool, ErrorKind::NoActiveSession,
                                      std::format("no active session for server '{}'", server));
        }
        if (!catalog.Find(server, tool)) {
            co_return MakeErrorResult(server, tool, ErrorKind::NoSuchTool,
                                      std::format("server '{}' has no tool '{}'", server, tool));
        }

        interactions.ToolCall(server, tool, arguments, requestId);
        const auto started = std::chrono::steady_clock::now();

        std::optional<async::AsyncGate::Holder> holder;
        holder.emplace(co_await session->gate.Acquire());
        if (session->state.load() != SessionState::Ready) {
            std::shared_ptr<Session> current = findSession(server);
            if (!current || current == session || current->state.load() != SessionState::Ready) {
                co_return MakeErrorResult(server, tool, ErrorKind::NoActiveSession,
                                          std::format("session for server '{}' closed", server));
            }
            holder.reset();
            session = current;
            holder.emplace(co_await session->gate.Acquire());
        }

        JSONValue result;
        std::optional<TransportError> failure;
        try {
            result = co_await session->transport->CallTool(tool, arguments, options.callTimeout);
        } catch (const TransportError& e) {
            failure = e;
        } catch (const std::exception& e) {
            failure = TransportError(ErrorKind::ProtocolError, e.what());
        }

        if (failure && session->descriptor.transport == TransportKind::Http) {
            LOG_WARN("ToolHost: {} on '{}' failed [{}]; reinitializing and retrying once", tool, server,
                     failure->KindName());
            interactions.Failure(server, failure->what(), MakeObject({
                {"tool", JSONValue(tool)}, {"kind", JSONValue(failure->KindName())}, {"action", JSONValue("reinitialize")}
            }));
            TransportError reinitError = *failure;
            std::optional<async::AsyncGate::Holder> freshHolder;
            std::shared_ptr<Session> fresh = co_await reinitialize(session, reinitError);
            if (!fresh) {
                failure = TransportError(reinitError.Kind(),
                                         std::format("reinitialize after {} failed: {}", failure->KindName(),
                                                     reinitError.what()));
                failure->WithDiagnostics(reinitError.Diagnostics().value_or(std::string()));
            } else {
                freshHolder.emplace(co_await fresh->gate.Acquire());
                holder.reset();
                session = fresh;
                failure.reset();
                try {
                    result = co_await session->transport->CallTool(tool, arguments, options.callTimeout);
                } catch (const TransportError& e) {
                    failure = e;
                } catch (const std::exception& e) {
                    failure = TransportError(ErrorKind::ProtocolError, e.what());
                }
            }
        }

        const double elapsedMs = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
        if (failure) {
            LOG_WARN("ToolHost: {} on '{}' failed [{}]: {}", tool, server, failure->KindName(), failure->what());
            interactions.Failure(server, failure->what(), MakeObject({
                {"tool", JSONValue(tool)},
                {"arguments", arguments},
                {"duration_ms", JSONValue(elapsedMs)},
                {"kind", JSONValue(failure->KindName())}
            }));
            co_return MakeErrorResult(server, tool, failure->Kind(), failure->what(), diagnosticsFor(*failure));
        }
        interactions.ToolResponse(server, tool, result, requestId, elapsedMs);
        co_return result;
    }

    std::future<ConnectReport> connectMany(std::vector<std::string> names) {
        struct Pending {
            std::promise<ConnectReport> promise;
            ConnectReport report;
            std::size_t remaining{0};
        };
        auto pending = std::make_shared<Pending>();
        pending->remaining = names.size();
        pending->report.attempted = names.size();
        std::future<ConnectReport> fut = pending->promise.get_future();
        if (names.empty()) {
            pending->promise.set_value(pending->report);
            return fut;
        }
        for (const auto& name : names) {
            net::co_spawn(ioc, connectOne(name),
                [pending, name](std::exception_ptr eptr, std::optional<ConnectFailure> failure) {
                    if (eptr) {
                        failure = ConnectFailure{name, ErrorKindName(ErrorKind::ConnectionFailed), describeException(eptr)};
                    }
                    if (failure) {
                        pending->report.failed += 1;
                        pending->report.failures.push_back(std::move(*failure));
                    } else {
                        pending->report.succeeded += 1;
                    }
                    pending->remaining -= 1;
                    if (pending->remaining == 0) {
                        std::sort(pending->report.failures.begin(), pending->report.failures.end(),
                                  [](const ConnectFailure& a, const ConnectFailure& b) { return a.server < b.server; });
                        pending->promise.set_value(std::move(pending->report));
                    }
                });
        }
        return fut;
    }

    std::future<void> disconnectMany(std::vector<std::string> names) {
        struct Pending {
            std::promise<void> promise;
            std::size_t remaining{0};
        };
        auto pending = std::make_shared<Pending>();
        pending->remaining = names.size();
        std::future<void> fut = pending->promise.get_future();
        if (names.empty()) {
            pending->promise.set_value();
            return fut;
        }
        for (const auto& name : names) {
            net::co_spawn(ioc, disconnectOne(name), [pending, name](std::exception_ptr eptr) {
                if (eptr) {
                    LOG_ERROR("ToolHost: disconnecting '{}' failed: {}", name, describeException(eptr));
                }
                pending->remaining -= 1;
                if (pending->remaining == 0) {
                    pending->promise.set_value();
                }
            });
        }
        return fut;
    }

    net::awaitable<void> removeOne(std::string name) {
        co_await disconnectOne(name);
        std::lock_guard<std::mutex> lk(mutex);
        descriptors.erase(name);
        lastErrors.erase(name);
        order.erase(std::remove(order.begin(), order.end(), name), order.end());
        LOG_INFO("ToolHost: removed server '{}'", name);
    }

    void requireRegistered(const std::string& name) const {
        std::lock_guard<std::mutex> lk(mutex);
        if (descriptors.find(name) == descriptors.end()) {
            throw std::invalid_argument("server '" + name + "' is not registered");
        }
    }
};

ToolHost::ToolHost(HostOptions options, TransportFactory factory)
    : pImpl(std::make_unique<Impl>(std::move(options), std::move(factory))) {}

ToolHost::~ToolHost() {
    try {
        DisconnectAll().get();
    } catch (const std::exception& e) {
        LOG_ERROR("ToolHost: shutdown disconnect failed: {}", e.what());
    }
    pImpl->shutdown();
}

void ToolHost::AddServer(ServerDescriptor descriptor) {
    FUNC_SCOPE();
    ValidateDescriptor(descriptor);
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    if (pImpl->descriptors.count(descriptor.name) != 0) {
        throw std::invalid_argument("server '" + descriptor.name + "' is already registered");
    }
    LOG_INFO("ToolHost: registered '{}' ({}{})", descriptor.name, describeTarget(descriptor),
             descriptor.enabled ? "" : ", disabled");
    pImpl->order.push_back(descriptor.name);
    pImpl->descriptors.emplace(descriptor.name, std::move(descriptor));
}

std::future<void> ToolHost::RemoveServer(const std::string& name) {
    FUNC_SCOPE();
    pImpl->requireRegistered(name);
    return async::SpawnFuture(pImpl->ioc.get_executor(), pImpl->removeOne(name));
}

std::vector<std::string> ToolHost::GetServerNames() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->order;
}

std::future<ConnectReport> ToolHost::ConnectAll() {
    FUNC_SCOPE();
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        for (const auto& name : pImpl->order) {
            if (pImpl->descriptors.at(name).enabled) {
                names.push_back(name);
            } else {
                LOG_INFO("ToolHost: '{}' is disabled; not connecting", name);
            }
        }
    }
    return pImpl->connectMany(std::move(names));
}

std::future<ConnectReport> ToolHost::ConnectServer(const std::string& name) {
    FUNC_SCOPE();
    pImpl->requireRegistered(name);
    return pImpl->connectMany({name});
}

std::future<void> ToolHost::DisconnectServer(const std::string& name) {
    FUNC_SCOPE();
    return pImpl->disconnectMany({name});
}

std::future<void> ToolHost::DisconnectAll() {
    FUNC_SCOPE();
    std::vector<std::string> names;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        for (const auto& [name, session] : pImpl->sessions) {
            names.push_back(name);
        }
    }
    return pImpl->disconnectMany(std::move(names));
}

std::vector<ToolRecord> ToolHost::GetToolCatalog() const {
    return pImpl->catalog.Snapshot();
}

std::future<JSONValue> ToolHost::CallTool(const std::string& server, const std::string& tool, JSONValue arguments) {
    FUNC_SCOPE();
    return async::SpawnFuture(pImpl->ioc.get_executor(), pImpl->dispatch(server, tool, std::move(arguments)));
}

std::future<JSONValue> ToolHost::CallToolById(const std::string& id, JSONValue arguments) {
    FUNC_SCOPE();
    std::optional<ToolRecord> record = pImpl->catalog.Resolve(id);
    if (!record) {
        std::promise<JSONValue> missing;
        missing.set_value(MakeErrorResult(std::string(), id, ErrorKind::NoSuchTool,
                                          std::format("no tool with id '{}'", id)));
        return missing.get_future();
    }
    return async::SpawnFuture(pImpl->ioc.get_executor(),
                              pImpl->dispatch(record->server, record->tool, std::move(arguments)));
}

std::vector<ServerStatus> ToolHost::GetServerStatus() const {
    std::vector<ServerStatus> out;
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    for (const auto& name : pImpl->order) {
        const ServerDescriptor& d = pImpl->descriptors.at(name);
        ServerStatus s;
        s.name = name;
        s.description = d.description;
        s.transport = d.transport;
        s.enabled = d.enabled;
        s.isRemote = d.transport == TransportKind::Http;
        if (s.isRemote) {
            s.url = d.endpoint.url;
        }
        if (auto it = pImpl->sessions.find(name); it != pImpl->sessions.end()) {
            const Session& session = *it->second;
            s.state = session.state.load();
            s.connected = *s.state == SessionState::Ready;
            if (s.connected) {
                s.serverName = session.handshake.serverName;
                s.serverVersion = session.handshake.serverVersion;
                s.protocolVersion = session.handshake.protocolVersion;
                s.handshakeStrategy = session.handshake.strategy;
                s.supportsResources = session.resourceMode ||
                    (session.handshake.capabilities.Find("resources") != nullptr);
                s.resourceCount = session.resourceCount;
            }
            s.reinitializations = session.reinitializations;
        }
        s.toolCount = pImpl->catalog.CountForServer(name);
        if (auto it = pImpl->lastErrors.find(name); it != pImpl->lastErrors.end()) {
            s.lastErrorKind = it->second.kind;
            s.lastError = it->second.message;
        }
        out.push_back(std::move(s));
    }
    return out;
}

const InteractionLog& ToolHost::Interactions() const {
    return pImpl->interactions;
}

const HostOptions& ToolHost::Options() const {
    return pImpl->options;
}

JSONValue ToolHost::MakeErrorResult(const std::string& server, const std::string& tool, ErrorKind kind,
                                    const std::string& message, const std::optional<std::string>& diagnostics) {
    JSONValue out = MakeObject({
        {"error", JSONValue(message)},
        {"kind", JSONValue(ErrorKindName(kind))},
        {"server", JSONValue(server)},
        {"tool", JSONValue(tool)}
    });
    if (diagnostics && !diagnostics->empty()) {
        SetMember(out, "diagnostics", JSONValue(*diagnostics));
    }
    return out;
}

} // namespace mcphost
