//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SdkDelegateTransport.hpp
// Purpose: Transport that delegates to a protocol client library and falls back to the framed subprocess
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>

#include <boost/asio/thread_pool.hpp>

#include "mcphost/HostOptions.h"
#include "mcphost/Transport.h"

namespace mcphost {

//==========================================================================================================
// ISdkClient
// Purpose: Blocking facade over an external MCP client library. Implementations throw on any failure.
//==========================================================================================================
class ISdkClient {
public:
    virtual ~ISdkClient() = default;

    virtual HandshakeResult Initialize() = 0;
    virtual std::vector<ToolInfo> ListTools() = 0;
    virtual JSONValue CallTool(const std::string& name, const JSONValue& arguments,
                               std::chrono::milliseconds timeout) = 0;
    virtual void Close() = 0;
    virtual std::string DiagnosticText() const = 0;
};

using SdkClientFactory = std::function<std::unique_ptr<ISdkClient>(const ServerDescriptor&, const HostOptions&)>;

//==========================================================================================================
// StrictSdkClient
// Purpose: Protocol-conforming stdio client with no tolerance: newline-delimited JSON, one modern initialize,
//          one tools/list with {} params. Anything unexpected on the wire is an error.
//==========================================================================================================
class StrictSdkClient : public ISdkClient {
public:
    StrictSdkClient(ServerDescriptor descriptor, HostOptions options);
    ~StrictSdkClient() override;

    HandshakeResult Initialize() override;
    std::vector<ToolInfo> ListTools() override;
    JSONValue CallTool(const std::string& name, const JSONValue& arguments,
                       std::chrono::milliseconds timeout) override;
    void Close() override;
    std::string DiagnosticText() const override;

    static SdkClientFactory Factory();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// SdkDelegateTransport
// Purpose: Runs the SDK client on the worker pool. Any exception from its Initialize or ListTools closes
//          the client and continues with a SubprocessTransport built from the same descriptor; the caller
//          only sees the fallback's outcome. Tool calls are never re-routed.
//==========================================================================================================
class SdkDelegateTransport : public IToolTransport {
public:
    SdkDelegateTransport(ServerDescriptor descriptor, HostOptions options, net::thread_pool& pool,
                         SdkClientFactory factory = StrictSdkClient::Factory());
    ~SdkDelegateTransport() override;

    net::awaitable<HandshakeResult> Initialize() override;
    net::awaitable<std::vector<ToolInfo>> ListTools() override;
    net::awaitable<JSONValue> CallTool(std::string name, JSONValue arguments,
                                       std::chrono::milliseconds timeout) override;
    net::awaitable<void> Close() override;
    TransportKind Kind() const override { return TransportKind::SdkDelegate; }
    std::string DiagnosticText() const override;
    bool ResourceMode() const override;
    std::optional<std::size_t> ResourceCount() const override;

    // True once the subprocess fallback has taken over.
    bool UsingFallback() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcphost
