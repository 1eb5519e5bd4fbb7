//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/TestSupport.h
// Purpose: Shared helpers for driving coroutines and the stub stdio server from tests
//==========================================================================================================

#pragma once

#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "mcphost/ServerDescriptor.h"
#include "mcphost/async/Offload.h"

#ifndef MCPHOST_STUB_SERVER_PATH
#error "MCPHOST_STUB_SERVER_PATH must point at the stub_mcp_server executable"
#endif

namespace mcphost {
namespace testing {

inline std::string StubServerPath() {
    return MCPHOST_STUB_SERVER_PATH;
}

inline ServerDescriptor StubDescriptor(const std::string& name, std::vector<std::string> args = {},
                                       FramingMode framing = FramingMode::Lsp) {
    ServerDescriptor d;
    d.name = name;
    d.transport = TransportKind::Subprocess;
    d.launch.command = StubServerPath();
    d.launch.args = std::move(args);
    d.launch.args.push_back(framing == FramingMode::Lsp ? "--framing=lsp" : "--framing=raw");
    d.framing = framing;
    return d;
}

// Runs one awaitable to completion on a private io_context and returns its value (or rethrows).
template <typename T>
T RunAwaitable(boost::asio::awaitable<T> work) {
    boost::asio::io_context ioc;
    auto fut = async::SpawnFuture(ioc.get_executor(), std::move(work));
    ioc.run();
    return fut.get();
}

} // namespace testing
} // namespace mcphost
