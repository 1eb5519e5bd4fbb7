//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TransportFactory.h
// Purpose: Selects the transport implementation for a server descriptor
//==========================================================================================================

#pragma once

#include <functional>
#include <memory>

#include <boost/asio/thread_pool.hpp>

#include "mcphost/HostOptions.h"
#include "mcphost/SdkDelegateTransport.hpp"
#include "mcphost/Transport.h"

namespace mcphost {

using TransportFactory = std::function<std::unique_ptr<IToolTransport>(const ServerDescriptor&, const HostOptions&,
                                                                       net::thread_pool&)>;

//==========================================================================================================
// DefaultTransportFactory
// Purpose: subprocess -> SubprocessTransport, sdk -> SdkDelegateTransport (using `sdkClients`),
//          http -> HTTPTransport.
//==========================================================================================================
TransportFactory DefaultTransportFactory(SdkClientFactory sdkClients = StrictSdkClient::Factory());

} // namespace mcphost
