//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: TransportFactory.cpp
// Purpose: Selects the transport implementation for a server descriptor
//==========================================================================================================

#include <stdexcept>

#include "mcphost/HTTPTransport.hpp"
#include "mcphost/SubprocessTransport.hpp"
#include "mcphost/TransportFactory.h"

namespace mcphost {

TransportFactory DefaultTransportFactory(SdkClientFactory sdkClients) {
    return [sdkClients](const ServerDescriptor& descriptor, const HostOptions& options,
                        net::thread_pool& pool) -> std::unique_ptr<IToolTransport> {
        switch (descriptor.transport) {
            case TransportKind::Subprocess:
                return std::make_unique<SubprocessTransport>(descriptor, options, pool);
            case TransportKind::SdkDelegate:
                return std::make_unique<SdkDelegateTransport>(descriptor, options, pool, sdkClients);
            case TransportKind::Http:
                return std::make_unique<HTTPTransport>(descriptor, options);
        }
        throw std::invalid_argument("unsupported transport for server '" + descriptor.name + "'");
    };
}

} // namespace mcphost
