//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HostOptions.h
// Purpose: Runtime configuration passed explicitly into the host and its transports
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "mcphost/Protocol.h"

namespace mcphost {

//==========================================================================================================
// HostOptions
// Fields:
//   initializeTimeout: Wait for one initialize response (modern strategy, HTTP initialize).
//   compatTimeout: Single read after the compat strategy's three back-to-back payloads.
//   legacyTimeout: Wait for the legacy-minimal strategy.
//   listTimeout: Per method/params variant during tool discovery.
//   callTimeout: One tools/call round trip.
//   connectTimeout: HTTP TCP connect and TLS handshake.
//   closeGrace: Wait for a child to exit on its own after stdin is closed.
//   stderrCapacity: Bytes of stderr retained per subprocess.
//   workerThreads: Pool threads running blocking pipe I/O.
//   toolIdCap: Maximum length of sanitized tool ids.
//   logStringLimit/logArrayLimit: Interaction log payload truncation.
//   debug: Attach captured stderr to structured errors.
//==========================================================================================================
struct HostOptions {
    std::chrono::milliseconds initializeTimeout{10000};
    std::chrono::milliseconds compatTimeout{20000};
    std::chrono::milliseconds legacyTimeout{3000};
    std::chrono::milliseconds listTimeout{5000};
    std::chrono::milliseconds callTimeout{60000};
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::milliseconds closeGrace{2000};
    std::size_t stderrCapacity{64u * 1024u};
    std::size_t workerThreads{4};
    std::size_t toolIdCap{64};
    std::size_t logStringLimit{1000};
    std::size_t logArrayLimit{10};
    std::size_t logHistory{1000};
    std::string clientName{"mcphost"};
    std::string clientVersion;
    std::string fallbackProtocolVersion{ProtocolVersions::Fallback};
    bool debug{false};
};

//==========================================================================================================
// ApplyEnvironmentOverrides
// Purpose: Overrides timeouts and the debug flag from MCPHOST_CALL_TIMEOUT_MS, MCPHOST_INIT_TIMEOUT_MS,
//          MCPHOST_LIST_TIMEOUT_MS and MCPHOST_DEBUG. Called explicitly by the embedding application.
//==========================================================================================================
void ApplyEnvironmentOverrides(HostOptions& options);

} // namespace mcphost
