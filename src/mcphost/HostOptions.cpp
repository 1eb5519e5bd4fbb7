//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HostOptions.cpp
// Purpose: Environment overrides for HostOptions
//==========================================================================================================

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcphost/HostOptions.h"

namespace mcphost {

void ApplyEnvironmentOverrides(HostOptions& options) {
    using std::chrono::milliseconds;
    options.callTimeout = milliseconds(GetEnvUnsignedOrDefault("MCPHOST_CALL_TIMEOUT_MS",
                                       static_cast<unsigned long>(options.callTimeout.count())));
    options.initializeTimeout = milliseconds(GetEnvUnsignedOrDefault("MCPHOST_INIT_TIMEOUT_MS",
                                             static_cast<unsigned long>(options.initializeTimeout.count())));
    options.listTimeout = milliseconds(GetEnvUnsignedOrDefault("MCPHOST_LIST_TIMEOUT_MS",
                                       static_cast<unsigned long>(options.listTimeout.count())));
    options.debug = GetEnvFlag("MCPHOST_DEBUG", options.debug);
    LOG_DEBUG("HostOptions: call={}ms init={}ms list={}ms debug={}", options.callTimeout.count(),
              options.initializeTimeout.count(), options.listTimeout.count(), options.debug);
}

} // namespace mcphost
