//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolCatalog.h
// Purpose: Sanitized tool id index over every connected server
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "mcphost/Protocol.h"

namespace mcphost {

//==========================================================================================================
// ToolRecord
// Purpose: One catalog entry.
// Fields:
//   id: Sanitized identifier, unique across the catalog.
//   server/tool: Owning server and the tool's original name.
//   description/inputSchema: Passed through from discovery; the schema is opaque.
//==========================================================================================================
struct ToolRecord {
    std::string id;
    std::string server;
    std::string tool;
    std::string description;
    JSONValue inputSchema;
};

//==========================================================================================================
// ToolCatalog
// Purpose: Maps sanitized ids to (server, tool). Thread-safe; each server's records are swapped as a unit.
// Id rules:
//   `<server>_<tool>` when every character is in [A-Za-z0-9_-] and the cap is respected. Otherwise the id
//   is the sanitized text cut to fit plus `_` and the 8-hex-digit FNV-1a hash of (server, tool).
//   An id claimed by two different (server, tool) pairs is contested: every claimant, including the one
//   already indexed, is re-keyed to its hashed form, and the id stays contested for later rebuilds, so
//   ids do not depend on the order servers connect in.
//==========================================================================================================
class ToolCatalog {
public:
    static constexpr std::size_t kDefaultIdCap = 64;
    static constexpr std::size_t kMinIdCap = 16;

    explicit ToolCatalog(std::size_t idCap = kDefaultIdCap);

    static uint32_t Fnv1a(const std::string& server, const std::string& tool);
    // Replaces characters outside [A-Za-z0-9_-] with '_'
    static std::string SanitizeText(const std::string& text);
    // Preferred id; equals the plain form when nothing had to change
    static std::string PreferredId(const std::string& server, const std::string& tool, std::size_t cap);
    static std::string HashedId(const std::string& server, const std::string& tool, std::size_t cap,
                                unsigned attempt = 0);

    //======================================================================================================
    // ReplaceServerTools
    // Purpose: Drops the server's previous records and indexes `tools` in order. Duplicate tool names
    //          within one listing keep the first entry.
    // Returns: The records created for the server.
    //======================================================================================================
    std::vector<ToolRecord> ReplaceServerTools(const std::string& server, const std::vector<ToolInfo>& tools);

    // Removes every record owned by the server; returns how many were removed.
    std::size_t RemoveServer(const std::string& server);

    std::optional<ToolRecord> Resolve(const std::string& id) const;
    std::optional<ToolRecord> Find(const std::string& server, const std::string& tool) const;

    // All records ordered by id
    std::vector<ToolRecord> Snapshot() const;
    std::size_t CountForServer(const std::string& server) const;
    std::size_t Size() const;
    std::size_t IdCap() const { return idCap; }

private:
    std::size_t removeLocked(const std::string& server);
    std::string freeHashedIdLocked(const std::string& server, const std::string& tool) const;

    std::size_t idCap;
    mutable std::mutex mutex;
    std::map<std::string, ToolRecord> byId;
    std::set<std::string> contested;
};

} // namespace mcphost
