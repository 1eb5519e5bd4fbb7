//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolCatalog.cpp
// Purpose: Sanitized tool id index over every connected server
//==========================================================================================================

#include <algorithm>
#include <format>
#include <set>

#include "logging/Logger.h"
#include "mcphost/ToolCatalog.h"

namespace mcphost {

namespace {
bool allowedChar(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_' || c == '-';
}
} // namespace

ToolCatalog::ToolCatalog(std::size_t cap) : idCap(std::max(cap, kMinIdCap)) {}

uint32_t ToolCatalog::Fnv1a(const std::string& server, const std::string& tool) {
    uint32_t hash = 2166136261u;
    auto mix = [&hash](unsigned char c) {
        hash ^= c;
        hash *= 16777619u;
    };
    for (char c : server) {
        mix(static_cast<unsigned char>(c));
    }
    mix(0);
    for (char c : tool) {
        mix(static_cast<unsigned char>(c));
    }
    return hash;
}

std::string ToolCatalog::SanitizeText(const std::string& text) {
    std::string out = text;
    for (char& c : out) {
        if (!allowedChar(c)) {
            c = '_';
        }
    }
    return out;
}

std::string ToolCatalog::HashedId(const std::string& server, const std::string& tool, std::size_t cap,
                                  unsigned attempt) {
    std::string suffix = std::format("_{:08x}", Fnv1a(server, tool));
    if (attempt > 0) {
        suffix += std::format("-{}", attempt);
    }
    std::string prefix = SanitizeText(server + "_" + tool);
    const std::size_t room = cap > suffix.size() ? cap - suffix.size() : 0;
    if (prefix.size() > room) {
        prefix.resize(room);
    }
    return prefix + suffix;
}

std::string ToolCatalog::PreferredId(const std::string& server, const std::string& tool, std::size_t cap) {
    const std::string plain = server + "_" + tool;
    if (plain.size() <= cap && std::all_of(plain.begin(), plain.end(), allowedChar)) {
        return plain;
    }
    return HashedId(server, tool, cap);
}

std::size_t ToolCatalog::removeLocked(const std::string& server) {
    std::size_t removed = 0;
    for (auto it = byId.begin(); it != byId.end();) {
        if (it->second.server == server) {
            it = byId.erase(it);
            removed += 1;
        } else {
            ++it;
        }
    }
    return removed;
}

std::string ToolCatalog::freeHashedIdLocked(const std::string& server, const std::string& tool) const {
    std::string id = HashedId(server, tool, idCap);
    for (unsigned attempt = 1; byId.count(id) != 0; ++attempt) {
        id = HashedId(server, tool, idCap, attempt);
    }
    return id;
}

std::vector<ToolRecord> ToolCatalog::ReplaceServerTools(const std::string& server, const std::vector<ToolInfo>& tools) {
    std::lock_guard<std::mutex> lk(mutex);
    removeLocked(server);

    std::vector<ToolRecord> created;
    std::set<std::string> seen;
    for (const auto& tool : tools) {
        if (!seen.insert(tool.name).second) {
            LOG_WARN("ToolCatalog: server '{}' listed tool '{}' more than once; keeping the first", server, tool.name);
            continue;
        }
        const std::string preferred = PreferredId(server, tool.name, idCap);
        if (auto it = byId.find(preferred); it != byId.end()) {
            // Neither claimant keeps a contested id, whichever arrived first
            contested.insert(preferred);
            ToolRecord moved = std::move(it->second);
            byId.erase(it);
            moved.id = freeHashedIdLocked(moved.server, moved.tool);
            LOG_INFO("ToolCatalog: id '{}' is claimed by '{}' and '{}'; {}/{} is now '{}'", preferred, moved.server,
                     server, moved.server, moved.tool, moved.id);
            for (auto& rec : created) {
                if (rec.tool == moved.tool && moved.server == server) {
                    rec.id = moved.id;
                }
            }
            byId.emplace(moved.id, std::move(moved));
        }
        const std::string id = contested.count(preferred) != 0 ? freeHashedIdLocked(server, tool.name) : preferred;
        ToolRecord rec{id, server, tool.name, tool.description, tool.inputSchema};
        byId.emplace(id, rec);
        created.push_back(std::move(rec));
    }
    return created;
}

std::size_t ToolCatalog::RemoveServer(const std::string& server) {
    std::lock_guard<std::mutex> lk(mutex);
    return removeLocked(server);
}

std::optional<ToolRecord> ToolCatalog::Resolve(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = byId.find(id);
    if (it == byId.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<ToolRecord> ToolCatalog::Find(const std::string& server, const std::string& tool) const {
    std::lock_guard<std::mutex> lk(mutex);
    for (const auto& [id, rec] : byId) {
        if (rec.server == server && rec.tool == tool) {
            return rec;
        }
    }
    return std::nullopt;
}

std::vector<ToolRecord> ToolCatalog::Snapshot() const {
    std::lock_guard<std::mutex> lk(mutex);
    std::vector<ToolRecord> out;
    out.reserve(byId.size());
    for (const auto& [id, rec] : byId) {
        out.push_back(rec);
    }
    return out;
}

std::size_t ToolCatalog::CountForServer(const std::string& server) const {
    std::lock_guard<std::mutex> lk(mutex);
    return static_cast<std::size_t>(std::count_if(byId.begin(), byId.end(),
        [&server](const auto& kv) { return kv.second.server == server; }));
}

std::size_t ToolCatalog::Size() const {
    std::lock_guard<std::mutex> lk(mutex);
    return byId.size();
}

} // namespace mcphost
