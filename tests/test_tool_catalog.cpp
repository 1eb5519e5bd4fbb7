//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_catalog.cpp
// Purpose: Tests for tool id generation and the aggregated tool catalog
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <regex>
#include <string>
#include <vector>

#include "mcphost/ToolCatalog.h"

using namespace mcphost;

namespace {

ToolInfo makeTool(const std::string& name, const std::string& description = std::string()) {
    ToolInfo t;
    t.name = name;
    t.description = description;
    t.inputSchema = MakeObject({{"type", JSONValue("object")}});
    return t;
}

bool validId(const std::string& id, std::size_t cap) {
    static const std::regex pattern("^[A-Za-z0-9_-]+$");
    return id.size() <= cap && std::regex_match(id, pattern);
}

} // namespace

TEST(ToolIdTest, Fnv1aHashesServerSeparatorAndTool) {
    // FNV-1a of the single byte 0x00
    EXPECT_EQ(ToolCatalog::Fnv1a("", ""), 0x050c5d1fu);
    EXPECT_NE(ToolCatalog::Fnv1a("ab", "c"), ToolCatalog::Fnv1a("a", "bc"));
    EXPECT_EQ(ToolCatalog::Fnv1a("srv", "tool"), ToolCatalog::Fnv1a("srv", "tool"));
}

TEST(ToolIdTest, PlainIdWhenAlreadyValid) {
    EXPECT_EQ(ToolCatalog::PreferredId("A", "echo", 64), "A_echo");
    EXPECT_EQ(ToolCatalog::PreferredId("files-1", "read_file", 64), "files-1_read_file");
}

TEST(ToolIdTest, InvalidCharactersProduceHashedId) {
    const std::string id = ToolCatalog::PreferredId("my server", "tools.list/all", 64);
    EXPECT_TRUE(validId(id, 64)) << id;
    EXPECT_EQ(id.rfind("my_server_tools_list_all_", 0), 0u) << id;
    EXPECT_EQ(id, ToolCatalog::HashedId("my server", "tools.list/all", 64));
}

TEST(ToolIdTest, LongNamesAreTruncatedToCap) {
    const std::string server(50, 's');
    const std::string tool(50, 't');
    const std::string id = ToolCatalog::PreferredId(server, tool, 64);
    EXPECT_EQ(id.size(), 64u);
    EXPECT_TRUE(validId(id, 64)) << id;
    const std::string suffix = id.substr(id.size() - 9);
    EXPECT_EQ(suffix[0], '_');
}

TEST(ToolIdTest, RetryAttemptsAppendCounter) {
    const std::string base = ToolCatalog::HashedId("a", "b", 64, 0);
    const std::string retry = ToolCatalog::HashedId("a", "b", 64, 2);
    EXPECT_EQ(retry, base + "-2");
}

TEST(ToolCatalogTest, CapHasFloor) {
    ToolCatalog catalog(4);
    EXPECT_EQ(catalog.IdCap(), ToolCatalog::kMinIdCap);
}

TEST(ToolCatalogTest, ReplaceKeepsServerOrderAndMetadata) {
    ToolCatalog catalog;
    auto created = catalog.ReplaceServerTools("A", {makeTool("echo", "Echo back"), makeTool("add", "Add numbers")});
    ASSERT_EQ(created.size(), 2u);
    EXPECT_EQ(created[0].id, "A_echo");
    EXPECT_EQ(created[1].id, "A_add");

    auto rec = catalog.Resolve("A_add");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->server, "A");
    EXPECT_EQ(rec->tool, "add");
    EXPECT_EQ(rec->description, "Add numbers");
    EXPECT_EQ(GetStringMember(rec->inputSchema, "type").value_or(""), "object");

    auto snap = catalog.Snapshot();
    ASSERT_EQ(snap.size(), 2u);
    EXPECT_TRUE(std::is_sorted(snap.begin(), snap.end(),
                               [](const ToolRecord& a, const ToolRecord& b) { return a.id < b.id; }));
}

TEST(ToolCatalogTest, DuplicateToolNamesKeepFirst) {
    ToolCatalog catalog;
    auto created = catalog.ReplaceServerTools("A", {makeTool("echo", "first"), makeTool("echo", "second")});
    ASSERT_EQ(created.size(), 1u);
    EXPECT_EQ(catalog.Resolve("A_echo")->description, "first");
}

TEST(ToolCatalogTest, CollidingIdsAcrossServersStayDistinct) {
    ToolCatalog catalog;
    catalog.ReplaceServerTools("a_b", {makeTool("c")});
    auto created = catalog.ReplaceServerTools("a", {makeTool("b_c")});
    ASSERT_EQ(created.size(), 1u);
    EXPECT_NE(created[0].id, "a_b_c");
    EXPECT_TRUE(validId(created[0].id, catalog.IdCap()));

    EXPECT_FALSE(catalog.Resolve("a_b_c").has_value());
    EXPECT_EQ(catalog.Find("a_b", "c")->id, ToolCatalog::HashedId("a_b", "c", catalog.IdCap()));
    EXPECT_EQ(catalog.Resolve(created[0].id)->server, "a");
    EXPECT_EQ(catalog.Size(), 2u);
}

TEST(ToolCatalogTest, CollidingIdsDoNotDependOnInsertionOrder) {
    ToolCatalog first;
    first.ReplaceServerTools("a_b", {makeTool("c")});
    first.ReplaceServerTools("a", {makeTool("b_c")});

    ToolCatalog second;
    second.ReplaceServerTools("a", {makeTool("b_c")});
    second.ReplaceServerTools("a_b", {makeTool("c")});

    EXPECT_EQ(first.Find("a_b", "c")->id, second.Find("a_b", "c")->id);
    EXPECT_EQ(first.Find("a", "b_c")->id, second.Find("a", "b_c")->id);
    EXPECT_NE(first.Find("a_b", "c")->id, first.Find("a", "b_c")->id);
}

TEST(ToolCatalogTest, ContestedIdStaysHashedAcrossRebuilds) {
    ToolCatalog catalog;
    catalog.ReplaceServerTools("a_b", {makeTool("c")});
    catalog.ReplaceServerTools("a", {makeTool("b_c")});
    const std::string hashed = catalog.Find("a_b", "c")->id;

    catalog.RemoveServer("a");
    catalog.ReplaceServerTools("a_b", {makeTool("c")});
    EXPECT_EQ(catalog.Find("a_b", "c")->id, hashed);
    EXPECT_FALSE(catalog.Resolve("a_b_c").has_value());
}

TEST(ToolCatalogTest, ReplaceDropsPreviousRecordsOfThatServerOnly) {
    ToolCatalog catalog;
    catalog.ReplaceServerTools("A", {makeTool("echo"), makeTool("add")});
    catalog.ReplaceServerTools("B", {makeTool("echo")});
    catalog.ReplaceServerTools("A", {makeTool("mul")});

    EXPECT_FALSE(catalog.Resolve("A_echo").has_value());
    EXPECT_TRUE(catalog.Resolve("A_mul").has_value());
    EXPECT_TRUE(catalog.Resolve("B_echo").has_value());
    EXPECT_EQ(catalog.CountForServer("A"), 1u);
    EXPECT_EQ(catalog.CountForServer("B"), 1u);
}

TEST(ToolCatalogTest, RemoveServerIsIsolated) {
    ToolCatalog catalog;
    catalog.ReplaceServerTools("A", {makeTool("echo"), makeTool("add")});
    catalog.ReplaceServerTools("B", {makeTool("echo")});

    EXPECT_EQ(catalog.RemoveServer("A"), 2u);
    EXPECT_EQ(catalog.RemoveServer("A"), 0u);
    EXPECT_EQ(catalog.Size(), 1u);
    auto rec = catalog.Find("B", "echo");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->id, "B_echo");
    EXPECT_FALSE(catalog.Find("A", "echo").has_value());
}
