//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json.cpp
// Purpose: Tests for the JSON value model, parser and JSON-RPC message conversion
//==========================================================================================================

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

#include "mcphost/JSONRPCTypes.h"
#include "mcphost/Protocol.h"

using namespace mcphost;

TEST(JSONParserTest, ParsesNestedDocument) {
    JSONValue v = ParseJSON(R"({"a":[1,2.5,"x",true,null],"b":{"c":"d"}})");
    ASSERT_TRUE(v.IsObject());
    const JSONValue::Array* a = GetArrayMember(v, "a");
    ASSERT_NE(a, nullptr);
    ASSERT_EQ(a->size(), 5u);
    EXPECT_EQ(std::get<int64_t>((*a)[0]->value), 1);
    EXPECT_DOUBLE_EQ(std::get<double>((*a)[1]->value), 2.5);
    EXPECT_EQ(std::get<std::string>((*a)[2]->value), "x");
    EXPECT_TRUE(std::get<bool>((*a)[3]->value));
    EXPECT_TRUE((*a)[4]->IsNull());
    const JSONValue* b = v.Find("b");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(GetStringMember(*b, "c").value_or(""), "d");
}

TEST(JSONParserTest, DecodesEscapesAndSurrogatePairs) {
    JSONValue v = ParseJSON(R"("line\nquote\"snow\u2603clef\uD834\uDD1E")");
    ASSERT_TRUE(v.IsString());
    EXPECT_EQ(std::get<std::string>(v.value), "line\nquote\"snow\xE2\x98\x83" "clef\xF0\x9D\x84\x9E");
}

TEST(JSONParserTest, RejectsMalformedInput) {
    EXPECT_THROW(ParseJSON("{"), std::runtime_error);
    EXPECT_THROW(ParseJSON("{\"a\":1,}"), std::runtime_error);
    EXPECT_THROW(ParseJSON("[1] trailing"), std::runtime_error);
    EXPECT_THROW(ParseJSON("\"raw\ncontrol\""), std::runtime_error);
    EXPECT_THROW(ParseJSON(""), std::runtime_error);
}

TEST(JSONParserTest, RejectsExcessiveNesting) {
    std::string deep(300, '[');
    deep += std::string(300, ']');
    EXPECT_THROW(ParseJSON(deep), std::runtime_error);
}

TEST(JSONSerializerTest, SerializesAndReparsesEqual) {
    JSONValue v = MakeObject({
        {"text", JSONValue("tab\tand \"quotes\"")},
        {"n", JSONValue(static_cast<int64_t>(-42))},
        {"d", JSONValue(3.0)},
        {"list", MakeArray({JSONValue(true), JSONValue(nullptr)})}
    });
    const std::string text = SerializeJSON(v);
    EXPECT_NE(text.find("\\t"), std::string::npos);
    EXPECT_NE(text.find("3.0"), std::string::npos);
    EXPECT_EQ(ParseJSON(text), v);
}

TEST(JSONValueTest, NumericEqualityAcrossIntAndDouble) {
    EXPECT_EQ(JSONValue(static_cast<int64_t>(2)), JSONValue(2.0));
    EXPECT_NE(JSONValue(static_cast<int64_t>(2)), JSONValue(2.5));
}

TEST(JSONRPCTest, RequestRoundTripKeepsIdAndParams) {
    JSONRPCRequest req(static_cast<int64_t>(7), "tools/call", MakeObject({{"name", JSONValue("echo")}}));
    JSONRPCRequest back;
    ASSERT_TRUE(back.Deserialize(req.Serialize()));
    EXPECT_EQ(IdToString(back.id), "7");
    EXPECT_EQ(back.method, "tools/call");
    ASSERT_TRUE(back.params.has_value());
    EXPECT_EQ(GetStringMember(*back.params, "name").value_or(""), "echo");
}

TEST(JSONRPCTest, ResponseErrorAccessors) {
    JSONRPCResponse resp;
    ASSERT_TRUE(resp.Deserialize(R"({"jsonrpc":"2.0","id":"a","error":{"code":-32602,"message":"bad version"}})"));
    EXPECT_TRUE(resp.IsError());
    EXPECT_EQ(resp.ErrorCode(), -32602);
    EXPECT_EQ(resp.ErrorMessage(), "bad version");
    EXPECT_EQ(IdToString(resp.id), "a");
}

TEST(JSONRPCTest, ResponseRejectsRequestsAndNotifications) {
    JSONRPCResponse resp;
    EXPECT_FALSE(resp.Deserialize(R"({"jsonrpc":"2.0","id":1,"method":"ping"})"));
    EXPECT_FALSE(resp.Deserialize(R"({"jsonrpc":"2.0","method":"notifications/progress"})"));
    JSONRPCNotification note;
    EXPECT_TRUE(note.Deserialize(R"({"jsonrpc":"2.0","method":"notifications/progress"})"));
    EXPECT_FALSE(note.Deserialize(R"({"jsonrpc":"2.0","id":1,"method":"ping"})"));
}

TEST(ToolListingTest, SchemasArePassedThroughVerbatim) {
    JSONValue listing = ParseJSON(R"({"tools":[
        {"name":"custom","inputSchema":{"type":"array","x-vendor":[1,{"deep":true}]}},
        {"name":"legacy","input_schema":{"type":"object","required":["q"]}},
        {"name":"bare","description":"no schema at all"},
        {"description":"nameless entries are skipped"}
    ]})");
    const JSONValue::Array* tools = GetArrayMember(listing, "tools");
    ASSERT_NE(tools, nullptr);

    std::vector<ToolInfo> infos = ToolInfosFromArray(*tools);
    ASSERT_EQ(infos.size(), 3u);
    EXPECT_EQ(infos[0].inputSchema, *(*tools)[0]->Find("inputSchema"));
    EXPECT_EQ(infos[1].inputSchema, *(*tools)[1]->Find("input_schema"));
    EXPECT_TRUE(infos[2].inputSchema.IsNull());
    EXPECT_EQ(infos[2].description, "no schema at all");
}
