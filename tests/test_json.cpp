//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_json.cpp
// Purpose: JSON parser, serializer and JSON-RPC message mapping
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "mcphost/JSONRPCTypes.h"

using namespace mcphost;

TEST(JSON, ParsesScalarsIntoTheirVariantAlternatives) {
    EXPECT_TRUE(parseJSON("null").isNull());
    EXPECT_EQ(std::get<bool>(parseJSON("true").value), true);
    EXPECT_EQ(std::get<int64_t>(parseJSON("-42").value), -42);
    EXPECT_DOUBLE_EQ(std::get<double>(parseJSON("2.5").value), 2.5);
    EXPECT_DOUBLE_EQ(std::get<double>(parseJSON("1e3").value), 1000.0);
    EXPECT_EQ(std::get<std::string>(parseJSON("\"hi\"").value), "hi");
}

TEST(JSON, IntegerBeyondInt64DegradesToDouble) {
    auto v = parseJSON("123456789012345678901234");
    ASSERT_TRUE(std::holds_alternative<double>(v.value));
    EXPECT_GT(std::get<double>(v.value), 1e23);
}

TEST(JSON, DecodesEscapesAndSurrogatePairs) {
    auto v = parseJSON(R"("a\nb\t\"q\" \u00e9 \ud83d\ude00")");
    EXPECT_EQ(std::get<std::string>(v.value), "a\nb\t\"q\" \xC3\xA9 \xF0\x9F\x98\x80");
}

TEST(JSON, LoneSurrogateBecomesReplacementCharacter) {
    auto v = parseJSON(R"("x\udc00y")");
    EXPECT_EQ(std::get<std::string>(v.value), "x\xEF\xBF\xBDy");
}

TEST(JSON, RejectsMalformedDocuments) {
    EXPECT_THROW(parseJSON(""), JSONParseError);
    EXPECT_THROW(parseJSON("{"), JSONParseError);
    EXPECT_THROW(parseJSON("{\"a\" 1}"), JSONParseError);
    EXPECT_THROW(parseJSON("[1,]"), JSONParseError);
    EXPECT_THROW(parseJSON("01"), JSONParseError);
    EXPECT_THROW(parseJSON("\"unterminated"), JSONParseError);
    EXPECT_THROW(parseJSON("{} trailing"), JSONParseError);
    EXPECT_THROW(parseJSON("\"tab\there\""), JSONParseError);
}

TEST(JSON, RejectsExcessiveNesting) {
    std::string deep(300, '[');
    deep += std::string(300, ']');
    EXPECT_THROW(parseJSON(deep), JSONParseError);
}

TEST(JSON, CompactSerializationSortsKeys) {
    auto v = parseJSON(R"({"b":1,"a":[true,null,"x"],"c":{}})");
    EXPECT_EQ(serializeJSONValue(v), R"({"a":[true,null,"x"],"b":1,"c":{}})");
}

TEST(JSON, IndentedSerialization) {
    auto v = parseJSON(R"({"sum":5,"items":[1,2]})");
    const std::string expected =
        "{\n"
        "  \"items\": [\n"
        "    1,\n"
        "    2\n"
        "  ],\n"
        "  \"sum\": 5\n"
        "}";
    EXPECT_EQ(serializeJSONValue(v, 2), expected);
}

TEST(JSON, EscapesControlCharactersOnOutput) {
    JSONValue v(std::string("line\nbreak\x01"));
    EXPECT_EQ(serializeJSONValue(v), "\"line\\nbreak\\u0001\"");
}

TEST(JSON, TypedGettersRespectTypes) {
    auto v = parseJSON(R"({"s":"x","i":7,"d":1.5,"whole":3.0,"b":false})");
    EXPECT_EQ(getString(v, "s").value(), "x");
    EXPECT_FALSE(getString(v, "i").has_value());
    EXPECT_EQ(getInt(v, "i").value(), 7);
    EXPECT_EQ(getInt(v, "whole").value(), 3);
    EXPECT_FALSE(getInt(v, "d").has_value());
    EXPECT_DOUBLE_EQ(getNumber(v, "i").value(), 7.0);
    EXPECT_EQ(getBool(v, "b").value(), false);
    EXPECT_FALSE(getBool(v, "missing").has_value());
}

TEST(JSONRPC, RequestRoundTripKeepsIdType) {
    JSONRPCRequest req;
    ASSERT_TRUE(req.Deserialize(R"({"jsonrpc":"2.0","id":"abc","method":"ping"})"));
    EXPECT_EQ(std::get<std::string>(req.id), "abc");
    EXPECT_EQ(req.method, "ping");
    EXPECT_FALSE(req.params.has_value());

    JSONRPCRequest numeric(int64_t{9}, "tools/list");
    EXPECT_EQ(numeric.Serialize(), R"({"id":9,"jsonrpc":"2.0","method":"tools/list"})");
}

TEST(JSONRPC, NotificationRejectsMessagesWithId) {
    JSONRPCNotification n;
    EXPECT_FALSE(n.FromJSON(parseJSON(R"({"jsonrpc":"2.0","id":1,"method":"x"})")));
    EXPECT_TRUE(n.FromJSON(parseJSON(R"({"jsonrpc":"2.0","method":"notifications/initialized"})")));
    EXPECT_EQ(n.method, "notifications/initialized");
}

TEST(JSONRPC, ErrorResponseCarriesCodeMessageAndData) {
    auto resp = CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error", JSONValue("detail"));
    ASSERT_TRUE(resp->IsError());
    EXPECT_EQ(resp->Serialize(), R"({"error":{"code":-32700,"data":"detail","message":"Parse error"},"id":null,"jsonrpc":"2.0"})");
}
