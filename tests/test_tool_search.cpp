//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_tool_search.cpp
// Purpose: Tool search filters, totals and snapshot-bound cursors
//==========================================================================================================

#include <gtest/gtest.h>

#include "mcphost/CapabilityRegistry.h"

using namespace mcphost;

namespace {
void add(ToolRegistry& reg, const std::string& name, const std::string& description,
         std::optional<std::string> category, std::vector<std::string> tags, bool readOnly) {
    Tool t;
    t.name = name;
    t.description = description;
    t.category = std::move(category);
    t.tags = std::move(tags);
    t.annotations.readOnly = readOnly;
    reg.Register(ToolDefinition{t, makeSyncToolHandler([](const JSONValue&) { return JSONValue(nullptr); })});
}

class ToolSearchTest : public ::testing::Test {
protected:
    void SetUp() override {
        add(reg, "add", "Add two numbers", std::string("math"), {"arithmetic"}, true);
        add(reg, "multiply", "Multiply numbers", std::string("Math"), {"arithmetic", "fast"}, true);
        add(reg, "write_file", "Write a file to disk", std::string("fs"), {"io"}, false);
        add(reg, "read_file", "Read a FILE", std::string("fs"), {"io", "fast"}, true);
        add(reg, "echo", "Echo text", std::nullopt, {}, true);
    }
    ToolRegistry reg;

    std::vector<std::string> names(const SearchPage<ToolDefinition>& page) {
        std::vector<std::string> out;
        for (const auto& d : page.items) out.push_back(d->tool.name);
        return out;
    }
};
} // namespace

TEST_F(ToolSearchTest, EmptyQueryMatchesEverything) {
    auto page = reg.Search(ToolSearchQuery{});
    EXPECT_EQ(page.total, 5u);
    EXPECT_EQ(page.items.size(), 5u);
    EXPECT_FALSE(page.nextCursor.has_value());
}

TEST_F(ToolSearchTest, QueryIsCaseInsensitiveSubstringOverNameDescriptionTagsCategory) {
    ToolSearchQuery q;
    q.query = "FILE";
    EXPECT_EQ(names(reg.Search(q)), (std::vector<std::string>{"write_file", "read_file"}));

    q.query = "arith";
    EXPECT_EQ(names(reg.Search(q)), (std::vector<std::string>{"add", "multiply"}));

    q.query = "fs";
    EXPECT_EQ(reg.Search(q).total, 2u);
}

TEST_F(ToolSearchTest, CategoryMatchIsExactIgnoringCase) {
    ToolSearchQuery q;
    q.category = "MATH";
    EXPECT_EQ(names(reg.Search(q)), (std::vector<std::string>{"add", "multiply"}));
    q.category = "mat";
    EXPECT_EQ(reg.Search(q).total, 0u);
}

TEST_F(ToolSearchTest, TagsMatchAnyAndCombineWithOtherFilters) {
    ToolSearchQuery q;
    q.tags = {"fast", "nothing"};
    EXPECT_EQ(names(reg.Search(q)), (std::vector<std::string>{"multiply", "read_file"}));

    q.readOnly = true;
    q.category = "fs";
    EXPECT_EQ(names(reg.Search(q)), (std::vector<std::string>{"read_file"}));
}

TEST_F(ToolSearchTest, ReadOnlyFilter) {
    ToolSearchQuery q;
    q.readOnly = false;
    EXPECT_EQ(names(reg.Search(q)), (std::vector<std::string>{"write_file"}));
}

TEST_F(ToolSearchTest, PagingReportsTotalAndBindsCursorToQuery) {
    ToolSearchQuery q;
    q.readOnly = true;
    auto first = reg.Search(q, std::nullopt, 2);
    EXPECT_EQ(first.total, 4u);
    EXPECT_EQ(names(first), (std::vector<std::string>{"add", "multiply"}));
    ASSERT_TRUE(first.nextCursor.has_value());

    auto second = reg.Search(q, first.nextCursor, 2);
    EXPECT_EQ(names(second), (std::vector<std::string>{"read_file", "echo"}));
    EXPECT_FALSE(second.nextCursor.has_value());

    ToolSearchQuery other;
    other.readOnly = false;
    EXPECT_THROW(reg.Search(other, first.nextCursor, 2), errors::InvalidCursorError);
    EXPECT_THROW(reg.ListPaginated(first.nextCursor), errors::InvalidCursorError);
}

TEST(ToolSearchQuery, FingerprintIgnoresCaseAndTagOrder) {
    ToolSearchQuery a;
    a.query = "File";
    a.tags = {"b", "A"};
    ToolSearchQuery b;
    b.query = "file";
    b.tags = {"a", "B"};
    EXPECT_EQ(a.Fingerprint(), b.Fingerprint());

    ToolSearchQuery c = b;
    c.readOnly = true;
    EXPECT_NE(b.Fingerprint(), c.Fingerprint());
    EXPECT_NE(ToolSearchQuery{}.Fingerprint(), b.Fingerprint());
}
