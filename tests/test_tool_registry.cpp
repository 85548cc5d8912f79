//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_registry.cpp
// Purpose: Tests for tool registration rules, content helpers and tool-result validators
//==========================================================================================================

#include <gtest/gtest.h>

#include <future>
#include <stdexcept>

#include "dlab/ToolRegistry.h"
#include "dlab/typed/Content.h"
#include "dlab/validation/Validators.h"

using namespace dlab;

namespace {

ToolHandler okHandler() {
    return [](const JSONValue&) {
        std::promise<ToolResult> p;
        p.set_value(typed::makeTextResult("ok"));
        return p.get_future();
    };
}

} // namespace

TEST(ToolRegistry, RegisterFindAndList) {
    ToolRegistry reg;
    reg.Register(Tool{"zeta", "last"}, okHandler());
    reg.Register(Tool{"alpha", "first", validation::Shape::Object({})}, okHandler());
    EXPECT_EQ(reg.Size(), 2u);

    const auto* entry = reg.Find("alpha");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->tool.description, "first");
    EXPECT_NE(entry->tool.inputShape, nullptr);
    EXPECT_EQ(reg.Find("missing"), nullptr);

    auto tools = reg.List();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "alpha");
    EXPECT_EQ(tools[1].name, "zeta");
}

TEST(ToolRegistry, RejectsInvalidRegistrations) {
    ToolRegistry reg;
    EXPECT_THROW(reg.Register(Tool{"", "no name"}, okHandler()), std::invalid_argument);
    EXPECT_THROW(reg.Register(Tool{"t", "no handler"}, ToolHandler{}), std::invalid_argument);
    reg.Register(Tool{"t", "once"}, okHandler());
    EXPECT_THROW(reg.Register(Tool{"t", "twice"}, okHandler()), std::invalid_argument);
    EXPECT_EQ(reg.Find("t")->tool.description, "once");
}

TEST(ToolRegistry, SealedRegistryIsReadOnly) {
    ToolRegistry reg;
    reg.Register(Tool{"a", "a"}, okHandler());
    EXPECT_FALSE(reg.IsSealed());
    reg.Seal();
    EXPECT_TRUE(reg.IsSealed());
    EXPECT_THROW(reg.Register(Tool{"b", "b"}, okHandler()), std::logic_error);
    EXPECT_EQ(reg.Size(), 1u);
}

TEST(ToolResultJSON, AlwaysCarriesIsError) {
    JSONValue ok = ToJSON(typed::makeTextResult("hi"));
    ASSERT_NE(FindMember(ok, "isError"), nullptr);
    EXPECT_FALSE(std::get<bool>(FindMember(ok, "isError")->value));
    EXPECT_TRUE(validation::validateToolResultJson(ok));

    JSONValue bad = ToJSON(typed::makeErrorResult("nope"));
    EXPECT_TRUE(std::get<bool>(FindMember(bad, "isError")->value));
}

TEST(TypedContent, Helpers) {
    ToolResult r = typed::makeErrorResult("disk full");
    EXPECT_TRUE(r.isError);
    EXPECT_EQ(typed::firstText(r).value_or(""), "Error: disk full");

    ToolResult mixed;
    mixed.content.push_back(typed::makeImage("AA==", "image/png"));
    mixed.content.push_back(typed::makeText("a"));
    mixed.content.push_back(typed::makeText("b"));
    auto texts = typed::collectText(mixed);
    ASSERT_EQ(texts.size(), 2u);
    EXPECT_EQ(texts[0], "a");
    EXPECT_EQ(typed::firstText(mixed).value_or(""), "a");
    EXPECT_FALSE(typed::isText(mixed.content[0]));
    EXPECT_TRUE(validation::isImageContentItem(mixed.content[0]));

    ToolResult json = typed::makeJsonResult(MakeObject({{"count", JSONValue(int64_t{2})}}));
    JSONValue back = ParseJSON(typed::firstText(json).value());
    EXPECT_EQ(std::get<int64_t>(FindMember(back, "count")->value), 2);
}

TEST(ToolResultValidators, RejectMalformedContent) {
    EXPECT_FALSE(validation::validateToolResultJson(ParseJSON(R"({"isError":false})")));
    EXPECT_FALSE(validation::validateToolResultJson(ParseJSON(R"({"content":[{"type":"text"}]})")));
    EXPECT_FALSE(validation::validateToolResultJson(ParseJSON(R"({"content":[{"type":"image","data":"x"}]})")));
    EXPECT_FALSE(validation::validateToolResultJson(ParseJSON(R"({"content":[],"isError":"no"})")));
    EXPECT_TRUE(validation::validateToolResultJson(ParseJSON(R"({"content":[]})")));
}
