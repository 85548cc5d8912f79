//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_validator.cpp
// Purpose: Tests for shape validation paths, messages and envelope checks
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "dlab/validation/Validator.h"

using namespace dlab;
using namespace dlab::validation;

namespace {

bool hasError(const std::vector<ValidationError>& errs, const std::string& path, const std::string& message) {
    return std::any_of(errs.begin(), errs.end(), [&](const ValidationError& e) {
        return e.path == path && e.message == message;
    });
}

} // namespace

TEST(ValidatorPrimitives, TypeMismatchReportsExpectedAndReceived) {
    auto errs = Validate(JSONValue(int64_t{5}), *Shape::String());
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].path, "root");
    EXPECT_EQ(errs[0].message, "Expected string");
    EXPECT_EQ(errs[0].expected.value_or(""), "string");
    EXPECT_EQ(errs[0].received.value_or(""), "number");

    auto nullErr = Validate(JSONValue(), *Shape::Object({}));
    ASSERT_EQ(nullErr.size(), 1u);
    EXPECT_EQ(nullErr[0].message, "Expected object");
    EXPECT_EQ(nullErr[0].received.value_or(""), "null");

    auto arrErr = Validate(ParseJSON("[]"), *Shape::Number());
    ASSERT_EQ(arrErr.size(), 1u);
    EXPECT_EQ(arrErr[0].received.value_or(""), "array");
}

TEST(ValidatorPrimitives, AnyAcceptsEverything) {
    for (const char* text : {"null", "1", "\"s\"", "[]", "{}", "false"}) {
        EXPECT_TRUE(Validate(ParseJSON(text), *Shape::Any()).empty()) << text;
    }
}

TEST(ValidatorPrimitives, ConstAndEnum) {
    auto c = Validate(JSONValue("res"), *Shape::Const(JSONValue("req")));
    ASSERT_EQ(c.size(), 1u);
    EXPECT_EQ(c[0].message, "Expected constant value");
    EXPECT_EQ(c[0].expected.value_or(""), "req");
    EXPECT_EQ(c[0].received.value_or(""), "res");
    EXPECT_TRUE(Validate(JSONValue(int64_t{2}), *Shape::Const(JSONValue(2.0))).empty());

    auto e = Validate(JSONValue("web"), *Shape::Enum({"ios", "android"}));
    ASSERT_EQ(e.size(), 1u);
    EXPECT_EQ(e[0].message, "Value must be one of: ios, android");
    EXPECT_EQ(e[0].received.value_or(""), "web");
    EXPECT_TRUE(Validate(JSONValue("ios"), *Shape::Enum({"ios", "android"})).empty());
    EXPECT_EQ(Validate(JSONValue(int64_t{1}), *Shape::Enum({"ios"})).size(), 1u);
}

TEST(ValidatorCompound, ArrayElementPaths) {
    auto errs = Validate(ParseJSON(R"(["a", 1, "c", true])"), *Shape::ArrayOf(Shape::String()));
    ASSERT_EQ(errs.size(), 2u);
    EXPECT_EQ(errs[0].path, "root.1");
    EXPECT_EQ(errs[1].path, "root.3");
    EXPECT_EQ(errs[1].received.value_or(""), "boolean");
}

TEST(ValidatorCompound, ObjectMissingAndNested) {
    auto shape = Shape::Object({
        Required("name", Shape::String()),
        Required("size", Shape::Object({Required("width", Shape::Number())})),
        Optional("tag", Shape::String()),
    });
    auto errs = Validate(ParseJSON(R"({"size":{"width":"wide"},"tag":3})"), *shape);
    EXPECT_TRUE(hasError(errs, "root.name", "Missing required property: name"));
    EXPECT_TRUE(hasError(errs, "root.size.width", "Expected number"));
    EXPECT_TRUE(hasError(errs, "root.tag", "Expected string"));
    EXPECT_EQ(errs.size(), 3u);
}

TEST(ValidatorCompound, StrictObjectRejectsUnknownKeys) {
    auto strict = Shape::StrictObject({Required("id", Shape::String())});
    auto errs = Validate(ParseJSON(R"({"id":"a","extra":1})"), *strict);
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].path, "root.extra");
    EXPECT_EQ(errs[0].message, "Unexpected property: extra");

    auto lenient = Shape::Object({Required("id", Shape::String())});
    EXPECT_TRUE(Validate(ParseJSON(R"({"id":"a","extra":1})"), *lenient).empty());
}

TEST(ValidatorCompound, CustomRootPath) {
    auto errs = Validate(JSONValue(true), *Shape::String(), "params");
    ASSERT_EQ(errs.size(), 1u);
    EXPECT_EQ(errs[0].path, "params");
}

TEST(ValidatorEnvelopes, Request) {
    EXPECT_TRUE(ValidateRequest(ParseJSON(R"({"type":"req","id":"a","method":"ping","params":{}})")).valid);
    EXPECT_TRUE(ValidateRequest(ParseJSON(R"({"type":"req","id":"a","method":"ping"})")).valid);

    auto wrongType = ValidateRequest(ParseJSON(R"({"type":"res","id":"a","method":"ping"})"));
    EXPECT_FALSE(wrongType.valid);
    EXPECT_TRUE(hasError(wrongType.errors, "root.type", "Expected constant value"));

    auto arrayParams = ValidateRequest(ParseJSON(R"({"type":"req","id":"a","method":"ping","params":[]})"));
    EXPECT_TRUE(hasError(arrayParams.errors, "root.params", "Expected object"));

    auto extra = ValidateRequest(ParseJSON(R"({"type":"req","id":"a","method":"ping","seq":1})"));
    EXPECT_TRUE(hasError(extra.errors, "root.seq", "Unexpected property: seq"));
}

TEST(ValidatorEnvelopes, ResponseAndEvent) {
    EXPECT_TRUE(ValidateResponse(ParseJSON(R"({"type":"res","id":"a","ok":false,"error":"x"})")).valid);
    auto missingOk = ValidateResponse(ParseJSON(R"({"type":"res","id":"a"})"));
    EXPECT_TRUE(hasError(missingOk.errors, "root.ok", "Missing required property: ok"));

    EXPECT_TRUE(ValidateEvent(ParseJSON(R"({"type":"event","event":"status","payload":{},"seq":1,"timestamp":2})")).valid);
    auto missingPayload = ValidateEvent(ParseJSON(R"({"type":"event","event":"status"})"));
    EXPECT_TRUE(hasError(missingPayload.errors, "root.payload", "Missing required property: payload"));
}

TEST(ValidatorCatalog, MethodParams) {
    auto missingId = ValidateMethodParams("project.get", ParseJSON("{}"));
    EXPECT_FALSE(missingId.valid);
    EXPECT_TRUE(hasError(missingId.errors, "root.id", "Missing required property: id"));

    EXPECT_TRUE(ValidateMethodParams("ping", std::nullopt).valid);
    EXPECT_TRUE(ValidateMethodParams("ping", JSONValue()).valid);
    EXPECT_TRUE(ValidateMethodParams("liveStream.tap", ParseJSON(R"({"x":1,"y":2.5})")).valid);

    auto unknown = ValidateMethodParams("nope.method", ParseJSON("{}"));
    ASSERT_EQ(unknown.errors.size(), 1u);
    EXPECT_EQ(unknown.errors[0].path, "method");
    EXPECT_EQ(unknown.errors[0].message, "Unknown method: nope.method");

    auto strictParams = ValidateMethodParams("ping", ParseJSON(R"({"x":1})"));
    EXPECT_TRUE(hasError(strictParams.errors, "root.x", "Unexpected property: x"));
}

TEST(ValidatorCatalog, EventPayloads) {
    EXPECT_TRUE(ValidateEventPayload("status", ParseJSON(R"({"status":"idle","extra":true})")).valid);
    auto badFrame = ValidateEventPayload("liveFrame", ParseJSON(R"({"image":"AA==","platform":"web","timestamp":1})"));
    EXPECT_TRUE(hasError(badFrame.errors, "root.platform", "Value must be one of: ios, android"));

    auto unknown = ValidateEventPayload("mystery", ParseJSON("{}"));
    ASSERT_EQ(unknown.errors.size(), 1u);
    EXPECT_EQ(unknown.errors[0].path, "event");
}

TEST(ValidatorFormatting, FormatAndJSON) {
    std::vector<ValidationError> errs = {
        ValidationError{"root.id", "Missing required property: id", std::nullopt, std::nullopt},
        ValidationError{"root.x", "Expected number", std::string("number"), std::string("string")},
    };
    EXPECT_EQ(FormatValidationErrors(errs),
              "root.id: Missing required property: id\n"
              "root.x: Expected number (expected: number) (received: string)");
    EXPECT_EQ(FormatValidationErrors({}), "");

    JSONValue j = ToJSON(errs);
    ASSERT_TRUE(j.isArray());
    const auto& arr = std::get<JSONValue::Array>(j.value);
    ASSERT_EQ(arr.size(), 2u);
    EXPECT_EQ(FindMember(*arr[0], "expected"), nullptr);
    EXPECT_EQ(std::get<std::string>(FindMember(*arr[1], "received")->value), "string");
}

TEST(ShapeSchema, RendersJSONSchema) {
    auto shape = Shape::StrictObject({
        Required("name", Shape::String("Project name")),
        Optional("platform", Shape::Enum({"ios", "android"})),
        Optional("tags", Shape::ArrayOf(Shape::String())),
    });
    JSONValue s = ToJSONSchema(*shape);
    EXPECT_EQ(std::get<std::string>(FindMember(s, "type")->value), "object");
    EXPECT_FALSE(std::get<bool>(FindMember(s, "additionalProperties")->value));

    const JSONValue* props = FindMember(s, "properties");
    ASSERT_NE(props, nullptr);
    EXPECT_EQ(std::get<std::string>(FindMember(*FindMember(*props, "name"), "description")->value), "Project name");
    EXPECT_EQ(std::get<JSONValue::Array>(FindMember(*FindMember(*props, "platform"), "enum")->value).size(), 2u);
    EXPECT_EQ(std::get<std::string>(FindMember(*FindMember(*FindMember(*props, "tags"), "items"), "type")->value),
              "string");

    const auto& required = std::get<JSONValue::Array>(FindMember(s, "required")->value);
    ASSERT_EQ(required.size(), 1u);
    EXPECT_EQ(std::get<std::string>(required[0]->value), "name");

    EXPECT_EQ(FindMember(ToJSONSchema(*Shape::Object({})), "additionalProperties"), nullptr);
    EXPECT_TRUE(std::get<JSONValue::Object>(ToJSONSchema(*Shape::Any()).value).empty());
}

TEST(ShapeSchema, KindNames) {
    EXPECT_STREQ(KindName(*Shape::Const(JSONValue(int64_t{1}))), "const");
    EXPECT_STREQ(KindName(*Shape::ArrayOf(Shape::Any())), "array");
    EXPECT_STREQ(KindName(*Shape::StrictObject({})), "object");
}
