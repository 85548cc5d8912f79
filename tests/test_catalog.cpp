//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_catalog.cpp
// Purpose: Tests for the method/event catalogs and typed params/payload conversions
//==========================================================================================================

#include <gtest/gtest.h>

#include "dlab/protocol/Catalog.h"
#include "dlab/validation/Validator.h"

using namespace dlab;
using namespace dlab::protocol;

TEST(Catalog, MethodNamesRoundTrip) {
    ASSERT_EQ(AvailableMethods().size(), 11u);
    for (Method m : AvailableMethods()) {
        auto back = parseMethod(toString(m));
        ASSERT_TRUE(back.has_value()) << toString(m);
        EXPECT_EQ(back.value(), m);
    }
    EXPECT_STREQ(toString(Method::LiveStreamTap), "liveStream.tap");
    EXPECT_FALSE(parseMethod("tools/call").has_value());
    EXPECT_FALSE(parseMethod("Ping").has_value());
}

TEST(Catalog, EventNamesRoundTrip) {
    ASSERT_EQ(AvailableEvents().size(), 8u);
    for (EventType e : AvailableEvents()) {
        auto back = parseEventType(toString(e));
        ASSERT_TRUE(back.has_value()) << toString(e);
        EXPECT_EQ(back.value(), e);
    }
    EXPECT_STREQ(toString(EventType::LiveFrame), "liveFrame");
    EXPECT_FALSE(parseEventType("frame").has_value());
}

TEST(Catalog, Platforms) {
    EXPECT_EQ(parsePlatform("ios").value(), Platform::Ios);
    EXPECT_EQ(parsePlatform("android").value(), Platform::Android);
    EXPECT_FALSE(parsePlatform("web").has_value());
}

namespace {

// One accepted params object per method; the switch has no default so a new method must be added here.
JSONValue validParamsFor(Method m) {
    switch (m) {
        case Method::RecorderStart:   return ParseJSON(R"({"name":"demo","url":"https://example.com"})");
        case Method::LiveStreamStart: return ParseJSON(R"({"platform":"ios","deviceId":"sim-1"})");
        case Method::LiveStreamTap:   return ParseJSON(R"({"x":10,"y":20.5})");
        case Method::ProjectGet:
        case Method::ProjectDelete:   return ParseJSON(R"({"id":"p-1"})");
        case Method::ProjectCreate:   return ParseJSON(R"({"name":"Shop","packageName":"com.shop"})");
        case Method::Ping:
        case Method::RecorderStop:
        case Method::RecorderStatus:
        case Method::LiveStreamStop:
        case Method::ProjectList:     return ParseJSON("{}");
    }
    return JSONValue();
}

} // namespace

TEST(CatalogShapes, EveryMethodAcceptsValidParams) {
    ASSERT_EQ(AvailableMethods().size(), 11u);
    for (Method m : AvailableMethods()) {
        const JSONValue params = validParamsFor(m);
        auto direct = validation::ValidateValue(params, ParamsShape(m));
        EXPECT_TRUE(direct.valid) << toString(m);
        EXPECT_TRUE(direct.errors.empty()) << toString(m);

        auto byName = validation::ValidateMethodParams(toString(m), params);
        EXPECT_TRUE(byName.valid) << toString(m);
        EXPECT_TRUE(byName.errors.empty()) << toString(m);
    }
}

TEST(CatalogShapes, RecorderStartParams) {
    const auto& shape = ParamsShape(Method::RecorderStart);
    EXPECT_TRUE(validation::ValidateValue(ParseJSON(R"({"name":"n","url":"https://x"})"), shape).valid);
    EXPECT_TRUE(validation::ValidateValue(
        ParseJSON(R"({"name":"n","url":"u","resolution":{"width":390,"height":844}})"), shape).valid);
    auto bad = validation::ValidateValue(ParseJSON(R"({"name":"n","resolution":{"width":"wide"}})"), shape);
    EXPECT_FALSE(bad.valid);
    EXPECT_EQ(bad.errors.size(), 2u);
}

TEST(CatalogShapes, LiveStreamStartParams) {
    const auto& shape = ParamsShape(Method::LiveStreamStart);
    EXPECT_TRUE(validation::ValidateValue(ParseJSON(R"({"platform":"android","interactive":true})"), shape).valid);
    EXPECT_FALSE(validation::ValidateValue(ParseJSON(R"({"platform":"web"})"), shape).valid);
    EXPECT_FALSE(validation::ValidateValue(ParseJSON(R"({"platform":"ios","interactive":"yes"})"), shape).valid);
}

TEST(CatalogTyped, ParamsDecode) {
    RecorderStartParams rs;
    ASSERT_TRUE(FromJSON(ParseJSON(R"({"name":"n","url":"u","resolution":{"width":390,"height":844.5}})"), rs));
    EXPECT_EQ(rs.name, "n");
    ASSERT_TRUE(rs.resolution.has_value());
    EXPECT_DOUBLE_EQ(rs.resolution->width, 390.0);
    EXPECT_DOUBLE_EQ(rs.resolution->height, 844.5);

    LiveStreamStartParams ls;
    ASSERT_TRUE(FromJSON(ParseJSON(R"({"platform":"android","deviceId":"emulator-5554"})"), ls));
    EXPECT_EQ(ls.platform, Platform::Android);
    EXPECT_EQ(ls.deviceId.value_or(""), "emulator-5554");
    EXPECT_FALSE(ls.interactive.has_value());

    LiveStreamTapParams tap;
    ASSERT_TRUE(FromJSON(ParseJSON(R"({"x":10,"y":20.5})"), tap));
    EXPECT_DOUBLE_EQ(tap.x, 10.0);
    EXPECT_DOUBLE_EQ(tap.y, 20.5);

    ProjectIdParams pid;
    EXPECT_FALSE(FromJSON(ParseJSON("{}"), pid));
    ProjectCreateParams pc;
    EXPECT_FALSE(FromJSON(ParseJSON(R"({"packageName":"com.x"})"), pc));
}

TEST(CatalogTyped, ResultsEncodeToDocumentedShapes) {
    EXPECT_TRUE(JSONEquals(ToJSON(PingResult{}), ParseJSON(R"({"pong":true})")));
    EXPECT_TRUE(JSONEquals(ToJSON(LiveStreamStopResult{}), ParseJSON(R"({"stopped":true})")));
    EXPECT_TRUE(JSONEquals(ToJSON(ProjectDeleteResult{true}), ParseJSON(R"({"deleted":true})")));
    EXPECT_TRUE(ToJSON(RecorderStatusResult{}).isNull());

    RecorderStopResult stop;
    stop.id = "s1";
    stop.name = "flow";
    stop.screenshots = {"a.png"};
    JSONValue j = ToJSON(stop);
    EXPECT_TRUE(validation::ValidateValue(j, PayloadShape(EventType::Stopped)).valid);
    RecorderStopResult back;
    ASSERT_TRUE(FromJSON(j, back));
    EXPECT_EQ(back.screenshots.size(), 1u);
    EXPECT_EQ(back.name, "flow");
}

TEST(CatalogTyped, EventPayloadsMatchTheirShapes) {
    ConnectedPayload c{1700000000000, "0.1.0"};
    EXPECT_TRUE(validation::ValidateValue(ToJSON(c), PayloadShape(EventType::Connected)).valid);

    LiveFramePayload f;
    f.image = "AA==";
    f.platform = Platform::Android;
    f.timestamp = 5;
    JSONValue fj = ToJSON(f);
    EXPECT_TRUE(validation::ValidateValue(fj, PayloadShape(EventType::LiveFrame)).valid);
    EXPECT_EQ(std::get<std::string>(FindMember(fj, "platform")->value), "android");

    ErrorPayload noCode{"boom", std::nullopt};
    EXPECT_EQ(FindMember(ToJSON(noCode), "code"), nullptr);
}
