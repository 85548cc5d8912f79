//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Catalog.cpp
// Purpose: Method/event name tables, runtime shapes and JSON codecs for the catalog types
//==========================================================================================================

#include "dlab/protocol/Catalog.h"

#include <cmath>
#include <iterator>
#include <stdexcept>

namespace dlab {
namespace protocol {

using validation::Optional;
using validation::Required;
using validation::Shape;
using validation::ShapePtr;

namespace {

struct MethodEntry { Method method; const char* name; };
struct EventEntry { EventType event; const char* name; };

constexpr MethodEntry kMethods[] = {
    {Method::Ping, "ping"},
    {Method::RecorderStart, "recorder.start"},
    {Method::RecorderStop, "recorder.stop"},
    {Method::RecorderStatus, "recorder.status"},
    {Method::LiveStreamStart, "liveStream.start"},
    {Method::LiveStreamStop, "liveStream.stop"},
    {Method::LiveStreamTap, "liveStream.tap"},
    {Method::ProjectList, "project.list"},
    {Method::ProjectGet, "project.get"},
    {Method::ProjectCreate, "project.create"},
    {Method::ProjectDelete, "project.delete"},
};

constexpr EventEntry kEvents[] = {
    {EventType::Action, "action"},
    {EventType::Screenshot, "screenshot"},
    {EventType::Status, "status"},
    {EventType::Stopped, "stopped"},
    {EventType::Session, "session"},
    {EventType::LiveFrame, "liveFrame"},
    {EventType::Error, "error"},
    {EventType::Connected, "connected"},
};

//------------------------------ JSON field helpers ------------------------------

void put(JSONValue::Object& obj, const char* key, JSONValue v) {
    obj[key] = std::make_shared<JSONValue>(std::move(v));
}

void putOpt(JSONValue::Object& obj, const char* key, const std::optional<std::string>& v) {
    if (v.has_value()) put(obj, key, JSONValue(v.value()));
}

bool readString(const JSONValue& in, const char* key, std::string& out) {
    const JSONValue* v = FindMember(in, key);
    if (!v || !v->isString()) return false;
    out = std::get<std::string>(v->value);
    return true;
}

void readOptString(const JSONValue& in, const char* key, std::optional<std::string>& out) {
    std::string s;
    if (readString(in, key, s)) out = std::move(s); else out.reset();
}

bool readNumber(const JSONValue& in, const char* key, double& out) {
    const JSONValue* v = FindMember(in, key);
    if (!v) return false;
    if (std::holds_alternative<int64_t>(v->value)) {
        out = static_cast<double>(std::get<int64_t>(v->value));
        return true;
    }
    if (std::holds_alternative<double>(v->value)) {
        out = std::get<double>(v->value);
        return true;
    }
    return false;
}

bool readInteger(const JSONValue& in, const char* key, int64_t& out) {
    const JSONValue* v = FindMember(in, key);
    if (!v) return false;
    if (std::holds_alternative<int64_t>(v->value)) {
        out = std::get<int64_t>(v->value);
        return true;
    }
    if (std::holds_alternative<double>(v->value)) {
        double d = std::get<double>(v->value);
        if (!std::isfinite(d)) return false;
        out = static_cast<int64_t>(d);
        return true;
    }
    return false;
}

bool readBool(const JSONValue& in, const char* key, bool& out) {
    const JSONValue* v = FindMember(in, key);
    if (!v || !v->isBool()) return false;
    out = std::get<bool>(v->value);
    return true;
}

bool readArray(const JSONValue& in, const char* key, std::vector<JSONValue>& out) {
    const JSONValue* v = FindMember(in, key);
    if (!v || !v->isArray()) return false;
    out.clear();
    for (const auto& item : std::get<JSONValue::Array>(v->value)) {
        out.push_back(item ? *item : JSONValue());
    }
    return true;
}

bool readStringArray(const JSONValue& in, const char* key, std::vector<std::string>& out) {
    std::vector<JSONValue> items;
    if (!readArray(in, key, items)) return false;
    out.clear();
    for (const auto& item : items) {
        if (!item.isString()) return false;
        out.push_back(std::get<std::string>(item.value));
    }
    return true;
}

bool readPlatform(const JSONValue& in, const char* key, Platform& out) {
    std::string s;
    if (!readString(in, key, s)) return false;
    auto p = parsePlatform(s);
    if (!p.has_value()) return false;
    out = p.value();
    return true;
}

JSONValue arrayOf(const std::vector<JSONValue>& items) {
    JSONValue::Array arr;
    for (const auto& v : items) arr.push_back(std::make_shared<JSONValue>(v));
    return JSONValue(std::move(arr));
}

JSONValue arrayOf(const std::vector<std::string>& items) {
    JSONValue::Array arr;
    for (const auto& v : items) arr.push_back(std::make_shared<JSONValue>(v));
    return JSONValue(std::move(arr));
}

//------------------------------ Shapes ------------------------------

ShapePtr emptyParams() {
    return Shape::StrictObject({});
}

ShapePtr buildParamsShape(Method method) {
    switch (method) {
        case Method::RecorderStart:
            return Shape::StrictObject({
                Required("name", Shape::String()),
                Required("url", Shape::String()),
                Optional("resolution", Shape::Object({
                    Optional("width", Shape::Number()),
                    Optional("height", Shape::Number()),
                })),
            });
        case Method::LiveStreamStart:
            return Shape::StrictObject({
                Required("platform", Shape::Enum({"ios", "android"})),
                Optional("deviceId", Shape::String()),
                Optional("interactive", Shape::Boolean()),
            });
        case Method::LiveStreamTap:
            return Shape::StrictObject({
                Required("x", Shape::Number()),
                Required("y", Shape::Number()),
            });
        case Method::ProjectGet:
        case Method::ProjectDelete:
            return Shape::StrictObject({Required("id", Shape::String())});
        case Method::ProjectCreate:
            return Shape::StrictObject({
                Required("name", Shape::String()),
                Optional("packageName", Shape::String()),
            });
        case Method::Ping:
        case Method::RecorderStop:
        case Method::RecorderStatus:
        case Method::LiveStreamStop:
        case Method::ProjectList:
            return emptyParams();
    }
    throw std::invalid_argument("buildParamsShape: unknown method");
}

ShapePtr stoppedShape() {
    return Shape::Object({
        Required("id", Shape::String()),
        Required("name", Shape::String()),
        Required("actions", Shape::ArrayOf(Shape::Any())),
        Required("screenshots", Shape::ArrayOf(Shape::String())),
    });
}

ShapePtr buildPayloadShape(EventType event) {
    switch (event) {
        case EventType::Action:
            return Shape::Object({
                Required("id", Shape::String()),
                Required("type", Shape::String()),
                Required("timestamp", Shape::Number()),
                Optional("selector", Shape::String()),
                Optional("text", Shape::String()),
                Optional("url", Shape::String()),
                Optional("screenshotPath", Shape::String()),
            });
        case EventType::Screenshot:
            return Shape::Object({
                Required("path", Shape::String()),
                Required("actionId", Shape::String()),
            });
        case EventType::Status:
            return Shape::Object({Required("status", Shape::String())});
        case EventType::Stopped:
            return stoppedShape();
        case EventType::Session:
            return Shape::Object({
                Required("id", Shape::String()),
                Required("name", Shape::String()),
                Required("url", Shape::String()),
                Required("status", Shape::String()),
                Required("actions", Shape::ArrayOf(Shape::Any())),
                Required("screenshotsDir", Shape::String()),
            });
        case EventType::LiveFrame:
            return Shape::Object({
                Required("image", Shape::String("base64 encoded frame")),
                Required("platform", Shape::Enum({"ios", "android"})),
                Required("timestamp", Shape::Number()),
            });
        case EventType::Error:
            return Shape::Object({
                Required("message", Shape::String()),
                Optional("code", Shape::String()),
            });
        case EventType::Connected:
            return Shape::Object({
                Required("timestamp", Shape::Number()),
                Required("serverVersion", Shape::String()),
            });
    }
    throw std::invalid_argument("buildPayloadShape: unknown event");
}

template <typename Enum, typename Builder, std::size_t N>
std::vector<ShapePtr> buildTable(Builder build) {
    std::vector<ShapePtr> table;
    table.reserve(N);
    for (std::size_t k = 0; k < N; ++k) {
        table.push_back(build(static_cast<Enum>(k)));
    }
    return table;
}

} // namespace

const char* toString(Method method) {
    for (const auto& e : kMethods) {
        if (e.method == method) return e.name;
    }
    return "unknown";
}

const char* toString(EventType event) {
    for (const auto& e : kEvents) {
        if (e.event == event) return e.name;
    }
    return "unknown";
}

const char* toString(Platform platform) {
    return platform == Platform::Android ? "android" : "ios";
}

std::optional<Method> parseMethod(const std::string& name) {
    for (const auto& e : kMethods) {
        if (name == e.name) return e.method;
    }
    return std::nullopt;
}

std::optional<EventType> parseEventType(const std::string& name) {
    for (const auto& e : kEvents) {
        if (name == e.name) return e.event;
    }
    return std::nullopt;
}

std::optional<Platform> parsePlatform(const std::string& name) {
    if (name == "ios") return Platform::Ios;
    if (name == "android") return Platform::Android;
    return std::nullopt;
}

const std::vector<Method>& AvailableMethods() {
    static const std::vector<Method> methods = [] {
        std::vector<Method> v;
        for (const auto& e : kMethods) v.push_back(e.method);
        return v;
    }();
    return methods;
}

const std::vector<EventType>& AvailableEvents() {
    static const std::vector<EventType> events = [] {
        std::vector<EventType> v;
        for (const auto& e : kEvents) v.push_back(e.event);
        return v;
    }();
    return events;
}

const validation::Shape& ParamsShape(Method method) {
    static const std::vector<ShapePtr> table =
        buildTable<Method, decltype(&buildParamsShape), std::size(kMethods)>(&buildParamsShape);
    return *table.at(static_cast<std::size_t>(method));
}

const validation::Shape& PayloadShape(EventType event) {
    static const std::vector<ShapePtr> table =
        buildTable<EventType, decltype(&buildPayloadShape), std::size(kEvents)>(&buildPayloadShape);
    return *table.at(static_cast<std::size_t>(event));
}

//------------------------------ ToJSON ------------------------------

JSONValue ToJSON(const JSONValue& v) { return v; }

JSONValue ToJSON(const EmptyParams&) { return JSONValue(JSONValue::Object{}); }

JSONValue ToJSON(const Resolution& v) {
    JSONValue::Object o;
    put(o, "width", JSONValue(v.width));
    put(o, "height", JSONValue(v.height));
    return JSONValue(std::move(o));
}

JSONValue ToJSON(const RecorderStartParams& v) {
    JSONValue::Object o;
    put(o, "name", JSONValue(v.name));
    put(o, "url", JSONValue(v.url));
    if (v.resolution.has_value()) put(o, "resolution", ToJSON(v.resolution.value()));
    return JSONValue(std::move(o));
}

JSONValue ToJSON(const LiveStreamStartParams& v) {
    JSONValue::Object o;
    put(o, "platform", JSONValue(toString(v.platform)));
    putOpt(o, "deviceId", v.deviceId);
    if (v.interactive.has_value()) put(o, "interactive", JSONValue(v.interactive.value()));
    return JSONValue(std::move(o));
}

JSONValue ToJSON(const LiveStreamTapParams& v) {
    JSONValue::Object o;
    put(o, "x", JSONValue(v.x));
    put(o, "y", JSONValue(v.y));
    return JSONValue(std::move(o));
}

JSONValue ToJSON(const ProjectIdParams& v) {
    JSONValue::Object o;
    put(o, "id", JSONValue(v.id));
    return JSONValue(std::move(o));
}

JSONValue ToJSON(const ProjectCreateParams& v) {
    JSONValue::Object o;
    put(o, "name", JSONValue(v.name));
    putOpt(o, "packageName", v.packageName);
    return JSONValue(std::move(o));
}

JSONValue ToJSON(const PingResult&) {
    return MakeObject({{"pong", JSONValue(true)}});
}

JSONValue ToJSON(const RecorderStartResult& v) {
    JSONValue::Object o;
    put(o, "id", JSONValue(v.id));
    put(o, "name", JSONValue(v.name));
    put(o, "url", JSONValue(v.url));
    put(o, "status", JSONValue(v.status));
    put(o, "screenshotsDir", JSONValue(v.screenshotsDir));
    return JSONValue(std::move(o));
}

JSONValue ToJSON(const RecorderStopResult& v) {
    JSONValue::Object o;
    put(o, "id", JSONValue(v.id));
    put(o, "name", JSONValue(v.name));
    put(o, "actions", arrayOf(v.actions));
    put(o, "screenshots", arrayOf(v.screenshots));
    return JSONValue(std::move(o));
}

JSONValue ToJSON(const SessionPayload& v) {
    JSONValue::Object o;
    put(o, "id", JSONValue(v.id));
    put(o, "name", JSONValue(v.name));
    put(o, "url", JSONValue(v.url));
    put(o, "status", JSONValue(v.status));
    put(o, "actions", arrayOf(v.actions));
    put(o, "screenshotsDir", JSONValue(v.screenshotsDir));
    return JSONValue(std::move(o));
}

JSONValue ToJSON(const RecorderStatusResult& v) {
    return v.has_value() ? ToJSON(v.value()) : JSONValue(nullptr);
}

JSONValue ToJSON(const LiveStreamStartResult& v) {
    JSONValue::Object o;
    put(o, "platform", JSONValue(toString(v.platform)));
    putOpt(o, "deviceId", v.deviceId);
    put(o, "interactive", JSONValue(v.interactive));
    return JSONValue(std::move(o));
}

JSONValue ToJSON(const LiveStreamStopResult&) {
    return MakeObject({{"stopped", JSONValue(true)}});
}

JSONValue ToJSON(const LiveStreamTapResult& v) {
    return MakeObject({{"success", JSONValue(v.success)}});
}

JSONValue ToJSON(const ProjectDeleteResult& v) {
    return MakeObject({{"deleted", JSONValue(v.deleted)}});
}

JSONValue ToJSON(const ActionPayload& v) {
    JSONValue::Object o;
    put(o, "id", JSONValue(v.id));
    put(o, "type", JSONValue(v.type));
    put(o, "timestamp", JSONValue(v.timestamp));
    putOpt(o, "selector", v.selector);
    putOpt(o, "text", v.text);
    putOpt(o, "url", v.url);
    putOpt(o, "screenshotPath", v.screenshotPath);
    return JSONValue(std::move(o));
}

JSONValue ToJSON(const ScreenshotPayload& v) {
    return MakeObject({{"path", JSONValue(v.path)}, {"actionId", JSONValue(v.actionId)}});
}

JSONValue ToJSON(const StatusPayload& v) {
    return MakeObject({{"status", JSONValue(v.status)}});
}

JSONValue ToJSON(const LiveFramePayload& v) {
    return MakeObject({
        {"image", JSONValue(v.image)},
        {"platform", JSONValue(toString(v.platform))},
        {"timestamp", JSONValue(v.timestamp)},
    });
}

JSONValue ToJSON(const ErrorPayload& v) {
    JSONValue::Object o;
    put(o, "message", JSONValue(v.message));
    putOpt(o, "code", v.code);
    return JSONValue(std::move(o));
}

JSONValue ToJSON(const ConnectedPayload& v) {
    return MakeObject({{"timestamp", JSONValue(v.timestamp)}, {"serverVersion", JSONValue(v.serverVersion)}});
}

//------------------------------ FromJSON ------------------------------

bool FromJSON(const JSONValue& in, JSONValue& out) {
    out = in;
    return true;
}

bool FromJSON(const JSONValue& in, EmptyParams&) {
    return in.isObject() || in.isNull();
}

bool FromJSON(const JSONValue& in, Resolution& out) {
    if (!in.isObject()) return false;
    if (!readNumber(in, "width", out.width)) out.width = 0;
    if (!readNumber(in, "height", out.height)) out.height = 0;
    return true;
}

bool FromJSON(const JSONValue& in, RecorderStartParams& out) {
    if (!readString(in, "name", out.name) || !readString(in, "url", out.url)) return false;
    out.resolution.reset();
    if (const JSONValue* r = FindMember(in, "resolution")) {
        Resolution res;
        if (FromJSON(*r, res)) out.resolution = res;
    }
    return true;
}

bool FromJSON(const JSONValue& in, LiveStreamStartParams& out) {
    if (!readPlatform(in, "platform", out.platform)) return false;
    readOptString(in, "deviceId", out.deviceId);
    bool interactive = false;
    if (readBool(in, "interactive", interactive)) out.interactive = interactive; else out.interactive.reset();
    return true;
}

bool FromJSON(const JSONValue& in, LiveStreamTapParams& out) {
    return readNumber(in, "x", out.x) && readNumber(in, "y", out.y);
}

bool FromJSON(const JSONValue& in, ProjectIdParams& out) {
    return readString(in, "id", out.id);
}

bool FromJSON(const JSONValue& in, ProjectCreateParams& out) {
    if (!readString(in, "name", out.name)) return false;
    readOptString(in, "packageName", out.packageName);
    return true;
}

bool FromJSON(const JSONValue& in, PingResult&) {
    bool pong = false;
    return readBool(in, "pong", pong) && pong;
}

bool FromJSON(const JSONValue& in, RecorderStartResult& out) {
    return readString(in, "id", out.id) && readString(in, "name", out.name) &&
           readString(in, "url", out.url) && readString(in, "status", out.status) &&
           readString(in, "screenshotsDir", out.screenshotsDir);
}

bool FromJSON(const JSONValue& in, RecorderStopResult& out) {
    return readString(in, "id", out.id) && readString(in, "name", out.name) &&
           readArray(in, "actions", out.actions) && readStringArray(in, "screenshots", out.screenshots);
}

bool FromJSON(const JSONValue& in, SessionPayload& out) {
    return readString(in, "id", out.id) && readString(in, "name", out.name) &&
           readString(in, "url", out.url) && readString(in, "status", out.status) &&
           readArray(in, "actions", out.actions) && readString(in, "screenshotsDir", out.screenshotsDir);
}

bool FromJSON(const JSONValue& in, RecorderStatusResult& out) {
    if (in.isNull()) {
        out.reset();
        return true;
    }
    SessionPayload session;
    if (!FromJSON(in, session)) return false;
    out = std::move(session);
    return true;
}

bool FromJSON(const JSONValue& in, LiveStreamStartResult& out) {
    if (!readPlatform(in, "platform", out.platform) || !readBool(in, "interactive", out.interactive)) return false;
    readOptString(in, "deviceId", out.deviceId);
    return true;
}

bool FromJSON(const JSONValue& in, LiveStreamStopResult&) {
    bool stopped = false;
    return readBool(in, "stopped", stopped) && stopped;
}

bool FromJSON(const JSONValue& in, LiveStreamTapResult& out) {
    return readBool(in, "success", out.success);
}

bool FromJSON(const JSONValue& in, ProjectDeleteResult& out) {
    return readBool(in, "deleted", out.deleted);
}

bool FromJSON(const JSONValue& in, ActionPayload& out) {
    if (!readString(in, "id", out.id) || !readString(in, "type", out.type) ||
        !readInteger(in, "timestamp", out.timestamp)) {
        return false;
    }
    readOptString(in, "selector", out.selector);
    readOptString(in, "text", out.text);
    readOptString(in, "url", out.url);
    readOptString(in, "screenshotPath", out.screenshotPath);
    return true;
}

bool FromJSON(const JSONValue& in, ScreenshotPayload& out) {
    return readString(in, "path", out.path) && readString(in, "actionId", out.actionId);
}

bool FromJSON(const JSONValue& in, StatusPayload& out) {
    return readString(in, "status", out.status);
}

bool FromJSON(const JSONValue& in, LiveFramePayload& out) {
    return readString(in, "image", out.image) && readPlatform(in, "platform", out.platform) &&
           readInteger(in, "timestamp", out.timestamp);
}

bool FromJSON(const JSONValue& in, ErrorPayload& out) {
    if (!readString(in, "message", out.message)) return false;
    readOptString(in, "code", out.code);
    return true;
}

bool FromJSON(const JSONValue& in, ConnectedPayload& out) {
    return readInteger(in, "timestamp", out.timestamp) && readString(in, "serverVersion", out.serverVersion);
}

} // namespace protocol
} // namespace dlab
