//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Catalog.h
// Purpose: Closed method and event catalogs of the gateway protocol with typed params, results and payloads
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "dlab/JSONValue.h"
#include "dlab/validation/Shape.h"

namespace dlab {
namespace protocol {

enum class Method {
    Ping,
    RecorderStart,
    RecorderStop,
    RecorderStatus,
    LiveStreamStart,
    LiveStreamStop,
    LiveStreamTap,
    ProjectList,
    ProjectGet,
    ProjectCreate,
    ProjectDelete,
};

enum class EventType {
    Action,
    Screenshot,
    Status,
    Stopped,
    Session,
    LiveFrame,
    Error,
    Connected,
};

enum class Platform {
    Ios,
    Android,
};

const char* toString(Method method);
const char* toString(EventType event);
const char* toString(Platform platform);

std::optional<Method> parseMethod(const std::string& name);
std::optional<EventType> parseEventType(const std::string& name);
std::optional<Platform> parsePlatform(const std::string& name);

// Catalog order, as listed in the protocol.
const std::vector<Method>& AvailableMethods();
const std::vector<EventType>& AvailableEvents();

//==========================================================================================================
// ParamsShape / PayloadShape
// Purpose: Runtime shapes for method params (strict objects) and event payloads (objects that tolerate
//          extra keys).
//==========================================================================================================
const validation::Shape& ParamsShape(Method method);
const validation::Shape& PayloadShape(EventType event);

//------------------------------ Params ------------------------------

// Methods that take no arguments.
struct EmptyParams {};

struct Resolution {
    double width{0};
    double height{0};
};

struct RecorderStartParams {
    std::string name;
    std::string url;
    std::optional<Resolution> resolution;
};

struct LiveStreamStartParams {
    Platform platform{Platform::Ios};
    std::optional<std::string> deviceId;
    std::optional<bool> interactive;
};

struct LiveStreamTapParams {
    double x{0};
    double y{0};
};

// project.get and project.delete
struct ProjectIdParams {
    std::string id;
};

struct ProjectCreateParams {
    std::string name;
    std::optional<std::string> packageName;
};

//------------------------------ Results and event payloads ------------------------------

// Encodes as { pong: true }.
struct PingResult {};

struct RecorderStartResult {
    std::string id;
    std::string name;
    std::string url;
    std::string status;
    std::string screenshotsDir;
};

// recorder.stop result and the payload of the "stopped" event.
struct RecorderStopResult {
    std::string id;
    std::string name;
    std::vector<JSONValue> actions;
    std::vector<std::string> screenshots;
};

struct SessionPayload {
    std::string id;
    std::string name;
    std::string url;
    std::string status;
    std::vector<JSONValue> actions;
    std::string screenshotsDir;
};

// recorder.status: null when no session is active.
using RecorderStatusResult = std::optional<SessionPayload>;

struct LiveStreamStartResult {
    Platform platform{Platform::Ios};
    std::optional<std::string> deviceId;
    bool interactive{false};
};

// Encodes as { stopped: true }.
struct LiveStreamStopResult {};

struct LiveStreamTapResult {
    bool success{false};
};

struct ProjectDeleteResult {
    bool deleted{false};
};

struct ActionPayload {
    std::string id;
    std::string type;
    int64_t timestamp{0};
    std::optional<std::string> selector;
    std::optional<std::string> text;
    std::optional<std::string> url;
    std::optional<std::string> screenshotPath;
};

struct ScreenshotPayload {
    std::string path;
    std::string actionId;
};

struct StatusPayload {
    std::string status;
};

struct LiveFramePayload {
    std::string image; // base64
    Platform platform{Platform::Ios};
    int64_t timestamp{0};
};

struct ErrorPayload {
    std::string message;
    std::optional<std::string> code;
};

struct ConnectedPayload {
    int64_t timestamp{0};
    std::string serverVersion;
};

//------------------------------ Codecs ------------------------------
// ToJSON never fails. FromJSON returns false when required fields are missing or mistyped; optional
// fields of the wrong type are left unset.

JSONValue ToJSON(const JSONValue& v);
JSONValue ToJSON(const EmptyParams& v);
JSONValue ToJSON(const Resolution& v);
JSONValue ToJSON(const RecorderStartParams& v);
JSONValue ToJSON(const LiveStreamStartParams& v);
JSONValue ToJSON(const LiveStreamTapParams& v);
JSONValue ToJSON(const ProjectIdParams& v);
JSONValue ToJSON(const ProjectCreateParams& v);
JSONValue ToJSON(const PingResult& v);
JSONValue ToJSON(const RecorderStartResult& v);
JSONValue ToJSON(const RecorderStopResult& v);
JSONValue ToJSON(const SessionPayload& v);
JSONValue ToJSON(const RecorderStatusResult& v);
JSONValue ToJSON(const LiveStreamStartResult& v);
JSONValue ToJSON(const LiveStreamStopResult& v);
JSONValue ToJSON(const LiveStreamTapResult& v);
JSONValue ToJSON(const ProjectDeleteResult& v);
JSONValue ToJSON(const ActionPayload& v);
JSONValue ToJSON(const ScreenshotPayload& v);
JSONValue ToJSON(const StatusPayload& v);
JSONValue ToJSON(const LiveFramePayload& v);
JSONValue ToJSON(const ErrorPayload& v);
JSONValue ToJSON(const ConnectedPayload& v);

bool FromJSON(const JSONValue& in, JSONValue& out);
bool FromJSON(const JSONValue& in, EmptyParams& out);
bool FromJSON(const JSONValue& in, Resolution& out);
bool FromJSON(const JSONValue& in, RecorderStartParams& out);
bool FromJSON(const JSONValue& in, LiveStreamStartParams& out);
bool FromJSON(const JSONValue& in, LiveStreamTapParams& out);
bool FromJSON(const JSONValue& in, ProjectIdParams& out);
bool FromJSON(const JSONValue& in, ProjectCreateParams& out);
bool FromJSON(const JSONValue& in, PingResult& out);
bool FromJSON(const JSONValue& in, RecorderStartResult& out);
bool FromJSON(const JSONValue& in, RecorderStopResult& out);
bool FromJSON(const JSONValue& in, SessionPayload& out);
bool FromJSON(const JSONValue& in, RecorderStatusResult& out);
bool FromJSON(const JSONValue& in, LiveStreamStartResult& out);
bool FromJSON(const JSONValue& in, LiveStreamStopResult& out);
bool FromJSON(const JSONValue& in, LiveStreamTapResult& out);
bool FromJSON(const JSONValue& in, ProjectDeleteResult& out);
bool FromJSON(const JSONValue& in, ActionPayload& out);
bool FromJSON(const JSONValue& in, ScreenshotPayload& out);
bool FromJSON(const JSONValue& in, StatusPayload& out);
bool FromJSON(const JSONValue& in, LiveFramePayload& out);
bool FromJSON(const JSONValue& in, ErrorPayload& out);
bool FromJSON(const JSONValue& in, ConnectedPayload& out);

//==========================================================================================================
// MethodTraits / EventTraits
// Purpose: Compile-time catalog: the params and result types of each method and the payload type of each
//          event. Used by the typed factory overloads and Gateway::RegisterTypedMethod.
//==========================================================================================================
template <Method M> struct MethodTraits;

#define DLAB_METHOD_TRAITS(M, P, R) \
    template <> struct MethodTraits<Method::M> { using Params = P; using Result = R; };

DLAB_METHOD_TRAITS(Ping, EmptyParams, PingResult)
DLAB_METHOD_TRAITS(RecorderStart, RecorderStartParams, RecorderStartResult)
DLAB_METHOD_TRAITS(RecorderStop, EmptyParams, RecorderStopResult)
DLAB_METHOD_TRAITS(RecorderStatus, EmptyParams, RecorderStatusResult)
DLAB_METHOD_TRAITS(LiveStreamStart, LiveStreamStartParams, LiveStreamStartResult)
DLAB_METHOD_TRAITS(LiveStreamStop, EmptyParams, LiveStreamStopResult)
DLAB_METHOD_TRAITS(LiveStreamTap, LiveStreamTapParams, LiveStreamTapResult)
DLAB_METHOD_TRAITS(ProjectList, EmptyParams, JSONValue)
DLAB_METHOD_TRAITS(ProjectGet, ProjectIdParams, JSONValue)
DLAB_METHOD_TRAITS(ProjectCreate, ProjectCreateParams, JSONValue)
DLAB_METHOD_TRAITS(ProjectDelete, ProjectIdParams, ProjectDeleteResult)

#undef DLAB_METHOD_TRAITS

template <EventType E> struct EventTraits;

#define DLAB_EVENT_TRAITS(E, P) \
    template <> struct EventTraits<EventType::E> { using Payload = P; };

DLAB_EVENT_TRAITS(Action, ActionPayload)
DLAB_EVENT_TRAITS(Screenshot, ScreenshotPayload)
DLAB_EVENT_TRAITS(Status, StatusPayload)
DLAB_EVENT_TRAITS(Stopped, RecorderStopResult)
DLAB_EVENT_TRAITS(Session, SessionPayload)
DLAB_EVENT_TRAITS(LiveFrame, LiveFramePayload)
DLAB_EVENT_TRAITS(Error, ErrorPayload)
DLAB_EVENT_TRAITS(Connected, ConnectedPayload)

#undef DLAB_EVENT_TRAITS

} // namespace protocol
} // namespace dlab
