//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Messages.cpp
// Purpose: Classification, decoding and encoding of gateway protocol messages
//==========================================================================================================

#include "dlab/protocol/Messages.h"

#include <cmath>

#include "logging/Logger.h"

namespace dlab {
namespace protocol {

Response Response::Success(std::string id, JSONValue payload) {
    return Response(std::move(id), Payload{std::move(payload)});
}

Response Response::Failure(std::string id, std::string error) {
    return Response(std::move(id), Failed{std::move(error)});
}

const JSONValue* Response::GetPayload() const {
    if (const auto* p = std::get_if<Payload>(&outcome)) return &p->value;
    return nullptr;
}

const std::string* Response::GetError() const {
    if (const auto* f = std::get_if<Failed>(&outcome)) return &f->message;
    return nullptr;
}

const char* toString(MessageKind kind) {
    switch (kind) {
        case MessageKind::Request: return "request";
        case MessageKind::Response: return "response";
        case MessageKind::Event: return "event";
        case MessageKind::Unknown:
        default: return "unknown";
    }
}

namespace {

bool hasString(const JSONValue& obj, const char* key) {
    const JSONValue* v = FindMember(obj, key);
    return v && v->isString();
}

bool hasLiteral(const JSONValue& obj, const char* key, const char* literal) {
    const JSONValue* v = FindMember(obj, key);
    return v && v->isString() && std::get<std::string>(v->value) == literal;
}

const std::string& stringMember(const JSONValue& obj, const char* key) {
    return std::get<std::string>(FindMember(obj, key)->value);
}

std::optional<int64_t> integerMember(const JSONValue& obj, const char* key) {
    const JSONValue* v = FindMember(obj, key);
    if (!v) return std::nullopt;
    if (std::holds_alternative<int64_t>(v->value)) return std::get<int64_t>(v->value);
    if (std::holds_alternative<double>(v->value)) {
        double d = std::get<double>(v->value);
        if (std::isfinite(d) && std::trunc(d) == d &&
            d >= -9.2e18 && d <= 9.2e18) {
            return static_cast<int64_t>(d);
        }
    }
    return std::nullopt;
}

void put(JSONValue::Object& obj, const char* key, JSONValue v) {
    obj[key] = std::make_shared<JSONValue>(std::move(v));
}

} // namespace

MessageKind Classify(const JSONValue& value) noexcept {
    if (!value.isObject()) return MessageKind::Unknown;
    // The discriminant literals are distinct, so at most one branch can match.
    if (hasLiteral(value, "type", kRequestType)) {
        return hasString(value, "id") && hasString(value, "method") ? MessageKind::Request : MessageKind::Unknown;
    }
    if (hasLiteral(value, "type", kResponseType)) {
        const JSONValue* ok = FindMember(value, "ok");
        return hasString(value, "id") && ok && ok->isBool() ? MessageKind::Response : MessageKind::Unknown;
    }
    if (hasLiteral(value, "type", kEventType)) {
        return hasString(value, "event") ? MessageKind::Event : MessageKind::Unknown;
    }
    return MessageKind::Unknown;
}

bool IsRequest(const JSONValue& value) noexcept { return Classify(value) == MessageKind::Request; }
bool IsResponse(const JSONValue& value) noexcept { return Classify(value) == MessageKind::Response; }
bool IsEvent(const JSONValue& value) noexcept { return Classify(value) == MessageKind::Event; }
bool IsMessage(const JSONValue& value) noexcept { return Classify(value) != MessageKind::Unknown; }

std::optional<Message> Decode(const JSONValue& value) {
    switch (Classify(value)) {
        case MessageKind::Request: {
            Request r;
            r.id = stringMember(value, "id");
            r.method = stringMember(value, "method");
            const JSONValue* params = FindMember(value, "params");
            r.params = params ? *params : JSONValue(JSONValue::Object{});
            return Message{std::move(r)};
        }
        case MessageKind::Response: {
            const std::string& id = stringMember(value, "id");
            if (std::get<bool>(FindMember(value, "ok")->value)) {
                const JSONValue* payload = FindMember(value, "payload");
                return Message{Response::Success(id, payload ? *payload : JSONValue())};
            }
            return Message{Response::Failure(id, hasString(value, "error") ? stringMember(value, "error") : "")};
        }
        case MessageKind::Event: {
            Event e;
            e.event = stringMember(value, "event");
            const JSONValue* payload = FindMember(value, "payload");
            e.payload = payload ? *payload : JSONValue();
            e.seq = integerMember(value, "seq");
            e.timestamp = integerMember(value, "timestamp");
            return Message{std::move(e)};
        }
        case MessageKind::Unknown:
        default:
            return std::nullopt;
    }
}

std::optional<Message> DecodeText(const std::string& text) {
    std::string err;
    auto parsed = TryParseJSON(text, &err);
    if (!parsed.has_value()) {
        LOG_DEBUG("DecodeText: {}", err);
        return std::nullopt;
    }
    return Decode(parsed.value());
}

JSONValue ToJSON(const Request& request) {
    JSONValue::Object obj;
    put(obj, "type", JSONValue(kRequestType));
    put(obj, "id", JSONValue(request.id));
    put(obj, "method", JSONValue(request.method));
    put(obj, "params", request.params);
    return JSONValue(std::move(obj));
}

JSONValue ToJSON(const Response& response) {
    JSONValue::Object obj;
    put(obj, "type", JSONValue(kResponseType));
    put(obj, "id", JSONValue(response.Id()));
    put(obj, "ok", JSONValue(response.Ok()));
    if (const JSONValue* payload = response.GetPayload()) {
        put(obj, "payload", *payload);
    } else {
        put(obj, "error", JSONValue(*response.GetError()));
    }
    return JSONValue(std::move(obj));
}

JSONValue ToJSON(const Event& event) {
    JSONValue::Object obj;
    put(obj, "type", JSONValue(kEventType));
    put(obj, "event", JSONValue(event.event));
    put(obj, "payload", event.payload);
    if (event.seq.has_value()) put(obj, "seq", JSONValue(event.seq.value()));
    if (event.timestamp.has_value()) put(obj, "timestamp", JSONValue(event.timestamp.value()));
    return JSONValue(std::move(obj));
}

JSONValue ToJSON(const Message& message) {
    return std::visit([](const auto& m) { return ToJSON(m); }, message);
}

std::string Serialize(const Request& request) { return SerializeJSON(ToJSON(request)); }
std::string Serialize(const Response& response) { return SerializeJSON(ToJSON(response)); }
std::string Serialize(const Event& event) { return SerializeJSON(ToJSON(event)); }
std::string Serialize(const Message& message) { return SerializeJSON(ToJSON(message)); }

} // namespace protocol
} // namespace dlab
