//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Messages.h
// Purpose: Wire message model for the typed gateway protocol: request, response and push event
//==========================================================================================================

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "dlab/JSONValue.h"

namespace dlab {
namespace protocol {

// Discriminant literals carried in the "type" field.
inline constexpr const char* kRequestType = "req";
inline constexpr const char* kResponseType = "res";
inline constexpr const char* kEventType = "event";

//==========================================================================================================
// Request
// Purpose: Client to server call. Wire form { type:"req", id, method, params }.
// Fields:
//   id: Caller-generated correlation token; never reused while its response is outstanding.
//   method: Operation name.
//   params: Method-specific value (an object on the wire).
//==========================================================================================================
struct Request {
    std::string id;
    std::string method;
    JSONValue params;
};

//==========================================================================================================
// Response
// Purpose: Reply correlated to a Request by id. Wire form { type:"res", id, ok, payload? | error? }.
// Notes:
//   Only the Success and Failure factories construct a Response, so exactly one of payload and error is
//   ever present and ok always agrees with which one it is.
//==========================================================================================================
class Response {
public:
    static Response Success(std::string id, JSONValue payload);
    static Response Failure(std::string id, std::string error);

    const std::string& Id() const { return responseId; }
    bool Ok() const { return std::holds_alternative<Payload>(outcome); }

    // Returns nullptr when this is a failure.
    const JSONValue* GetPayload() const;
    // Returns nullptr when this is a success.
    const std::string* GetError() const;

private:
    struct Payload { JSONValue value; };
    struct Failed { std::string message; };

    Response(std::string id, std::variant<Payload, Failed> outcome)
        : responseId(std::move(id)), outcome(std::move(outcome)) {}

    std::string responseId;
    std::variant<Payload, Failed> outcome;
};

//==========================================================================================================
// Event
// Purpose: Server push, not a reply to anything. Wire form { type:"event", event, payload, seq?, timestamp? }.
//==========================================================================================================
struct Event {
    std::string event;
    JSONValue payload;
    std::optional<int64_t> seq;
    std::optional<int64_t> timestamp;
};

using Message = std::variant<Request, Response, Event>;

enum class MessageKind {
    Request,
    Response,
    Event,
    Unknown
};

const char* toString(MessageKind kind);

//==========================================================================================================
// Classify
// Purpose: Structural recognition of a decoded value. Checks the discriminant literal and the variant's
//          mandatory fields only: id/method strings for requests, id string and ok boolean for responses,
//          event string for events. Pure and non-throwing; anything else is Unknown.
//==========================================================================================================
MessageKind Classify(const JSONValue& value) noexcept;

bool IsRequest(const JSONValue& value) noexcept;
bool IsResponse(const JSONValue& value) noexcept;
bool IsEvent(const JSONValue& value) noexcept;
bool IsMessage(const JSONValue& value) noexcept;

//==========================================================================================================
// Decode
// Purpose: Classify, then extract the typed message.
// Notes:
//   Missing request params decode as {}. A successful response without payload decodes with a null
//   payload; a failed response without a string error decodes with an empty error. Non-integral seq or
//   timestamp values are dropped.
// Returns:
//   The message, or std::nullopt when the value is not a recognized message.
//==========================================================================================================
std::optional<Message> Decode(const JSONValue& value);

// Parses the text first; returns std::nullopt on malformed JSON as well.
std::optional<Message> DecodeText(const std::string& text);

JSONValue ToJSON(const Request& request);
JSONValue ToJSON(const Response& response);
JSONValue ToJSON(const Event& event);
JSONValue ToJSON(const Message& message);

// Compact single-line JSON for each variant.
std::string Serialize(const Request& request);
std::string Serialize(const Response& response);
std::string Serialize(const Event& event);
std::string Serialize(const Message& message);

} // namespace protocol
} // namespace dlab
