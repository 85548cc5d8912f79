//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Gateway.cpp
// Purpose: Gateway request dispatch and event emission
//==========================================================================================================

#include "dlab/Gateway.h"

#include <mutex>
#include <unordered_map>

#include "dlab/validation/Validator.h"
#include "logging/Logger.h"

namespace dlab {

using protocol::Response;

class Gateway::Impl {
public:
    explicit Impl(protocol::EventSequencer& seq) : sequencer(seq) {}

    protocol::EventSequencer& sequencer;
    std::unordered_map<protocol::Method, MethodHandler> handlers;
    bool sealed{false};

    std::mutex emitMutex;
    EventSink sink;

    std::optional<Response> handleRequest(const JSONValue& value) {
        auto decoded = protocol::Decode(value);
        const auto& req = std::get<protocol::Request>(decoded.value());

        auto envelope = validation::ValidateRequest(value);
        if (!envelope.valid) {
            LOG_WARN("Rejecting request {}: invalid envelope", req.id);
            return Response::Failure(req.id, validation::FormatValidationErrors(envelope.errors));
        }

        auto paramCheck = validation::ValidateMethodParams(req.method, req.params);
        if (!paramCheck.valid) {
            LOG_DEBUG("Rejecting request {} ({}): invalid params", req.id, req.method);
            return Response::Failure(req.id, validation::FormatValidationErrors(paramCheck.errors));
        }

        const auto method = protocol::parseMethod(req.method).value();
        auto it = handlers.find(method);
        if (it == handlers.end()) {
            return Response::Failure(req.id, "Method not implemented: " + req.method);
        }

        try {
            return Response::Success(req.id, it->second(req.params));
        } catch (const std::exception& e) {
            LOG_ERROR("Gateway handler {} failed (id={}): {}", req.method, req.id, e.what());
            return Response::Failure(req.id, e.what());
        } catch (...) {
            LOG_ERROR("Gateway handler {} threw a non-standard exception (id={})", req.method, req.id);
            return Response::Failure(req.id, "Internal error");
        }
    }

    std::string unsequencedError(const std::string& message, const std::string& code) const {
        protocol::ErrorPayload p;
        p.message = message;
        p.code = code;
        return protocol::Serialize(protocol::CreateEvent<protocol::EventType::Error>(p));
    }
};

Gateway::Gateway(protocol::EventSequencer& sequencer)
    : pImpl(std::make_unique<Impl>(sequencer)) {
    FUNC_SCOPE();
    pImpl->handlers[protocol::Method::Ping] = [](const JSONValue&) {
        return protocol::ToJSON(protocol::PingResult{});
    };
}

Gateway::~Gateway() = default;

void Gateway::RegisterMethod(protocol::Method method, MethodHandler handler) {
    if (pImpl->sealed) {
        throw std::logic_error(std::string("Gateway: cannot register ") + protocol::toString(method) + " after Seal()");
    }
    if (!handler) {
        throw std::invalid_argument(std::string("Gateway: empty handler for ") + protocol::toString(method));
    }
    LOG_DEBUG("Gateway method registered: {}", protocol::toString(method));
    pImpl->handlers[method] = std::move(handler);
}

void Gateway::Seal() {
    pImpl->sealed = true;
}

bool Gateway::IsImplemented(protocol::Method method) const {
    return pImpl->handlers.count(method) != 0;
}

void Gateway::SetEventSink(EventSink sink) {
    std::lock_guard<std::mutex> lock(pImpl->emitMutex);
    pImpl->sink = std::move(sink);
}

std::optional<Response> Gateway::HandleMessage(const JSONValue& value) {
    FUNC_SCOPE();
    switch (protocol::Classify(value)) {
        case protocol::MessageKind::Request:
            return pImpl->handleRequest(value);
        case protocol::MessageKind::Response:
            LOG_DEBUG("Ignoring response from peer");
            return std::nullopt;
        case protocol::MessageKind::Event:
            LOG_DEBUG("Ignoring event from peer");
            return std::nullopt;
        case protocol::MessageKind::Unknown:
            break;
    }
    const JSONValue* id = FindMember(value, "id");
    if (id && id->isString()) {
        auto check = validation::ValidateRequest(value);
        return Response::Failure(std::get<std::string>(id->value),
                                 check.valid ? std::string("Invalid message")
                                             : validation::FormatValidationErrors(check.errors));
    }
    LOG_WARN("Dropping unrecognized message of type {}", TypeName(value));
    return std::nullopt;
}

std::optional<std::string> Gateway::HandleLine(const std::string& line) {
    std::string err;
    auto parsed = TryParseJSON(line, &err);
    if (!parsed.has_value()) {
        LOG_WARN("Gateway parse error: {}", err);
        return pImpl->unsequencedError("Parse error", "PARSE_ERROR");
    }
    auto response = HandleMessage(parsed.value());
    if (!response.has_value()) return std::nullopt;
    return protocol::Serialize(response.value());
}

std::optional<std::string> Gateway::HandleFramingError(const std::string& reason) {
    LOG_WARN("Gateway dropping input: {}", reason);
    return pImpl->unsequencedError("Message too large", "MESSAGE_TOO_LARGE");
}

protocol::Event Gateway::Emit(protocol::EventType type, JSONValue payload) {
    std::lock_guard<std::mutex> lock(pImpl->emitMutex);
    auto event = protocol::CreateEvent(type, std::move(payload), pImpl->sequencer.Next());
    if (pImpl->sink) {
        pImpl->sink(protocol::Serialize(event));
    } else {
        LOG_DEBUG("Event {} (seq={}) emitted without a sink", event.event, event.seq.value_or(0));
    }
    return event;
}

} // namespace dlab
