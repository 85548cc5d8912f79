//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validator.cpp
// Purpose: Recursive structural matcher and the envelope/method/event entry points
//==========================================================================================================

#include "dlab/validation/Validator.h"

#include <type_traits>

#include "dlab/protocol/Catalog.h"
#include "logging/Logger.h"

namespace dlab {
namespace validation {

namespace {

template <typename>
inline constexpr bool kAlwaysFalse = false;

void typeMismatch(std::vector<ValidationError>& out, const std::string& path, const char* expected,
                  const JSONValue& value) {
    out.push_back(ValidationError{path, std::string("Expected ") + expected, std::string(expected),
                                  std::string(TypeName(value))});
}

void validateInto(std::vector<ValidationError>& out, const JSONValue& value, const Shape& shape,
                  const std::string& path) {
    std::visit([&](const auto& n) {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, AnyShape>) {
            // accepts everything
        } else if constexpr (std::is_same_v<T, StringShape>) {
            if (!value.isString()) typeMismatch(out, path, "string", value);
        } else if constexpr (std::is_same_v<T, NumberShape>) {
            if (!value.isNumber()) typeMismatch(out, path, "number", value);
        } else if constexpr (std::is_same_v<T, BooleanShape>) {
            if (!value.isBool()) typeMismatch(out, path, "boolean", value);
        } else if constexpr (std::is_same_v<T, ConstShape>) {
            if (!JSONEquals(value, n.value)) {
                out.push_back(ValidationError{path, "Expected constant value", RenderScalar(n.value),
                                              RenderScalar(value)});
            }
        } else if constexpr (std::is_same_v<T, EnumShape>) {
            bool member = false;
            if (value.isString()) {
                const auto& s = std::get<std::string>(value.value);
                for (const auto& v : n.values) {
                    if (v == s) { member = true; break; }
                }
            }
            if (!member) {
                std::string joined;
                for (size_t k = 0; k < n.values.size(); ++k) {
                    if (k > 0) joined += ", ";
                    joined += n.values[k];
                }
                out.push_back(ValidationError{path, "Value must be one of: " + joined, std::nullopt,
                                              RenderScalar(value)});
            }
        } else if constexpr (std::is_same_v<T, ArrayShape>) {
            if (!value.isArray()) {
                typeMismatch(out, path, "array", value);
                return;
            }
            if (!n.items) return;
            const auto& arr = std::get<JSONValue::Array>(value.value);
            for (size_t k = 0; k < arr.size(); ++k) {
                const JSONValue nullValue;
                validateInto(out, arr[k] ? *arr[k] : nullValue, *n.items, path + "." + std::to_string(k));
            }
        } else if constexpr (std::is_same_v<T, ObjectShape>) {
            if (!value.isObject()) {
                typeMismatch(out, path, "object", value);
                return;
            }
            const auto& obj = std::get<JSONValue::Object>(value.value);
            for (const auto& p : n.properties) {
                if (p.required && obj.find(p.name) == obj.end()) {
                    out.push_back(ValidationError{path + "." + p.name, "Missing required property: " + p.name,
                                                  std::nullopt, std::nullopt});
                }
            }
            for (const auto& p : n.properties) {
                auto it = obj.find(p.name);
                if (it == obj.end() || !p.shape) continue;
                const JSONValue nullValue;
                validateInto(out, it->second ? *it->second : nullValue, *p.shape, path + "." + p.name);
            }
            if (!n.additionalProperties) {
                for (const auto& [key, _] : obj) {
                    if (!n.find(key)) {
                        out.push_back(ValidationError{path + "." + key, "Unexpected property: " + key,
                                                      std::nullopt, std::nullopt});
                    }
                }
            }
        } else {
            static_assert(kAlwaysFalse<T>, "Validate: unhandled shape node");
        }
    }, shape.node);
}

ValidationResult toResult(std::vector<ValidationError> errors) {
    ValidationResult r;
    r.valid = errors.empty();
    r.errors = std::move(errors);
    return r;
}

ShapePtr buildRequestEnvelope() {
    return Shape::StrictObject({
        Required("type", Shape::Const(JSONValue("req"))),
        Required("id", Shape::String()),
        Required("method", Shape::String()),
        Optional("params", Shape::Object({})),
    });
}

ShapePtr buildResponseEnvelope() {
    return Shape::StrictObject({
        Required("type", Shape::Const(JSONValue("res"))),
        Required("id", Shape::String()),
        Required("ok", Shape::Boolean()),
        Optional("payload", Shape::Any()),
        Optional("error", Shape::String()),
    });
}

ShapePtr buildEventEnvelope() {
    return Shape::StrictObject({
        Required("type", Shape::Const(JSONValue("event"))),
        Required("event", Shape::String()),
        Required("payload", Shape::Any()),
        Optional("seq", Shape::Number()),
        Optional("timestamp", Shape::Number()),
    });
}

} // namespace

std::vector<ValidationError> Validate(const JSONValue& value, const Shape& shape, const std::string& path) {
    std::vector<ValidationError> errors;
    validateInto(errors, value, shape, path);
    return errors;
}

ValidationResult ValidateValue(const JSONValue& value, const Shape& shape) {
    return toResult(Validate(value, shape));
}

const Shape& RequestEnvelopeShape() {
    static const ShapePtr shape = buildRequestEnvelope();
    return *shape;
}

const Shape& ResponseEnvelopeShape() {
    static const ShapePtr shape = buildResponseEnvelope();
    return *shape;
}

const Shape& EventEnvelopeShape() {
    static const ShapePtr shape = buildEventEnvelope();
    return *shape;
}

ValidationResult ValidateRequest(const JSONValue& message) {
    return ValidateValue(message, RequestEnvelopeShape());
}

ValidationResult ValidateResponse(const JSONValue& message) {
    return ValidateValue(message, ResponseEnvelopeShape());
}

ValidationResult ValidateEvent(const JSONValue& message) {
    return ValidateValue(message, EventEnvelopeShape());
}

ValidationResult ValidateMethodParams(const std::string& method, const std::optional<JSONValue>& params) {
    auto m = protocol::parseMethod(method);
    if (!m.has_value()) {
        LOG_DEBUG("ValidateMethodParams: unknown method '{}'", method);
        return toResult({ValidationError{"method", "Unknown method: " + method, std::nullopt, std::nullopt}});
    }
    const Shape& shape = protocol::ParamsShape(m.value());
    if (!params.has_value() || params->isNull()) {
        return ValidateValue(JSONValue(JSONValue::Object{}), shape);
    }
    return ValidateValue(params.value(), shape);
}

ValidationResult ValidateEventPayload(const std::string& event, const JSONValue& payload) {
    auto e = protocol::parseEventType(event);
    if (!e.has_value()) {
        return toResult({ValidationError{"event", "Unknown event: " + event, std::nullopt, std::nullopt}});
    }
    return ValidateValue(payload, protocol::PayloadShape(e.value()));
}

std::string FormatValidationErrors(const std::vector<ValidationError>& errors) {
    std::string out;
    for (size_t k = 0; k < errors.size(); ++k) {
        const auto& e = errors[k];
        if (k > 0) out += '\n';
        out += e.path + ": " + e.message;
        if (e.expected.has_value() && !e.expected->empty()) out += " (expected: " + *e.expected + ")";
        if (e.received.has_value() && !e.received->empty()) out += " (received: " + *e.received + ")";
    }
    return out;
}

JSONValue ToJSON(const std::vector<ValidationError>& errors) {
    JSONValue::Array arr;
    arr.reserve(errors.size());
    for (const auto& e : errors) {
        JSONValue::Object o;
        o["path"] = std::make_shared<JSONValue>(e.path);
        o["message"] = std::make_shared<JSONValue>(e.message);
        if (e.expected.has_value()) o["expected"] = std::make_shared<JSONValue>(*e.expected);
        if (e.received.has_value()) o["received"] = std::make_shared<JSONValue>(*e.received);
        arr.push_back(std::make_shared<JSONValue>(std::move(o)));
    }
    return JSONValue(std::move(arr));
}

} // namespace validation
} // namespace dlab
