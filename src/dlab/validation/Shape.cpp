//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Shape.cpp
// Purpose: Shape builders and JSON-Schema rendering
//==========================================================================================================

#include "dlab/validation/Shape.h"

#include <type_traits>

namespace dlab {
namespace validation {

namespace {

template <typename>
inline constexpr bool kAlwaysFalse = false;

ShapePtr make(Shape::Node node, std::string description) {
    auto s = std::make_shared<Shape>();
    s->node = std::move(node);
    s->description = std::move(description);
    return s;
}

void put(JSONValue::Object& obj, const char* key, JSONValue v) {
    obj[key] = std::make_shared<JSONValue>(std::move(v));
}

} // namespace

const PropertyShape* ObjectShape::find(const std::string& key) const {
    for (const auto& p : properties) {
        if (p.name == key) return &p;
    }
    return nullptr;
}

ShapePtr Shape::Any(std::string description) { return make(AnyShape{}, std::move(description)); }
ShapePtr Shape::String(std::string description) { return make(StringShape{}, std::move(description)); }
ShapePtr Shape::Number(std::string description) { return make(NumberShape{}, std::move(description)); }
ShapePtr Shape::Boolean(std::string description) { return make(BooleanShape{}, std::move(description)); }

ShapePtr Shape::Enum(std::vector<std::string> values, std::string description) {
    return make(EnumShape{std::move(values)}, std::move(description));
}

ShapePtr Shape::Const(JSONValue value, std::string description) {
    return make(ConstShape{std::move(value)}, std::move(description));
}

ShapePtr Shape::ArrayOf(ShapePtr items, std::string description) {
    return make(ArrayShape{std::move(items)}, std::move(description));
}

ShapePtr Shape::Object(std::vector<PropertyShape> properties, bool additionalProperties, std::string description) {
    return make(ObjectShape{std::move(properties), additionalProperties}, std::move(description));
}

ShapePtr Shape::StrictObject(std::vector<PropertyShape> properties, std::string description) {
    return Object(std::move(properties), false, std::move(description));
}

PropertyShape Required(std::string name, ShapePtr shape) {
    return PropertyShape{std::move(name), std::move(shape), true};
}

PropertyShape Optional(std::string name, ShapePtr shape) {
    return PropertyShape{std::move(name), std::move(shape), false};
}

const char* KindName(const Shape& shape) {
    return std::visit([](const auto& n) -> const char* {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, AnyShape>) return "any";
        else if constexpr (std::is_same_v<T, StringShape>) return "string";
        else if constexpr (std::is_same_v<T, NumberShape>) return "number";
        else if constexpr (std::is_same_v<T, BooleanShape>) return "boolean";
        else if constexpr (std::is_same_v<T, EnumShape>) return "enum";
        else if constexpr (std::is_same_v<T, ConstShape>) return "const";
        else if constexpr (std::is_same_v<T, ArrayShape>) return "array";
        else if constexpr (std::is_same_v<T, ObjectShape>) return "object";
        else static_assert(kAlwaysFalse<T>, "KindName: unhandled shape node");
    }, shape.node);
}

JSONValue ToJSONSchema(const Shape& shape) {
    JSONValue::Object out;
    std::visit([&out](const auto& n) {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, AnyShape>) {
            // {} accepts everything
        } else if constexpr (std::is_same_v<T, StringShape>) {
            put(out, "type", JSONValue("string"));
        } else if constexpr (std::is_same_v<T, NumberShape>) {
            put(out, "type", JSONValue("number"));
        } else if constexpr (std::is_same_v<T, BooleanShape>) {
            put(out, "type", JSONValue("boolean"));
        } else if constexpr (std::is_same_v<T, EnumShape>) {
            JSONValue::Array values;
            for (const auto& v : n.values) values.push_back(std::make_shared<JSONValue>(v));
            put(out, "type", JSONValue("string"));
            put(out, "enum", JSONValue(std::move(values)));
        } else if constexpr (std::is_same_v<T, ConstShape>) {
            put(out, "const", n.value);
        } else if constexpr (std::is_same_v<T, ArrayShape>) {
            put(out, "type", JSONValue("array"));
            put(out, "items", n.items ? ToJSONSchema(*n.items) : JSONValue(JSONValue::Object{}));
        } else if constexpr (std::is_same_v<T, ObjectShape>) {
            JSONValue::Object properties;
            JSONValue::Array required;
            for (const auto& p : n.properties) {
                properties[p.name] = std::make_shared<JSONValue>(
                    p.shape ? ToJSONSchema(*p.shape) : JSONValue(JSONValue::Object{}));
                if (p.required) required.push_back(std::make_shared<JSONValue>(p.name));
            }
            put(out, "type", JSONValue("object"));
            put(out, "properties", JSONValue(std::move(properties)));
            if (!required.empty()) put(out, "required", JSONValue(std::move(required)));
            if (!n.additionalProperties) put(out, "additionalProperties", JSONValue(false));
        } else {
            static_assert(kAlwaysFalse<T>, "ToJSONSchema: unhandled shape node");
        }
    }, shape.node);
    if (!shape.description.empty()) {
        put(out, "description", JSONValue(shape.description));
    }
    return JSONValue(std::move(out));
}

} // namespace validation
} // namespace dlab
