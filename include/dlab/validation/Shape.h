//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Shape.h
// Purpose: Declarative shape descriptions (closed node set) consumed by the structural validator
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "dlab/JSONValue.h"

namespace dlab {
namespace validation {

struct Shape;
using ShapePtr = std::shared_ptr<const Shape>;

// Accepts any value, including null.
struct AnyShape {};
struct StringShape {};
struct NumberShape {};
struct BooleanShape {};

// Value must be one of the listed strings.
struct EnumShape {
    std::vector<std::string> values;
};

// Value must deep-equal the literal.
struct ConstShape {
    JSONValue value;
};

struct ArrayShape {
    ShapePtr items;
};

struct PropertyShape {
    std::string name;
    ShapePtr shape;
    bool required{false};
};

//==========================================================================================================
// ObjectShape
// Purpose: Object node. Properties keep declaration order, which is also the order errors are reported in.
// Fields:
//   properties: Known keys with their sub-shapes and required flags.
//   additionalProperties: When false, keys not listed in properties are rejected.
//==========================================================================================================
struct ObjectShape {
    std::vector<PropertyShape> properties;
    bool additionalProperties{true};

    const PropertyShape* find(const std::string& key) const;
};

//==========================================================================================================
// Shape
// Purpose: One node of a shape tree. Nodes are immutable once built and shared through ShapePtr.
//==========================================================================================================
struct Shape {
    using Node = std::variant<
        AnyShape,
        StringShape,
        NumberShape,
        BooleanShape,
        EnumShape,
        ConstShape,
        ArrayShape,
        ObjectShape
    >;

    Node node;
    std::string description;

    static ShapePtr Any(std::string description = {});
    static ShapePtr String(std::string description = {});
    static ShapePtr Number(std::string description = {});
    static ShapePtr Boolean(std::string description = {});
    static ShapePtr Enum(std::vector<std::string> values, std::string description = {});
    static ShapePtr Const(JSONValue value, std::string description = {});
    static ShapePtr ArrayOf(ShapePtr items, std::string description = {});
    static ShapePtr Object(std::vector<PropertyShape> properties, bool additionalProperties = true,
                           std::string description = {});
    // Object that rejects unknown keys.
    static ShapePtr StrictObject(std::vector<PropertyShape> properties, std::string description = {});
};

PropertyShape Required(std::string name, ShapePtr shape);
PropertyShape Optional(std::string name, ShapePtr shape);

// Short node-kind label: any, string, number, boolean, enum, const, array, object.
const char* KindName(const Shape& shape);

//==========================================================================================================
// ToJSONSchema
// Purpose: Render a shape as a JSON-Schema descriptor (tools/list inputSchema). Every node kind has an
//          exact mapping; adding a node kind without one fails to compile.
//==========================================================================================================
JSONValue ToJSONSchema(const Shape& shape);

} // namespace validation
} // namespace dlab
