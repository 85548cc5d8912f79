//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.h
// Purpose: Generic JSON value, strict parser and serializer used by every wire path in dlab
//==========================================================================================================

#pragma once

#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace dlab {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&) noexcept;
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&) noexcept;
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isBool() const { return std::holds_alternative<bool>(value); }
    bool isNumber() const { return std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }
};

//==========================================================================================================
// JSONParseError
// Purpose: Thrown by ParseJSON; carries the byte offset where parsing stopped.
//==========================================================================================================
class JSONParseError : public std::runtime_error {
public:
    JSONParseError(const std::string& what, std::size_t offset)
        : std::runtime_error(what + " at offset " + std::to_string(offset)), offset(offset) {}
    std::size_t offset;
};

// Maximum nesting accepted by the parser.
constexpr std::size_t kMaxJSONDepth = 512;

//==========================================================================================================
// ParseJSON
// Purpose: Strict RFC 8259 parse of a complete document (whitespace allowed around the value only).
// Throws:
//   JSONParseError on malformed input, trailing characters, or nesting deeper than kMaxJSONDepth.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// TryParseJSON
// Purpose: Non-throwing variant of ParseJSON for dispatch loops.
// Args:
//   text: Input document.
//   error: Optional out-parameter receiving the parse error message.
// Returns:
//   Parsed value, or std::nullopt on failure.
//==========================================================================================================
std::optional<JSONValue> TryParseJSON(const std::string& text, std::string* error = nullptr);

//==========================================================================================================
// SerializeJSON
// Purpose: Serialize a value. indent < 0 yields compact output; indent >= 0 pretty-prints with that many
//          spaces per level. Non-finite doubles are written as null.
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value, int indent = -1);

// Deep equality; numbers compare by value across int64/double.
bool JSONEquals(const JSONValue& a, const JSONValue& b);

// Runtime type name: null, boolean, number, string, array, object.
const char* TypeName(const JSONValue& value);

// String(x)-style rendering: strings verbatim, scalars as literals, containers as compact JSON.
std::string RenderScalar(const JSONValue& value);

// Returns the member or nullptr when value is not an object or the key is absent.
const JSONValue* FindMember(const JSONValue& value, const std::string& key);

// Convenience builder: MakeObject({{"a", JSONValue(int64_t{1})}})
JSONValue MakeObject(std::initializer_list<std::pair<std::string, JSONValue>> members);
JSONValue MakeArray(std::vector<JSONValue> items);

} // namespace dlab
