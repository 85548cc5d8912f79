//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Content.h
// Purpose: Helpers for constructing and extracting typed content items of tool results
//==========================================================================================================

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "dlab/ToolRegistry.h"

namespace dlab {
namespace typed {

//------------------------------ Builders ------------------------------
inline JSONValue makeText(const std::string& text) {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(std::string("text"));
    obj["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{obj};
}

// data is base64 encoded.
inline JSONValue makeImage(const std::string& data, const std::string& mimeType) {
    JSONValue::Object obj;
    obj["type"] = std::make_shared<JSONValue>(std::string("image"));
    obj["data"] = std::make_shared<JSONValue>(data);
    obj["mimeType"] = std::make_shared<JSONValue>(mimeType);
    return JSONValue{obj};
}

inline ToolResult makeTextResult(const std::string& text) {
    ToolResult r;
    r.content.push_back(makeText(text));
    return r;
}

// Pretty-printed JSON (two-space indent) as a single text item.
inline ToolResult makeJsonResult(const JSONValue& data) {
    return makeTextResult(SerializeJSON(data, 2));
}

// Operation failure: text "Error: <message>" with isError set.
inline ToolResult makeErrorResult(const std::string& message) {
    ToolResult r;
    r.content.push_back(makeText("Error: " + message));
    r.isError = true;
    return r;
}

//------------------------------ Inspectors ------------------------------
inline bool isText(const JSONValue& v) {
    const JSONValue* t = FindMember(v, "type");
    return t && t->isString() && std::get<std::string>(t->value) == "text";
}

inline std::optional<std::string> getText(const JSONValue& v) {
    if (!isText(v)) return std::nullopt;
    const JSONValue* t = FindMember(v, "text");
    if (!t || !t->isString()) return std::nullopt;
    return std::get<std::string>(t->value);
}

inline std::vector<std::string> collectText(const std::vector<JSONValue>& arr) {
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (const auto& v : arr) {
        auto t = getText(v);
        if (t.has_value()) out.push_back(t.value());
    }
    return out;
}

inline std::vector<std::string> collectText(const ToolResult& r) {
    return collectText(r.content);
}

inline std::optional<std::string> firstText(const ToolResult& r) {
    auto v = collectText(r);
    if (v.empty()) return std::nullopt;
    return v.front();
}

} // namespace typed
} // namespace dlab
