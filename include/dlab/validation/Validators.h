//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validators.h
// Purpose: Lightweight validators for tool result shapes (used in Strict mode)
//==========================================================================================================

#pragma once

#include <string>

#include "dlab/JSONValue.h"

namespace dlab {
namespace validation {

//------------------------------ Primitive content checks ------------------------------
inline bool hasStringMember(const JSONValue& v, const char* key) {
    const JSONValue* m = FindMember(v, key);
    return m && m->isString();
}

inline bool isTextContentItem(const JSONValue& v) {
    const JSONValue* t = FindMember(v, "type");
    if (!t || !t->isString() || std::get<std::string>(t->value) != "text") return false;
    return hasStringMember(v, "text");
}

inline bool isImageContentItem(const JSONValue& v) {
    const JSONValue* t = FindMember(v, "type");
    if (!t || !t->isString() || std::get<std::string>(t->value) != "image") return false;
    return hasStringMember(v, "data") && hasStringMember(v, "mimeType");
}

inline bool isContentItem(const JSONValue& v) {
    return isTextContentItem(v) || isImageContentItem(v);
}

//------------------------------ Result validators ------------------------------
// { content: [text|image items], isError?: boolean }
inline bool validateToolResultJson(const JSONValue& v) {
    const JSONValue* content = FindMember(v, "content");
    if (!content || !content->isArray()) return false;
    for (const auto& p : std::get<JSONValue::Array>(content->value)) {
        if (!p || !isContentItem(*p)) return false;
    }
    const JSONValue* isError = FindMember(v, "isError");
    return !isError || isError->isBool();
}

} // namespace validation
} // namespace dlab
