//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed error structures and JSON-RPC error mapping helpers for dlab
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "dlab/JSONRPCTypes.h"

namespace dlab {
namespace errors {

// Categorization of the JSON-RPC error codes the dispatch server produces.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    Unknown
};

// Typed error representation.
struct DlabError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map a JSON-RPC numeric error code to an ErrorCategory.
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to DlabError.
// Returns std::nullopt when the input is not a valid error object.
inline std::optional<DlabError> errorFromErrorValue(const JSONValue& errVal) {
    const JSONValue* code = FindMember(errVal, "code");
    const JSONValue* msg = FindMember(errVal, "message");
    if (!code || !msg) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(code->value) || !msg->isString()) {
        return std::nullopt;
    }

    DlabError e;
    e.code = static_cast<int>(std::get<int64_t>(code->value));
    e.message = std::get<std::string>(msg->value);
    if (const JSONValue* data = FindMember(errVal, "data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Extract DlabError from a JSONRPCResponse if it carries an error.
inline std::optional<DlabError> errorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return errorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed DlabError.
inline JSONValue makeErrorValue(const DlabError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from DlabError and id.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const DlabError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

} // namespace errors
} // namespace dlab
