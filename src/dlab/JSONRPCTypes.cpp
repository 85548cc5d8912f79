//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.cpp
// Purpose: JSON-RPC 2.0 envelope serialization on top of the dlab JSON value layer
//==========================================================================================================

#include "dlab/JSONRPCTypes.h"
#include "logging/Logger.h"

namespace dlab {

JSONValue IdToJSON(const JSONRPCId& id) {
    return std::visit([](const auto& v) -> JSONValue {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return JSONValue(v);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return JSONValue(v);
        } else {
            return JSONValue(nullptr);
        }
    }, id);
}

std::optional<JSONRPCId> IdFromJSON(const JSONValue& value) {
    if (value.isString()) return JSONRPCId{std::get<std::string>(value.value)};
    if (std::holds_alternative<int64_t>(value.value)) return JSONRPCId{std::get<int64_t>(value.value)};
    if (value.isNull()) return JSONRPCId{nullptr};
    return std::nullopt;
}

bool JSONRPCMessage::Deserialize(const std::string& json) {
    FUNC_SCOPE();
    std::string err;
    auto parsed = TryParseJSON(json, &err);
    if (!parsed.has_value()) {
        LOG_ERROR("Failed to deserialize JSON-RPC message: {}", err);
        return false;
    }
    return FromJSON(parsed.value());
}

namespace {
// An absent "jsonrpc" member is tolerated; a present one must be "2.0".
bool hasVersion(const JSONValue& value) {
    const JSONValue* v = FindMember(value, "jsonrpc");
    return !v || (v->isString() && std::get<std::string>(v->value) == "2.0");
}
} // namespace

// JSONRPCRequest implementation
JSONValue JSONRPCRequest::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["id"] = std::make_shared<JSONValue>(IdToJSON(id));
    obj["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(params.value());
    }
    return JSONValue(std::move(obj));
}

std::string JSONRPCRequest::Serialize() const {
    FUNC_SCOPE();
    return SerializeJSON(ToJSON());
}

bool JSONRPCRequest::FromJSON(const JSONValue& value) {
    if (!value.isObject() || !hasVersion(value)) return false;
    const JSONValue* m = FindMember(value, "method");
    if (!m || !m->isString()) return false;
    const JSONValue* idv = FindMember(value, "id");
    if (!idv) return false;
    auto parsedId = IdFromJSON(*idv);
    if (!parsedId.has_value()) return false;
    id = std::move(parsedId.value());
    method = std::get<std::string>(m->value);
    if (const JSONValue* p = FindMember(value, "params")) {
        params = *p;
    } else {
        params.reset();
    }
    return !method.empty();
}

// JSONRPCResponse implementation
JSONValue JSONRPCResponse::ToJSON() const {
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["id"] = std::make_shared<JSONValue>(IdToJSON(id));
    if (result.has_value()) {
        obj["result"] = std::make_shared<JSONValue>(result.value());
    }
    if (error.has_value()) {
        obj["error"] = std::make_shared<JSONValue>(error.value());
    }
    return JSONValue(std::move(obj));
}

std::string JSONRPCResponse::Serialize() const {
    FUNC_SCOPE();
    return SerializeJSON(ToJSON());
}

bool JSONRPCResponse::FromJSON(const JSONValue& value) {
    if (!value.isObject() || !hasVersion(value)) return false;
    const JSONValue* idv = FindMember(value, "id");
    if (!idv) return false;
    auto parsedId = IdFromJSON(*idv);
    if (!parsedId.has_value()) return false;
    id = std::move(parsedId.value());
    result.reset();
    error.reset();
    if (const JSONValue* r = FindMember(value, "result")) result = *r;
    if (const JSONValue* e = FindMember(value, "error")) error = *e;
    return result.has_value() != error.has_value();
}

// JSONRPCNotification implementation
std::string JSONRPCNotification::Serialize() const {
    FUNC_SCOPE();
    JSONValue::Object obj;
    obj["jsonrpc"] = std::make_shared<JSONValue>(jsonrpc);
    obj["method"] = std::make_shared<JSONValue>(method);
    if (params.has_value()) {
        obj["params"] = std::make_shared<JSONValue>(params.value());
    }
    return SerializeJSON(JSONValue(std::move(obj)));
}

bool JSONRPCNotification::FromJSON(const JSONValue& value) {
    if (!value.isObject() || !hasVersion(value)) return false;
    if (FindMember(value, "id")) return false;
    const JSONValue* m = FindMember(value, "method");
    if (!m || !m->isString()) return false;
    method = std::get<std::string>(m->value);
    if (const JSONValue* p = FindMember(value, "params")) {
        params = *p;
    } else {
        params.reset();
    }
    return !method.empty();
}

// Utility functions
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data) {
    FUNC_SCOPE();
    JSONValue::Object errorObj;
    errorObj["code"] = std::make_shared<JSONValue>(static_cast<int64_t>(code));
    errorObj["message"] = std::make_shared<JSONValue>(message);

    if (data.has_value()) {
        errorObj["data"] = std::make_shared<JSONValue>(data.value());
    }

    return JSONValue(std::move(errorObj));
}

std::unique_ptr<JSONRPCResponse> CreateErrorResponse(
    const JSONRPCId& id, int code, const std::string& message,
    const std::optional<JSONValue>& data) {
    FUNC_SCOPE();

    auto response = std::make_unique<JSONRPCResponse>();
    response->id = id;
    response->error = CreateErrorObject(code, message, data);
    return response;
}

} // namespace dlab
