//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: JSON-RPC tool-dispatch server implementation
//==========================================================================================================

#include "dlab/Server.h"

#include "dlab/errors/Errors.h"
#include "dlab/typed/Content.h"
#include "dlab/validation/Validator.h"
#include "dlab/validation/Validators.h"
#include "dlab/version.h"
#include "logging/Logger.h"

namespace dlab {

ServerInfo ServerInfo::Default() {
    return ServerInfo{kServerName, getVersionString()};
}

class Server::Impl {
public:
    ServerInfo info;
    ToolRegistry registry;
    validation::ValidationMode validationMode{validation::ValidationMode::Off};

    static std::string idToString(const JSONRPCId& id) {
        if (std::holds_alternative<std::string>(id)) return std::get<std::string>(id);
        if (std::holds_alternative<int64_t>(id)) return std::to_string(std::get<int64_t>(id));
        return "null";
    }

    std::unique_ptr<JSONRPCResponse> dispatchRequest(const JSONRPCRequest& req);

    std::unique_ptr<JSONRPCResponse> handleInitialize(const JSONRPCRequest& request) {
        LOG_INFO("Handling initialize request");
        JSONValue::Object resultObj;
        resultObj["protocolVersion"] = std::make_shared<JSONValue>(kProtocolVersion);
        JSONValue::Object capabilities;
        capabilities["tools"] = std::make_shared<JSONValue>(JSONValue::Object{});
        resultObj["capabilities"] = std::make_shared<JSONValue>(std::move(capabilities));
        JSONValue::Object serverInfoObj;
        serverInfoObj["name"] = std::make_shared<JSONValue>(info.name);
        serverInfoObj["version"] = std::make_shared<JSONValue>(info.version);
        resultObj["serverInfo"] = std::make_shared<JSONValue>(std::move(serverInfoObj));

        auto response = std::make_unique<JSONRPCResponse>();
        response->id = request.id;
        response->result = JSONValue(std::move(resultObj));
        return response;
    }

    std::unique_ptr<JSONRPCResponse> handleToolsList(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling tools/list request");
        JSONValue::Array arr;
        for (const auto& t : registry.List()) {
            JSONValue::Object obj;
            obj["name"] = std::make_shared<JSONValue>(t.name);
            obj["description"] = std::make_shared<JSONValue>(t.description);
            obj["inputSchema"] = std::make_shared<JSONValue>(
                t.inputShape ? validation::ToJSONSchema(*t.inputShape)
                             : MakeObject({{"type", JSONValue("object")}}));
            arr.push_back(std::make_shared<JSONValue>(std::move(obj)));
        }
        auto resp = std::make_unique<JSONRPCResponse>();
        resp->id = req.id;
        resp->result = MakeObject({{"tools", JSONValue(std::move(arr))}});
        return resp;
    }

    std::unique_ptr<JSONRPCResponse> handleToolsCall(const JSONRPCRequest& req) {
        LOG_DEBUG("Handling tools/call request");
        const JSONValue* nameValue = req.params.has_value() ? FindMember(req.params.value(), "name") : nullptr;
        if (!nameValue || !nameValue->isString()) {
            errors::DlabError e; e.code = JSONRPCErrorCodes::InvalidParams; e.message = "Invalid params: missing tool name";
            return errors::makeErrorResponse(req.id, e);
        }
        const std::string& name = std::get<std::string>(nameValue->value);

        const ToolRegistry::Entry* entry = registry.Find(name);
        if (!entry) {
            errors::DlabError e; e.code = JSONRPCErrorCodes::InvalidParams; e.message = "Tool not found: " + name;
            return errors::makeErrorResponse(req.id, e);
        }

        JSONValue arguments{JSONValue::Object{}};
        if (const JSONValue* a = FindMember(req.params.value(), "arguments"); a && !a->isNull()) {
            arguments = *a;
        }

        if (entry->tool.inputShape) {
            auto errs = validation::Validate(arguments, *entry->tool.inputShape);
            if (!errs.empty()) {
                LOG_DEBUG("tools/call {}: {}", name, validation::FormatValidationErrors(errs));
                errors::DlabError e;
                e.code = JSONRPCErrorCodes::InvalidParams;
                e.message = "Invalid parameters";
                e.data = validation::ToJSON(errs);
                return errors::makeErrorResponse(req.id, e);
            }
        }

        ToolResult tr;
        try {
            auto fut = entry->handler(arguments);
            tr = fut.get();
        } catch (const std::exception& e) {
            LOG_WARN("Tool {} failed (id={}): {}", name, idToString(req.id), e.what());
            tr = typed::makeErrorResult(e.what());
        } catch (...) {
            LOG_ERROR("Tool {} threw a non-standard exception (id={})", name, idToString(req.id));
            tr = typed::makeErrorResult("Tool execution failed");
        }

        JSONValue result = ToJSON(tr);
        if (validationMode == validation::ValidationMode::Strict) {
            if (!validation::validateToolResultJson(result)) {
                LOG_ERROR("Validation failed (Strict): {} result invalid for tool {}", Methods::CallTool, name);
                errors::DlabError e; e.code = JSONRPCErrorCodes::InternalError; e.message = "Invalid tool result shape";
                return errors::makeErrorResponse(req.id, e);
            }
        }
        auto resp = std::make_unique<JSONRPCResponse>();
        resp->id = req.id;
        resp->result = std::move(result);
        return resp;
    }

    std::unique_ptr<JSONRPCResponse> handlePing(const JSONRPCRequest& req) {
        auto resp = std::make_unique<JSONRPCResponse>();
        resp->id = req.id;
        resp->result = MakeObject({{"pong", JSONValue(true)}});
        return resp;
    }
};

std::unique_ptr<JSONRPCResponse> Server::Impl::dispatchRequest(const JSONRPCRequest& req) {
    try {
        if (req.method == Methods::Initialize) {
            return this->handleInitialize(req);
        } else if (req.method == Methods::ListTools) {
            return this->handleToolsList(req);
        } else if (req.method == Methods::CallTool) {
            return this->handleToolsCall(req);
        } else if (req.method == Methods::Ping) {
            return this->handlePing(req);
        }
        errors::DlabError e; e.code = JSONRPCErrorCodes::MethodNotFound; e.message = "Method not found: " + req.method;
        return errors::makeErrorResponse(req.id, e);
    } catch (const std::exception& e) {
        LOG_ERROR("Request {} ({}) failed: {}", idToString(req.id), req.method, e.what());
        errors::DlabError err; err.code = JSONRPCErrorCodes::InternalError; err.message = e.what();
        return errors::makeErrorResponse(req.id, err);
    } catch (...) {
        LOG_ERROR("Request {} ({}) failed with a non-standard exception", idToString(req.id), req.method);
        errors::DlabError err; err.code = JSONRPCErrorCodes::InternalError; err.message = "Internal error";
        return errors::makeErrorResponse(req.id, err);
    }
}

Server::Server(ServerInfo info, ToolRegistry registry, validation::ValidationMode mode)
    : pImpl(std::make_unique<Impl>()) {
    FUNC_SCOPE();
    pImpl->info = std::move(info);
    pImpl->registry = std::move(registry);
    pImpl->registry.Seal();
    pImpl->validationMode = mode;
    LOG_INFO("Server '{}' {} ready with {} tool(s), validation={}", pImpl->info.name, pImpl->info.version,
             pImpl->registry.Size(), validation::toString(mode));
}

Server::~Server() = default;

std::unique_ptr<JSONRPCResponse> Server::HandleJSONRPC(const JSONRPCRequest& request) {
    FUNC_SCOPE();
    return pImpl->dispatchRequest(request);
}

std::optional<std::string> Server::HandleLine(const std::string& line) {
    FUNC_SCOPE();
    std::string err;
    auto parsed = TryParseJSON(line, &err);
    if (!parsed.has_value()) {
        LOG_WARN("Parse error: {}", err);
        return CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error")->Serialize();
    }
    const JSONValue& value = parsed.value();
    if (!value.isObject()) {
        return CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid Request")->Serialize();
    }

    if (!FindMember(value, "id")) {
        JSONRPCNotification note;
        if (note.FromJSON(value)) {
            LOG_DEBUG("Ignoring notification: {}", note.method);
            return std::nullopt;
        }
        return CreateErrorResponse(nullptr, JSONRPCErrorCodes::InvalidRequest, "Invalid Request")->Serialize();
    }

    JSONRPCRequest req;
    if (!req.FromJSON(value)) {
        // Echo the id when it is usable so the caller can correlate the failure.
        JSONRPCId id = nullptr;
        if (auto parsedId = IdFromJSON(*FindMember(value, "id"))) id = parsedId.value();
        return CreateErrorResponse(id, JSONRPCErrorCodes::InvalidRequest, "Invalid Request")->Serialize();
    }
    return HandleJSONRPC(req)->Serialize();
}

std::optional<std::string> Server::HandleFramingError(const std::string& reason) {
    LOG_WARN("Dropping input: {}", reason);
    return CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error: " + reason)->Serialize();
}

const ToolRegistry& Server::Registry() const {
    return pImpl->registry;
}

validation::ValidationMode Server::GetValidationMode() const {
    return pImpl->validationMode;
}

} // namespace dlab
