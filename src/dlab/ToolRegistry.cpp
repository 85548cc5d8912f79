//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.cpp
// Purpose: Tool registration and lookup
//==========================================================================================================

#include "dlab/ToolRegistry.h"

#include <stdexcept>

#include "logging/Logger.h"

namespace dlab {

JSONValue ToJSON(const ToolResult& result) {
    JSONValue::Object obj;
    JSONValue::Array content;
    for (const auto& v : result.content) content.push_back(std::make_shared<JSONValue>(v));
    obj["content"] = std::make_shared<JSONValue>(std::move(content));
    obj["isError"] = std::make_shared<JSONValue>(result.isError);
    return JSONValue(std::move(obj));
}

void ToolRegistry::Register(Tool tool, ToolHandler handler) {
    FUNC_SCOPE();
    if (sealed) {
        throw std::logic_error("ToolRegistry: cannot register '" + tool.name + "' after serving has started");
    }
    if (tool.name.empty()) {
        throw std::invalid_argument("ToolRegistry: tool name must not be empty");
    }
    if (!handler) {
        throw std::invalid_argument("ToolRegistry: tool '" + tool.name + "' has no handler");
    }
    if (entries.count(tool.name) != 0) {
        throw std::invalid_argument("ToolRegistry: duplicate tool '" + tool.name + "'");
    }
    LOG_DEBUG("Registered tool: {}", tool.name);
    std::string key = tool.name;
    entries.emplace(std::move(key), Entry{std::move(tool), std::move(handler)});
}

const ToolRegistry::Entry* ToolRegistry::Find(const std::string& name) const {
    auto it = entries.find(name);
    return it == entries.end() ? nullptr : &it->second;
}

std::vector<Tool> ToolRegistry::List() const {
    std::vector<Tool> tools;
    tools.reserve(entries.size());
    for (const auto& [name, entry] : entries) tools.push_back(entry.tool);
    return tools;
}

} // namespace dlab
