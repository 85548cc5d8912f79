//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolRegistry.h
// Purpose: Tool metadata, handler signature and the name-keyed registry consumed by the dispatch server
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <map>
#include <string>
#include <vector>

#include "dlab/JSONValue.h"
#include "dlab/validation/Shape.h"

namespace dlab {

//==========================================================================================================
// Tool
// Purpose: Metadata advertised by tools/list.
// Fields:
//   name: Unique tool name.
//   description: Human-readable summary.
//   inputShape: Shape the call arguments are validated against; null accepts any arguments.
//==========================================================================================================
struct Tool {
    std::string name;
    std::string description;
    validation::ShapePtr inputShape;

    Tool() = default;
    Tool(std::string name, std::string description, validation::ShapePtr inputShape = nullptr)
        : name(std::move(name)), description(std::move(description)), inputShape(std::move(inputShape)) {}
};

// Outcome of a tool call. isError marks an operation failure inside an otherwise successful RPC.
struct ToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;
};

// Handlers receive validated arguments and complete the future with a result or an exception.
using ToolHandler = std::function<std::future<ToolResult>(const JSONValue&)>;

// Wire form { content: [...], isError }.
JSONValue ToJSON(const ToolResult& result);

//==========================================================================================================
// ToolRegistry
// Purpose: Tool table with a registration phase followed by a read-only serving phase.
// Methods:
//   Register(tool, handler): Adds a tool. Throws std::invalid_argument for an empty name, an empty handler
//                            or a duplicate name; std::logic_error once sealed.
//   Seal(): Ends registration. The dispatch server seals the registry it is given.
//   Find(name): Entry pointer or nullptr. Pointers stay valid for the registry's lifetime after Seal().
//   List(): Tools sorted by name.
//==========================================================================================================
class ToolRegistry {
public:
    struct Entry {
        Tool tool;
        ToolHandler handler;
    };

    ToolRegistry() = default;
    ToolRegistry(ToolRegistry&&) = default;
    ToolRegistry& operator=(ToolRegistry&&) = default;
    ToolRegistry(const ToolRegistry&) = delete;
    ToolRegistry& operator=(const ToolRegistry&) = delete;

    void Register(Tool tool, ToolHandler handler);
    void Seal() { sealed = true; }
    bool IsSealed() const { return sealed; }

    const Entry* Find(const std::string& name) const;
    std::vector<Tool> List() const;
    std::size_t Size() const { return entries.size(); }

private:
    std::map<std::string, Entry> entries;
    bool sealed = false;
};

} // namespace dlab
