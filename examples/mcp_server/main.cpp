//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Stdio JSON-RPC tool server with in-memory project tools
//==========================================================================================================

#include <cstddef>
#include <future>
#include <iostream>
#include <map>
#include <mutex>
#include <string>

#include "dlab/Config.h"
#include "dlab/Server.h"
#include "dlab/StdioLoop.hpp"
#include "dlab/protocol/MessageFactory.h"
#include "dlab/typed/Content.h"
#include "dlab/version.h"
#include "logging/Logger.h"

using namespace dlab;
using validation::Shape;

namespace {

// Project records keyed by id. Handlers run on pool threads.
class ProjectStore {
public:
    JSONValue Create(const std::string& name, const JSONValue* platform, const JSONValue* linkedTicket) {
        std::lock_guard<std::mutex> lock(mutex);
        std::string id = protocol::NewCorrelationId();
        JSONValue::Object record;
        record["id"] = std::make_shared<JSONValue>(id);
        record["name"] = std::make_shared<JSONValue>(name);
        record["status"] = std::make_shared<JSONValue>("draft");
        record["createdAt"] = std::make_shared<JSONValue>(protocol::NowMillis());
        if (platform) record["platform"] = std::make_shared<JSONValue>(*platform);
        if (linkedTicket) record["linkedTicket"] = std::make_shared<JSONValue>(*linkedTicket);
        JSONValue value{record};
        projects[id] = value;
        return value;
    }

    std::optional<JSONValue> Get(const std::string& id) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = projects.find(id);
        if (it == projects.end()) return std::nullopt;
        return it->second;
    }

    JSONValue::Array List() const {
        std::lock_guard<std::mutex> lock(mutex);
        JSONValue::Array out;
        for (const auto& [id, record] : projects) {
            (void)id;
            out.push_back(std::make_shared<JSONValue>(record));
        }
        return out;
    }

    bool Delete(const std::string& id) {
        std::lock_guard<std::mutex> lock(mutex);
        return projects.erase(id) > 0;
    }

private:
    mutable std::mutex mutex;
    std::map<std::string, JSONValue> projects;
};

std::string argString(const JSONValue& args, const std::string& key) {
    const JSONValue* v = FindMember(args, key);
    return (v && v->isString()) ? std::get<std::string>(v->value) : std::string();
}

std::future<ToolResult> ready(ToolResult r) {
    std::promise<ToolResult> p;
    p.set_value(std::move(r));
    return p.get_future();
}

void registerProjectTools(ToolRegistry& registry, ProjectStore& store) {
    auto platform = Shape::Enum({"ios", "android", "web"}, "Target platform");

    registry.Register(
        Tool{"dlab.project.list", "List all saved projects.",
             Shape::Object({validation::Optional("platform", platform)})},
        [&store](const JSONValue& args) {
            const std::string filter = argString(args, "platform");
            JSONValue::Array matches;
            for (const auto& p : store.List()) {
                if (!filter.empty() && argString(*p, "platform") != filter) continue;
                matches.push_back(p);
            }
            if (matches.empty()) {
                return ready(typed::makeTextResult("No projects found. Create one with dlab.project.create"));
            }
            auto count = static_cast<int64_t>(matches.size());
            return ready(typed::makeJsonResult(MakeObject({
                {"count", JSONValue(count)},
                {"projects", JSONValue(std::move(matches))}})));
        });

    registry.Register(
        Tool{"dlab.project.create", "Create a new project for capturing app evidence.",
             Shape::Object({
                 validation::Required("name", Shape::String("Project name")),
                 validation::Optional("platform", platform),
                 validation::Optional("linkedTicket", Shape::String("Ticket ID (e.g. \"ABC-123\")"))})},
        [&store](const JSONValue& args) {
            JSONValue project = store.Create(argString(args, "name"), FindMember(args, "platform"),
                                             FindMember(args, "linkedTicket"));
            LOG_INFO("Project created: {}", argString(project, "id"));
            return ready(typed::makeJsonResult(MakeObject({
                {"message", JSONValue("Project created successfully")},
                {"project", project}})));
        });

    registry.Register(
        Tool{"dlab.project.get", "Get detailed information about a specific project.",
             Shape::Object({validation::Required("id", Shape::String("Project ID"))})},
        [&store](const JSONValue& args) {
            const std::string id = argString(args, "id");
            auto project = store.Get(id);
            if (!project.has_value()) {
                return ready(typed::makeErrorResult("Project not found: " + id));
            }
            return ready(typed::makeJsonResult(project.value()));
        });

    registry.Register(
        Tool{"dlab.project.delete", "Delete a project and all its associated data.",
             Shape::Object({validation::Required("id", Shape::String("Project ID"))})},
        [&store](const JSONValue& args) {
            const std::string id = argString(args, "id");
            if (!store.Delete(id)) {
                return ready(typed::makeErrorResult("Project not found: " + id));
            }
            return ready(typed::makeTextResult("Project " + id + " deleted successfully"));
        });
}

} // namespace

int main(int argc, char** argv) {
    FUNC_SCOPE();
    // stdout carries protocol lines only.
    Logger::setUseStderr(true);

    ServerConfig config = LoadServerConfigFromEnv();
    ApplyArgOverrides(config, argc, argv);
    ApplyLoggingConfig(config);

    ProjectStore store;
    ToolRegistry registry;
    registerProjectTools(registry, store);

    Server server(ServerInfo::Default(), std::move(registry), config.validation);

    StdioLoop::Options opts;
    opts.workers = static_cast<unsigned>(config.workers);
    opts.maxLineBytes = config.maxLineBytes;
    LOG_INFO("{} {} starting on stdio (validation={})", kServerName, getVersionString(),
             validation::toString(config.validation));

    StdioLoop loop(server, std::cin, std::cout, opts);
    loop.Run();

    LOG_INFO("Server stopping: end of input");
    return 0;
}
