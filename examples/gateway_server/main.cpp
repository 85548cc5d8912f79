//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: TCP gateway for the typed req/res/event protocol with in-memory handlers
//==========================================================================================================

#include <csignal>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include "dlab/Config.h"
#include "dlab/Gateway.h"
#include "dlab/GatewayServer.hpp"
#include "dlab/protocol/MessageFactory.h"
#include "dlab/version.h"
#include "logging/Logger.h"

using namespace dlab;
using namespace dlab::protocol;

namespace {

// Recorder and live-stream state. Capture itself is outside this process; the handlers track
// session bookkeeping and publish the matching events.
class DemoState {
public:
    explicit DemoState(Gateway& g) : gateway(g) {}

    RecorderStartResult StartRecording(const RecorderStartParams& p) {
        std::lock_guard<std::mutex> lock(mutex);
        if (session.has_value()) {
            throw std::runtime_error("Recording already in progress: " + session->id);
        }
        SessionPayload s;
        s.id = NewCorrelationId();
        s.name = p.name;
        s.url = p.url;
        s.status = "recording";
        s.screenshotsDir = "recordings/" + s.id + "/screenshots";
        session = s;

        gateway.Emit<EventType::Session>(s);
        gateway.Emit<EventType::Status>(StatusPayload{"recording"});

        RecorderStartResult r;
        r.id = s.id;
        r.name = s.name;
        r.url = s.url;
        r.status = s.status;
        r.screenshotsDir = s.screenshotsDir;
        return r;
    }

    RecorderStopResult StopRecording() {
        std::lock_guard<std::mutex> lock(mutex);
        if (!session.has_value()) {
            throw std::runtime_error("No recording in progress");
        }
        RecorderStopResult r;
        r.id = session->id;
        r.name = session->name;
        r.actions = session->actions;
        session.reset();
        gateway.Emit<EventType::Stopped>(r);
        return r;
    }

    RecorderStatusResult Status() const {
        std::lock_guard<std::mutex> lock(mutex);
        return session;
    }

    LiveStreamStartResult StartStream(const LiveStreamStartParams& p) {
        std::lock_guard<std::mutex> lock(mutex);
        LiveStreamStartResult r;
        r.platform = p.platform;
        r.deviceId = p.deviceId;
        r.interactive = p.interactive.value_or(false);
        stream = r;
        gateway.Emit<EventType::Status>(StatusPayload{"streaming"});
        return r;
    }

    LiveStreamStopResult StopStream() {
        std::lock_guard<std::mutex> lock(mutex);
        stream.reset();
        gateway.Emit<EventType::Status>(StatusPayload{"idle"});
        return {};
    }

    LiveStreamTapResult Tap(const LiveStreamTapParams& p) {
        std::lock_guard<std::mutex> lock(mutex);
        if (!stream.has_value() || !stream->interactive) {
            return LiveStreamTapResult{false};
        }
        LOG_DEBUG("Tap at ({}, {})", p.x, p.y);
        return LiveStreamTapResult{true};
    }

    JSONValue ListProjects() const {
        std::lock_guard<std::mutex> lock(mutex);
        JSONValue::Array out;
        for (const auto& [id, record] : projects) {
            (void)id;
            out.push_back(std::make_shared<JSONValue>(record));
        }
        return JSONValue{out};
    }

    JSONValue GetProject(const ProjectIdParams& p) const {
        std::lock_guard<std::mutex> lock(mutex);
        auto it = projects.find(p.id);
        if (it == projects.end()) {
            throw std::runtime_error("Project not found: " + p.id);
        }
        return it->second;
    }

    JSONValue CreateProject(const ProjectCreateParams& p) {
        std::lock_guard<std::mutex> lock(mutex);
        std::string id = NewCorrelationId();
        JSONValue::Object record;
        record["id"] = std::make_shared<JSONValue>(id);
        record["name"] = std::make_shared<JSONValue>(p.name);
        if (p.packageName.has_value()) {
            record["packageName"] = std::make_shared<JSONValue>(p.packageName.value());
        }
        record["createdAt"] = std::make_shared<JSONValue>(NowMillis());
        JSONValue value{record};
        projects[id] = value;
        return value;
    }

    ProjectDeleteResult DeleteProject(const ProjectIdParams& p) {
        std::lock_guard<std::mutex> lock(mutex);
        return ProjectDeleteResult{projects.erase(p.id) > 0};
    }

private:
    Gateway& gateway;
    mutable std::mutex mutex;
    std::optional<SessionPayload> session;
    std::optional<LiveStreamStartResult> stream;
    std::map<std::string, JSONValue> projects;
};

void registerHandlers(Gateway& gateway, DemoState& state) {
    gateway.RegisterTypedMethod<Method::RecorderStart>(
        [&state](const RecorderStartParams& p) { return state.StartRecording(p); });
    gateway.RegisterTypedMethod<Method::RecorderStop>(
        [&state](const EmptyParams&) { return state.StopRecording(); });
    gateway.RegisterTypedMethod<Method::RecorderStatus>(
        [&state](const EmptyParams&) { return state.Status(); });
    gateway.RegisterTypedMethod<Method::LiveStreamStart>(
        [&state](const LiveStreamStartParams& p) { return state.StartStream(p); });
    gateway.RegisterTypedMethod<Method::LiveStreamStop>(
        [&state](const EmptyParams&) { return state.StopStream(); });
    gateway.RegisterTypedMethod<Method::LiveStreamTap>(
        [&state](const LiveStreamTapParams& p) { return state.Tap(p); });
    gateway.RegisterTypedMethod<Method::ProjectList>(
        [&state](const EmptyParams&) { return state.ListProjects(); });
    gateway.RegisterTypedMethod<Method::ProjectGet>(
        [&state](const ProjectIdParams& p) { return state.GetProject(p); });
    gateway.RegisterTypedMethod<Method::ProjectCreate>(
        [&state](const ProjectCreateParams& p) { return state.CreateProject(p); });
    gateway.RegisterTypedMethod<Method::ProjectDelete>(
        [&state](const ProjectIdParams& p) { return state.DeleteProject(p); });
    gateway.Seal();
}

} // namespace

int main(int argc, char** argv) {
    FUNC_SCOPE();
    ServerConfig config = LoadServerConfigFromEnv();
    ApplyArgOverrides(config, argc, argv);
    ApplyLoggingConfig(config);

    EventSequencer sequencer;
    Gateway gateway(sequencer);
    DemoState state(gateway);
    registerHandlers(gateway, state);

    GatewayServer::Options opts;
    opts.address = config.gatewayAddress;
    opts.port = config.gatewayPort;
    opts.maxLineBytes = config.maxLineBytes;
    opts.workers = static_cast<unsigned>(config.workers);

    GatewayServer server(gateway, opts);
    try {
        server.Start().get();
    } catch (const std::exception& e) {
        LOG_ERROR("Gateway failed to start on {}:{}: {}", opts.address, opts.port, e.what());
        return 1;
    }
    LOG_INFO("{} {} gateway ready on {}:{}", kServerName, getVersionString(), opts.address, server.Port());

    boost::asio::io_context signals;
    boost::asio::signal_set stopSignals(signals, SIGINT, SIGTERM);
    stopSignals.async_wait([](const boost::system::error_code& ec, int signo) {
        if (!ec) {
            LOG_INFO("Received signal {}; shutting down", signo);
        }
    });
    signals.run();

    server.Stop().get();
    return 0;
}
