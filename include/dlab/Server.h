//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: JSON-RPC 2.0 tool-dispatch server: initialize, tools/list, tools/call and ping
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>

#include "dlab/JSONRPCTypes.h"
#include "dlab/ToolRegistry.h"
#include "dlab/Transport.h"
#include "dlab/validation/Validation.h"

namespace dlab {

// Method names of the dispatch surface.
namespace Methods {
    inline constexpr const char* Initialize = "initialize";
    inline constexpr const char* ListTools = "tools/list";
    inline constexpr const char* CallTool = "tools/call";
    inline constexpr const char* Ping = "ping";
}

//==========================================================================================================
// ServerInfo
// Purpose: Identity reported by initialize.
//==========================================================================================================
struct ServerInfo {
    std::string name;
    std::string version;

    // discoverylab / library version
    static ServerInfo Default();
};

//==========================================================================================================
// Server
// Purpose: Stateless-per-request dispatcher over a sealed ToolRegistry. HandleJSONRPC and HandleLine may
//          be called concurrently; each request produces exactly one response carrying its id.
//==========================================================================================================
class Server : public IMessageHandler {
public:
    //==========================================================================================================
    // Constructs a server.
    // Args:
    //   info: Name and version for initialize.
    //   registry: Tool table; the server takes ownership and seals it.
    //   mode: Strict additionally checks tool results before replying.
    //==========================================================================================================
    Server(ServerInfo info, ToolRegistry registry,
           validation::ValidationMode mode = validation::ValidationMode::Off);
    ~Server() override;

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    //==========================================================================================================
    // Dispatches a decoded request.
    // Returns:
    //   Response with result or error; never null. Internal faults become -32603.
    //==========================================================================================================
    std::unique_ptr<JSONRPCResponse> HandleJSONRPC(const JSONRPCRequest& request);

    //==========================================================================================================
    // Decodes one line and dispatches it.
    // Returns:
    //   Serialized response. Malformed JSON yields -32700 and a non-request value -32600, both with a null
    //   id. Notifications (no id) yield std::nullopt.
    //==========================================================================================================
    std::optional<std::string> HandleLine(const std::string& line) override;

    // Over-long input lines are answered with -32700 and a null id.
    std::optional<std::string> HandleFramingError(const std::string& reason) override;

    const ToolRegistry& Registry() const;
    validation::ValidationMode GetValidationMode() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace dlab
