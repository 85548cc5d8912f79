//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayServer.hpp
// Purpose: Coroutine-based TCP host for the gateway (one line-delimited session per connection)
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <string>

#include "dlab/Gateway.h"

namespace dlab {

class GatewayServer {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   address: Bind address (default: 127.0.0.1)
    //   port: Listen port; 0 picks an ephemeral port (see Port())
    //   maxLineBytes: Longest accepted line per session
    //   workers: Handler threads shared by all sessions. Requests of one session are handled in order.
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        std::uint16_t port{3848};
        std::size_t maxLineBytes{1024 * 1024};
        unsigned workers{4};
    };

    // Installs itself as the gateway's event sink; events are broadcast to every open session.
    GatewayServer(Gateway& gateway, const Options& opts);
    ~GatewayServer();

    GatewayServer(const GatewayServer&) = delete;
    GatewayServer& operator=(const GatewayServer&) = delete;

    //==========================================================================================================
    // Binds the listener and starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the I/O thread is running.
    // Throws:
    //   boost::system::system_error when the address cannot be resolved or bound.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Closes the listener and every session, joins the I/O thread, then waits for in-flight handlers.
    //==========================================================================================================
    std::future<void> Stop();

    // Bound port; valid after Start().
    std::uint16_t Port() const;

    std::size_t SessionCount() const;

    // Queues one line for every open session.
    void Broadcast(const std::string& line);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace dlab
