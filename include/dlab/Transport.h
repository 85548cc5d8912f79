//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Transport loop contract between line-oriented hosts (stdio, TCP) and the dispatch cores
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

namespace dlab {

//==========================================================================================================
// IMessageHandler
// Purpose: Core side of the loop. The host delivers one framed line at a time.
//==========================================================================================================
class IMessageHandler {
public:
    virtual ~IMessageHandler() = default;

    //==========================================================================================================
    // Handles one inbound line.
    // Args:
    //   line: One message without its line terminator.
    // Returns:
    //   The serialized reply, or std::nullopt when the input does not call for one (notifications, events,
    //   responses from the peer).
    //==========================================================================================================
    virtual std::optional<std::string> HandleLine(const std::string& line) = 0;

    //==========================================================================================================
    // Called when the host had to drop input it could not frame (for example an over-long line).
    // Args:
    //   reason: Short description for diagnostics.
    // Returns:
    //   Optional reply line for the peer.
    //==========================================================================================================
    virtual std::optional<std::string> HandleFramingError(const std::string& reason) {
        (void)reason;
        return std::nullopt;
    }
};

//==========================================================================================================
// IMessageSink
// Purpose: Host side of the loop; accepts outbound lines (replies and server-initiated events).
//==========================================================================================================
class IMessageSink {
public:
    virtual ~IMessageSink() = default;

    // Writes one message followed by a line terminator. Safe to call from any thread.
    virtual void Send(const std::string& line) = 0;
};

} // namespace dlab
