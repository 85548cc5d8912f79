//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioLoop.hpp
// Purpose: Line-delimited stdin/stdout host with a worker pool for the message handlers
//==========================================================================================================

#pragma once

#include <cstddef>
#include <istream>
#include <memory>
#include <ostream>
#include <string>

#include "dlab/Transport.h"

namespace dlab {

class StdioLoop : public IMessageSink {
public:
    //==========================================================================================================
    // Options
    // Fields:
    //   workers: Handler threads. With 1, replies leave in arrival order.
    //   maxLineBytes: Longest accepted line; longer input is dropped and reported to the handler.
    //==========================================================================================================
    struct Options {
        unsigned workers{4};
        std::size_t maxLineBytes{1024 * 1024};
    };

    StdioLoop(IMessageHandler& handler, std::istream& in, std::ostream& out, const Options& opts);
    ~StdioLoop() override;

    StdioLoop(const StdioLoop&) = delete;
    StdioLoop& operator=(const StdioLoop&) = delete;

    //==========================================================================================================
    // Reads until end of stream, dispatching each line to the worker pool.
    // Returns once every dispatched line has been handled and its reply written. Call at most once.
    //==========================================================================================================
    void Run();

    // Writes one line to the output stream; serialized with replies.
    void Send(const std::string& line) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace dlab
