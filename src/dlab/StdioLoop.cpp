//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: StdioLoop.cpp
// Purpose: Stdio host; reader on the calling thread, handlers on a Boost.Asio thread pool
//==========================================================================================================

#include "dlab/StdioLoop.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "dlab/LineFramer.h"
#include "logging/Logger.h"

namespace dlab {
namespace net = boost::asio;

class StdioLoop::Impl {
public:
    Impl(IMessageHandler& h, std::istream& i, std::ostream& o, const StdioLoop::Options& opts)
        : handler(h), in(i), out(o), options(opts),
          framer(MakeLineFramer(opts.maxLineBytes)),
          pool(std::max(1u, opts.workers)) {}

    IMessageHandler& handler;
    std::istream& in;
    std::ostream& out;
    StdioLoop::Options options;
    std::unique_ptr<IMessageFramer> framer;
    net::thread_pool pool;

    std::mutex writeMutex;
    std::atomic<std::size_t> dispatched{0};

    void write(const std::string& line) {
        std::lock_guard<std::mutex> lock(writeMutex);
        out << line << '\n';
        out.flush();
    }

    void dispatchLine(std::string line) {
        ++dispatched;
        net::post(pool, [this, line = std::move(line)]() {
            try {
                auto reply = handler.HandleLine(line);
                if (reply.has_value()) {
                    write(reply.value());
                }
            } catch (const std::exception& e) {
                LOG_ERROR("StdioLoop: handler threw: {}", e.what());
            } catch (...) {
                LOG_ERROR("StdioLoop: handler threw a non-standard exception");
            }
        });
    }

    void dispatchFramingError(std::string reason) {
        net::post(pool, [this, reason = std::move(reason)]() {
            try {
                auto reply = handler.HandleFramingError(reason);
                if (reply.has_value()) {
                    write(reply.value());
                }
            } catch (const std::exception& e) {
                LOG_ERROR("StdioLoop: framing error handler threw: {}", e.what());
            } catch (...) {
                LOG_ERROR("StdioLoop: framing error handler threw a non-standard exception");
            }
        });
    }

    void drain(std::string& buffer) {
        for (;;) {
            auto r = framer->tryDecodeEx(buffer);
            if (r.bytesConsumed > 0) {
                buffer.erase(0, std::min(r.bytesConsumed, buffer.size()));
            }
            if (r.status == IMessageFramer::DecodeStatus::Ok) {
                dispatchLine(std::move(r.payload.value()));
            } else if (r.status == IMessageFramer::DecodeStatus::LineTooLong) {
                dispatchFramingError("line exceeds " + std::to_string(options.maxLineBytes) + " bytes");
            } else {
                break;
            }
        }
    }
};

StdioLoop::StdioLoop(IMessageHandler& handler, std::istream& in, std::ostream& out, const Options& opts)
    : pImpl(std::make_unique<Impl>(handler, in, out, opts)) {}

StdioLoop::~StdioLoop() {
    pImpl->pool.join();
}

void StdioLoop::Run() {
    FUNC_SCOPE();
    LOG_INFO("StdioLoop: serving with {} worker(s), max line {} bytes",
             std::max(1u, pImpl->options.workers), pImpl->options.maxLineBytes);

    std::string buffer;
    std::streambuf* sb = pImpl->in.rdbuf();
    using traits = std::char_traits<char>;
    for (;;) {
        traits::int_type ch = sb->sbumpc();
        if (traits::eq_int_type(ch, traits::eof())) {
            break;
        }
        buffer.push_back(traits::to_char_type(ch));
        if (ch == '\n' || buffer.size() > pImpl->options.maxLineBytes) {
            pImpl->drain(buffer);
        }
    }
    if (!buffer.empty()) {
        // Unterminated final line.
        buffer.push_back('\n');
        pImpl->drain(buffer);
    }

    pImpl->pool.join();
    LOG_INFO("StdioLoop: end of input after {} message(s)", pImpl->dispatched.load());
}

void StdioLoop::Send(const std::string& line) {
    pImpl->write(line);
}

} // namespace dlab
