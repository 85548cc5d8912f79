//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: GatewayServer.cpp
// Purpose: TCP gateway sessions using Boost.Asio coroutines
//==========================================================================================================

#include "dlab/GatewayServer.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <deque>
#include <optional>
#include <set>
#include <thread>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "dlab/LineFramer.h"
#include "dlab/protocol/MessageFactory.h"
#include "dlab/version.h"
#include "logging/Logger.h"

namespace dlab {
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

// Socket and outbox are touched from the I/O thread only. Handler calls for one session run in order
// on its strand.
struct Session : std::enable_shared_from_this<Session> {
    Session(tcp::socket s, net::thread_pool::executor_type workers)
        : socket(std::move(s)), handlers(net::make_strand(workers)) {}

    tcp::socket socket;
    net::strand<net::thread_pool::executor_type> handlers;
    std::deque<std::string> outbox;
    bool writing{false};
    std::string peer;

    void deliver(std::string line) {
        if (!socket.is_open()) return;
        line.push_back('\n');
        outbox.push_back(std::move(line));
        if (!writing) {
            writing = true;
            net::co_spawn(socket.get_executor(), writeLoop(shared_from_this()), net::detached);
        }
    }

    static net::awaitable<void> writeLoop(std::shared_ptr<Session> self) {
        try {
            while (!self->outbox.empty()) {
                co_await net::async_write(self->socket, net::buffer(self->outbox.front()), net::use_awaitable);
                self->outbox.pop_front();
            }
        } catch (const boost::system::system_error& e) {
            LOG_DEBUG("GatewayServer: write to {} failed: {}", self->peer, e.what());
            self->outbox.clear();
        }
        self->writing = false;
        co_return;
    }

    void close() {
        boost::system::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }
};

} // namespace

class GatewayServer::Impl {
public:
    Impl(Gateway& g, const GatewayServer::Options& o)
        : gateway(g), opts(o), pool(std::max(1u, o.workers)) {}

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
        pool.join();
    }

    Gateway& gateway;
    GatewayServer::Options opts;
    std::atomic<bool> running{false};
    std::atomic<std::uint16_t> boundPort{0};
    std::atomic<std::size_t> sessionCount{0};

    // Declared before ioc: handlers still queued on ioc hold sessions whose strands live on the pool.
    net::thread_pool pool;
    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::thread ioThread;
    std::set<std::shared_ptr<Session>> sessions;

    void bind() {
        tcp::resolver resolver(ioc);
        auto results = resolver.resolve(opts.address, std::to_string(opts.port));
        tcp::endpoint ep = *results.begin();

        acceptor = std::make_unique<tcp::acceptor>(ioc);
        acceptor->open(ep.protocol());
        acceptor->set_option(tcp::acceptor::reuse_address(true));
        acceptor->bind(ep);
        acceptor->listen();
        boundPort.store(acceptor->local_endpoint().port());
    }

    void greet(Session& s) {
        protocol::ConnectedPayload p;
        p.timestamp = protocol::NowMillis();
        p.serverVersion = getVersionString();
        s.deliver(protocol::Serialize(protocol::CreateEvent<protocol::EventType::Connected>(p)));
    }

    // Runs on the session strand; the reply travels back to the I/O thread.
    void dispatch(const std::shared_ptr<Session>& s, std::string line, bool tooLong) {
        net::post(s->handlers, [this, s, line = std::move(line), tooLong]() {
            std::optional<std::string> reply;
            try {
                reply = tooLong ? gateway.HandleFramingError(line) : gateway.HandleLine(line);
            } catch (const std::exception& e) {
                LOG_ERROR("GatewayServer: handler for {} threw: {}", s->peer, e.what());
            } catch (...) {
                LOG_ERROR("GatewayServer: handler for {} threw a non-standard exception", s->peer);
            }
            if (reply.has_value()) {
                net::post(ioc, [s, r = std::move(reply.value())]() mutable { s->deliver(std::move(r)); });
            }
        });
    }

    void drain(IMessageFramer& framer, std::string& buffer, const std::shared_ptr<Session>& s) {
        for (;;) {
            auto r = framer.tryDecodeEx(buffer);
            if (r.bytesConsumed > 0) {
                buffer.erase(0, std::min(r.bytesConsumed, buffer.size()));
            }
            if (r.status == IMessageFramer::DecodeStatus::Ok) {
                dispatch(s, std::move(r.payload.value()), false);
            } else if (r.status == IMessageFramer::DecodeStatus::LineTooLong) {
                dispatch(s, "line exceeds " + std::to_string(opts.maxLineBytes) + " bytes", true);
            } else {
                break;
            }
        }
    }

    net::awaitable<void> session(std::shared_ptr<Session> s) {
        auto framer = MakeLineFramer(opts.maxLineBytes);
        std::string buffer;
        std::array<char, 4096> chunk{};
        greet(*s);
        try {
            for (;;) {
                std::size_t n = co_await s->socket.async_read_some(net::buffer(chunk), net::use_awaitable);
                buffer.append(chunk.data(), n);
                drain(*framer, buffer, s);
            }
        } catch (const boost::system::system_error& e) {
            if (e.code() == net::error::eof) {
                if (!buffer.empty()) {
                    buffer.push_back('\n');
                    drain(*framer, buffer, s);
                }
                LOG_INFO("GatewayServer: {} disconnected", s->peer);
            } else if (running.load()) {
                LOG_WARN("GatewayServer: session {} error: {}", s->peer, e.what());
            }
        } catch (const std::exception& e) {
            LOG_ERROR("GatewayServer: session {} failed: {}", s->peer, e.what());
        } catch (...) {
            LOG_ERROR("GatewayServer: session {} failed with a non-standard exception", s->peer);
        }
        if (sessions.erase(s) > 0) {
            --sessionCount;
        }
        co_return;
    }

    net::awaitable<void> acceptLoop() {
        try {
            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                auto s = std::make_shared<Session>(std::move(socket), pool.get_executor());
                boost::system::error_code ec;
                auto remote = s->socket.remote_endpoint(ec);
                s->peer = ec ? std::string("unknown") : remote.address().to_string() + ":" + std::to_string(remote.port());
                sessions.insert(s);
                ++sessionCount;
                LOG_INFO("GatewayServer: {} connected ({} open)", s->peer, sessionCount.load());
                net::co_spawn(ioc, session(s), net::detached);
            }
        } catch (const boost::system::system_error& e) {
            if (running.load()) {
                LOG_ERROR("GatewayServer accept error: {}", e.what());
            } else {
                LOG_DEBUG("GatewayServer accept ended during shutdown: {}", e.what());
            }
        }
        co_return;
    }

    void closeAll() {
        if (acceptor) {
            boost::system::error_code ec;
            acceptor->close(ec);
        }
        for (const auto& s : sessions) {
            s->close();
        }
        sessions.clear();
        sessionCount.store(0);
    }
};

GatewayServer::GatewayServer(Gateway& gateway, const Options& opts)
    : pImpl(std::make_unique<Impl>(gateway, opts)) {
    pImpl->gateway.SetEventSink([this](const std::string& line) { Broadcast(line); });
}

GatewayServer::~GatewayServer() {
    pImpl->gateway.SetEventSink(nullptr);
    Stop();
}

std::future<void> GatewayServer::Start() {
    FUNC_SCOPE();
    pImpl->bind();
    LOG_INFO("GatewayServer listening on {}:{}", pImpl->opts.address, pImpl->boundPort.load());

    std::promise<void> ready;
    auto fut = ready.get_future();
    pImpl->running.store(true);
    pImpl->ioThread = std::thread([this, pr = std::move(ready)]() mutable {
        bool signalled = false;
        try {
            net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
            pr.set_value();
            signalled = true;
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            LOG_ERROR("GatewayServer I/O thread failed: {}", e.what());
            if (!signalled) { pr.set_value(); }
        } catch (...) {
            LOG_ERROR("GatewayServer I/O thread failed with a non-standard exception");
            if (!signalled) { pr.set_value(); }
        }
    });
    return fut;
}

std::future<void> GatewayServer::Stop() {
    std::promise<void> done;
    auto fut = done.get_future();
    if (pImpl->running.exchange(false)) {
        net::post(pImpl->ioc, [impl = pImpl.get()]() {
            impl->closeAll();
            impl->ioc.stop();
        });
        if (pImpl->ioThread.joinable()) {
            pImpl->ioThread.join();
        }
        pImpl->pool.join();
        LOG_INFO("GatewayServer stopped");
    }
    done.set_value();
    return fut;
}

std::uint16_t GatewayServer::Port() const {
    return pImpl->boundPort.load();
}

std::size_t GatewayServer::SessionCount() const {
    return pImpl->sessionCount.load();
}

void GatewayServer::Broadcast(const std::string& line) {
    net::post(pImpl->ioc, [impl = pImpl.get(), line]() {
        for (const auto& s : impl->sessions) {
            s->deliver(line);
        }
    });
}

} // namespace dlab
