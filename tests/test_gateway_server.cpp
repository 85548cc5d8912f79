//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_gateway_server.cpp
// Purpose: Loopback TCP tests for gateway sessions (greeting, request/response, broadcast events)
//==========================================================================================================

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <istream>
#include <string>
#include <thread>

#include <boost/asio.hpp>

#include "dlab/Gateway.h"
#include "dlab/GatewayServer.hpp"
#include "dlab/version.h"

using namespace dlab;
using namespace dlab::protocol;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

class Client {
public:
    explicit Client(std::uint16_t port) : socket(ioc) {
        socket.connect(tcp::endpoint(net::ip::make_address("127.0.0.1"), port));
    }

    void send(const std::string& line) {
        net::write(socket, net::buffer(line + "\n"));
    }

    JSONValue receive() {
        net::read_until(socket, buffer, '\n');
        std::istream is(&buffer);
        std::string line;
        std::getline(is, line);
        return ParseJSON(line);
    }

    void close() {
        boost::system::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        socket.close(ec);
    }

private:
    net::io_context ioc;
    tcp::socket socket;
    net::streambuf buffer;
};

std::string str(const JSONValue& v, const char* key) {
    return std::get<std::string>(FindMember(v, key)->value);
}

GatewayServer::Options loopback(std::size_t maxLineBytes = 1024 * 1024) {
    GatewayServer::Options opts;
    opts.address = "127.0.0.1";
    opts.port = 0;
    opts.maxLineBytes = maxLineBytes;
    return opts;
}

} // namespace

TEST(GatewayServerTest, GreetsAndAnswersRequests) {
    EventSequencer seq;
    Gateway gateway(seq);
    gateway.Seal();
    GatewayServer server(gateway, loopback());
    server.Start().get();
    ASSERT_NE(server.Port(), 0);

    Client client(server.Port());
    JSONValue hello = client.receive();
    EXPECT_EQ(str(hello, "type"), "event");
    EXPECT_EQ(str(hello, "event"), "connected");
    EXPECT_EQ(str(*FindMember(hello, "payload"), "serverVersion"), getVersionString());
    EXPECT_EQ(FindMember(hello, "seq"), nullptr);

    client.send(R"({"type":"req","id":"r1","method":"ping","params":{}})");
    JSONValue resp = client.receive();
    EXPECT_TRUE(JSONEquals(resp, ParseJSON(R"({"type":"res","id":"r1","ok":true,"payload":{"pong":true}})")));

    client.send("not json");
    JSONValue err = client.receive();
    EXPECT_EQ(str(err, "event"), "error");
    EXPECT_EQ(str(*FindMember(err, "payload"), "code"), "PARSE_ERROR");

    client.close();
    server.Stop().get();
}

TEST(GatewayServerTest, BroadcastsEventsToEverySession) {
    EventSequencer seq;
    Gateway gateway(seq);
    gateway.Seal();
    GatewayServer server(gateway, loopback());
    server.Start().get();

    Client a(server.Port());
    Client b(server.Port());
    a.receive();
    b.receive();
    EXPECT_EQ(server.SessionCount(), 2u);

    gateway.Emit<EventType::Status>(StatusPayload{"recording"});
    gateway.Emit<EventType::Status>(StatusPayload{"stopped"});

    for (Client* c : {&a, &b}) {
        JSONValue first = c->receive();
        JSONValue second = c->receive();
        EXPECT_EQ(str(first, "event"), "status");
        EXPECT_EQ(std::get<int64_t>(FindMember(first, "seq")->value), 1);
        EXPECT_EQ(std::get<int64_t>(FindMember(second, "seq")->value), 2);
        EXPECT_EQ(str(*FindMember(second, "payload"), "status"), "stopped");
    }

    a.close();
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (server.SessionCount() != 1u && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    EXPECT_EQ(server.SessionCount(), 1u);

    b.close();
    server.Stop().get();
}

TEST(GatewayServerTest, OverLongLinesAreRejected) {
    EventSequencer seq;
    Gateway gateway(seq);
    gateway.Seal();
    GatewayServer server(gateway, loopback(64));
    server.Start().get();

    Client client(server.Port());
    client.receive();
    client.send(std::string(200, 'x'));
    JSONValue err = client.receive();
    EXPECT_EQ(str(err, "event"), "error");
    EXPECT_EQ(str(*FindMember(err, "payload"), "code"), "MESSAGE_TOO_LARGE");

    client.send(R"({"type":"req","id":"after","method":"ping"})");
    JSONValue resp = client.receive();
    EXPECT_EQ(str(resp, "id"), "after");

    client.close();
    server.Stop().get();
}

TEST(GatewayServerTest, SlowHandlerDoesNotBlockOtherSessions) {
    EventSequencer seq;
    Gateway gateway(seq);
    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::promise<void> entered;
    gateway.RegisterMethod(Method::ProjectList, [&](const JSONValue&) -> JSONValue {
        entered.set_value();
        released.wait_for(std::chrono::seconds(10));
        gateway.Emit<EventType::Status>(StatusPayload{"listed"});
        return JSONValue(JSONValue::Array{});
    });
    gateway.Seal();
    GatewayServer server(gateway, loopback());
    server.Start().get();

    Client slow(server.Port());
    Client fast(server.Port());
    slow.receive();
    fast.receive();

    slow.send(R"({"type":"req","id":"slow","method":"project.list","params":{}})");
    ASSERT_EQ(entered.get_future().wait_for(std::chrono::seconds(5)), std::future_status::ready);

    // The slow handler is still parked; the other session must be served meanwhile.
    fast.send(R"({"type":"req","id":"fast","method":"ping","params":{}})");
    JSONValue pong = fast.receive();
    EXPECT_EQ(str(pong, "id"), "fast");
    EXPECT_TRUE(std::get<bool>(FindMember(pong, "ok")->value));

    release.set_value();
    JSONValue event = slow.receive();
    EXPECT_EQ(str(event, "event"), "status");
    JSONValue listed = slow.receive();
    EXPECT_EQ(str(listed, "id"), "slow");
    EXPECT_TRUE(std::get<bool>(FindMember(listed, "ok")->value));
    EXPECT_EQ(str(fast.receive(), "event"), "status");

    slow.close();
    fast.close();
    server.Stop().get();
}

TEST(GatewayServerTest, NonStandardThrowKeepsSessionAlive) {
    EventSequencer seq;
    Gateway gateway(seq);
    gateway.RegisterMethod(Method::ProjectList, [](const JSONValue&) -> JSONValue {
        throw 42;
    });
    gateway.Seal();
    GatewayServer server(gateway, loopback());
    server.Start().get();

    Client client(server.Port());
    client.receive();
    client.send(R"({"type":"req","id":"bad","method":"project.list","params":{}})");
    JSONValue failed = client.receive();
    EXPECT_EQ(str(failed, "id"), "bad");
    EXPECT_FALSE(std::get<bool>(FindMember(failed, "ok")->value));
    EXPECT_EQ(str(failed, "error"), "Internal error");

    client.send(R"({"type":"req","id":"next","method":"ping"})");
    EXPECT_EQ(str(client.receive(), "id"), "next");

    client.close();
    server.Stop().get();
}

TEST(GatewayServerTest, StopIsIdempotent) {
    EventSequencer seq;
    Gateway gateway(seq);
    GatewayServer server(gateway, loopback());
    server.Start().get();
    server.Stop().get();
    server.Stop().get();
    SUCCEED();
}
