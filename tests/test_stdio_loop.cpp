//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_stdio_loop.cpp
// Purpose: Tests for the line-delimited stdio host using string streams
//==========================================================================================================

#include <gtest/gtest.h>

#include <algorithm>
#include <future>
#include <sstream>
#include <string>
#include <vector>

#include "dlab/Server.h"
#include "dlab/StdioLoop.hpp"
#include "dlab/typed/Content.h"

using namespace dlab;

namespace {

class EchoHandler : public IMessageHandler {
public:
    std::optional<std::string> HandleLine(const std::string& line) override {
        if (line == "quiet") return std::nullopt;
        return "echo:" + line;
    }
    std::optional<std::string> HandleFramingError(const std::string& reason) override {
        return "too-long:" + reason;
    }
};

// Throws a non-standard exception for "bad" and echoes everything else.
class ThrowingHandler : public IMessageHandler {
public:
    std::optional<std::string> HandleLine(const std::string& line) override {
        if (line == "bad") throw 42;
        return "echo:" + line;
    }
    std::optional<std::string> HandleFramingError(const std::string&) override {
        throw "framing";
    }
};

std::vector<std::string> splitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

std::vector<std::string> runLoop(IMessageHandler& handler, const std::string& input, unsigned workers,
                                 std::size_t maxLineBytes = 1024) {
    std::istringstream in(input);
    std::ostringstream out;
    StdioLoop::Options opts;
    opts.workers = workers;
    opts.maxLineBytes = maxLineBytes;
    StdioLoop loop(handler, in, out, opts);
    loop.Run();
    return splitLines(out.str());
}

} // namespace

TEST(StdioLoopTest, SingleWorkerPreservesOrder) {
    EchoHandler h;
    auto lines = runLoop(h, "a\r\nb\n\n   \nquiet\nc", 1);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "echo:a");
    EXPECT_EQ(lines[1], "echo:b");
    EXPECT_EQ(lines[2], "echo:c");
}

TEST(StdioLoopTest, PoolAnswersEveryLine) {
    EchoHandler h;
    std::string input;
    std::vector<std::string> expected;
    for (int k = 0; k < 100; ++k) {
        input += "m" + std::to_string(k) + "\n";
        expected.push_back("echo:m" + std::to_string(k));
    }
    auto lines = runLoop(h, input, 4);
    std::sort(lines.begin(), lines.end());
    std::sort(expected.begin(), expected.end());
    EXPECT_EQ(lines, expected);
}

TEST(StdioLoopTest, OverLongLinesAreReportedAndSkipped) {
    EchoHandler h;
    auto lines = runLoop(h, "ok\n" + std::string(40, 'x') + "\nafter\n", 1, 16);
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "echo:ok");
    EXPECT_EQ(lines[1].rfind("too-long:", 0), 0u);
    EXPECT_EQ(lines[2], "echo:after");
}

TEST(StdioLoopTest, EmptyInputReturnsImmediately) {
    EchoHandler h;
    EXPECT_TRUE(runLoop(h, "", 2).empty());
}

TEST(StdioLoopTest, SendWritesWholeLines) {
    EchoHandler h;
    std::istringstream in("");
    std::ostringstream out;
    StdioLoop loop(h, in, out, StdioLoop::Options{});
    loop.Send(R"({"type":"event","event":"status","payload":{"status":"idle"}})");
    loop.Run();
    EXPECT_EQ(out.str(), "{\"type\":\"event\",\"event\":\"status\",\"payload\":{\"status\":\"idle\"}}\n");
}

TEST(StdioLoopTest, ServesJSONRPCEndToEnd) {
    ToolRegistry reg;
    reg.Register(Tool{"explode", "fails"}, [](const JSONValue&) -> std::future<ToolResult> {
        throw std::runtime_error("boom");
    });
    Server server(ServerInfo::Default(), std::move(reg));

    const std::string input =
        R"({"jsonrpc":"2.0","id":1,"method":"ping"})" "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"missing"}})" "\n"
        R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"explode"}})" "\n"
        "garbage\n";
    auto lines = runLoop(server, input, 1);
    ASSERT_EQ(lines.size(), 4u);

    JSONValue pong = ParseJSON(lines[0]);
    EXPECT_TRUE(std::get<bool>(FindMember(*FindMember(pong, "result"), "pong")->value));

    JSONValue notFound = ParseJSON(lines[1]);
    EXPECT_EQ(std::get<int64_t>(FindMember(*FindMember(notFound, "error"), "code")->value), -32602);

    JSONValue failed = ParseJSON(lines[2]);
    EXPECT_TRUE(std::get<bool>(FindMember(*FindMember(failed, "result"), "isError")->value));

    JSONValue parseErr = ParseJSON(lines[3]);
    EXPECT_EQ(std::get<int64_t>(FindMember(*FindMember(parseErr, "error"), "code")->value), -32700);
}

TEST(StdioLoopTest, NonStandardThrowDoesNotStopTheLoop) {
    ThrowingHandler h;
    auto lines = runLoop(h, "first\nbad\n" + std::string(40, 'x') + "\nlast\n", 1, 16);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "echo:first");
    EXPECT_EQ(lines[1], "echo:last");
}

TEST(StdioLoopTest, ToolThrowingIntIsAnsweredAndLoopContinues) {
    ToolRegistry reg;
    reg.Register(Tool{"boom", "throws an int"}, [](const JSONValue&) -> std::future<ToolResult> {
        throw 42;
    });
    Server server(ServerInfo::Default(), std::move(reg));

    const std::string input =
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"boom"}})" "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"ping"})" "\n";
    auto lines = runLoop(server, input, 1);
    ASSERT_EQ(lines.size(), 2u);

    JSONValue failed = ParseJSON(lines[0]);
    EXPECT_TRUE(std::get<bool>(FindMember(*FindMember(failed, "result"), "isError")->value));

    JSONValue pong = ParseJSON(lines[1]);
    EXPECT_EQ(std::get<int64_t>(FindMember(pong, "id")->value), 2);
}
