//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineFramer.h
// Purpose: Interface for newline-delimited message framing
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>

namespace dlab {

class IMessageFramer {
public:
    virtual ~IMessageFramer() = default;
    enum class DecodeStatus {
        Ok,
        Incomplete,
        LineTooLong
    };
    struct DecodeResult {
        DecodeStatus status;
        std::optional<std::string> payload; // present when status==Ok
        std::size_t bytesConsumed{0};       // bytes to drop from the front of the buffer
    };
    virtual std::string encode(const std::string& payload) = 0;
    virtual std::optional<std::string> tryDecode(std::string& buffer) = 0;
    virtual DecodeResult tryDecodeEx(const std::string& buffer) = 0;
};

//==========================================================================================================
// MakeLineFramer
// Purpose: Newline framer. A trailing '\r' is stripped, whitespace-only lines are skipped, and a line longer
//          than maxLineBytes is reported once as LineTooLong and then discarded up to its terminator.
//==========================================================================================================
std::unique_ptr<IMessageFramer> MakeLineFramer(std::size_t maxLineBytes = 1024 * 1024);

} // namespace dlab
