//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LineFramer.cpp
// Purpose: Default newline framer for the stdio loop and gateway sessions
//==========================================================================================================

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

#include "logging/Logger.h"
#include "dlab/LineFramer.h"

namespace dlab {

namespace {
class LineFramer : public IMessageFramer {
public:
    explicit LineFramer(std::size_t maxLen) : maxLineBytes(maxLen) {}

    std::string encode(const std::string& payload) override {
        std::string frame;
        frame.reserve(payload.size() + 1);
        frame.append(payload);
        frame.push_back('\n');
        return frame;
    }

    DecodeResult tryDecodeEx(const std::string& buffer) override {
        std::size_t pos = 0;
        if (discarding) {
            std::size_t eol = buffer.find('\n');
            if (eol == std::string::npos) {
                return { DecodeStatus::Incomplete, std::nullopt, buffer.size() };
            }
            discarding = false;
            pos = eol + 1;
        }

        while (true) {
            std::size_t eol = buffer.find('\n', pos);
            if (eol == std::string::npos) {
                if (buffer.size() - pos > maxLineBytes) {
                    LOG_WARN("Line exceeds {} bytes without terminator; discarding", maxLineBytes);
                    discarding = true;
                    return { DecodeStatus::LineTooLong, std::nullopt, buffer.size() };
                }
                return { DecodeStatus::Incomplete, std::nullopt, pos };
            }
            std::size_t end = eol;
            if (end > pos && buffer[end - 1] == '\r') --end;
            const bool blank = std::all_of(buffer.begin() + static_cast<std::ptrdiff_t>(pos),
                                           buffer.begin() + static_cast<std::ptrdiff_t>(end),
                                           [](unsigned char ch) { return std::isspace(ch) != 0; });
            if (blank) {
                pos = eol + 1;
                continue;
            }
            if (end - pos > maxLineBytes) {
                LOG_WARN("Line of {} bytes exceeds limit (max={})", end - pos, maxLineBytes);
                return { DecodeStatus::LineTooLong, std::nullopt, eol + 1 };
            }
            return { DecodeStatus::Ok, buffer.substr(pos, end - pos), eol + 1 };
        }
    }

    std::optional<std::string> tryDecode(std::string& buffer) override {
        DecodeResult r = tryDecodeEx(buffer);
        if (r.bytesConsumed > 0 && r.bytesConsumed <= buffer.size()) {
            buffer.erase(0, r.bytesConsumed);
        }
        if (r.status == DecodeStatus::Ok) {
            return r.payload;
        }
        return std::nullopt;
    }

private:
    std::size_t maxLineBytes;
    bool discarding{false};
};
} // namespace

std::unique_ptr<IMessageFramer> MakeLineFramer(std::size_t maxLineBytes) {
    return std::make_unique<LineFramer>(maxLineBytes);
}

} // namespace dlab
