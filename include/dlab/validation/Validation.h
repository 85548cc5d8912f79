//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Validation.h
// Purpose: Outbound result checking mode for the dispatch server (DLAB_VALIDATION / --validation)
//==========================================================================================================

#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace dlab {
namespace validation {

//==========================================================================================================
// ValidationMode
// Purpose: Inbound params and gateway envelopes are validated in every mode. Strict additionally checks
//          each tools/call result before it leaves the server; a malformed result becomes -32603.
//==========================================================================================================
enum class ValidationMode {
    Off = 0,
    Strict = 1,
};

// Lower-case spelling, the same vocabulary parseMode accepts.
inline const char* toString(ValidationMode mode) {
    return mode == ValidationMode::Strict ? "strict" : "off";
}

//==========================================================================================================
// parseMode
// Purpose: Case-insensitive parse of a configured mode.
// Accepts:
//   "strict", "on", "1" -> Strict
//   "off", "none", "0", "" -> Off
// Returns:
//   nullopt for anything else so the caller can warn and keep its current mode.
//==========================================================================================================
inline std::optional<ValidationMode> parseMode(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (s == "strict" || s == "on" || s == "1") return ValidationMode::Strict;
    if (s.empty() || s == "off" || s == "none" || s == "0") return ValidationMode::Off;
    return std::nullopt;
}

} // namespace validation
} // namespace dlab
