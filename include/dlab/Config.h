//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Process configuration collected from DLAB_* environment variables and --key=value arguments
//==========================================================================================================

#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "dlab/validation/Validation.h"

namespace dlab {

//==========================================================================================================
// ServerConfig
// Purpose: Settings shared by the stdio tool server and the TCP gateway.
// Fields:
//   logLevel: DEBUG | INFO | WARN | ERROR (DLAB_LOG_LEVEL).
//   logFile: Optional append-mode log file (DLAB_LOG_FILE).
//   logColor: ANSI label colouring (DLAB_LOG_COLOR).
//   validation: Outbound result checks (DLAB_VALIDATION = off | strict).
//   workers: Handler threads for the stdio loop (DLAB_WORKERS).
//   maxLineBytes: Longest accepted input line (DLAB_MAX_LINE_BYTES).
//   gatewayAddress / gatewayPort: TCP gateway bind (DLAB_GATEWAY_ADDRESS / DLAB_GATEWAY_PORT).
//==========================================================================================================
struct ServerConfig {
    std::string logLevel{"INFO"};
    std::string logFile;
    bool logColor{true};
    validation::ValidationMode validation{validation::ValidationMode::Off};
    std::size_t workers{4};
    std::size_t maxLineBytes{1024 * 1024};
    std::string gatewayAddress{"127.0.0.1"};
    uint16_t gatewayPort{3848};
};

// Reads every DLAB_* variable. Malformed numbers keep the default and log a warning.
ServerConfig LoadServerConfigFromEnv();

// Returns the value of "--key=value" from argv, if present.
std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key);

//==========================================================================================================
// ApplyArgOverrides
// Purpose: Overlay command-line overrides on an environment-derived config.
// Args:
//   config: Config to update in place.
//   argc/argv: Process arguments; recognized keys are --log-level, --log-file, --validation, --workers,
//              --max-line-bytes, --address and --port.
//==========================================================================================================
void ApplyArgOverrides(ServerConfig& config, int argc, char** argv);

// Pushes the logging fields of the config into Logger.
void ApplyLoggingConfig(const ServerConfig& config);

} // namespace dlab
