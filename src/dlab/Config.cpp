//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Environment and argument parsing for ServerConfig
//==========================================================================================================

#include "dlab/Config.h"

#include <limits>
#include <stdexcept>

#include "env/EnvVars.h"
#include "logging/Logger.h"

namespace dlab {

namespace {

// Parses an unsigned value in [minValue, maxValue]; keeps fallback on error.
std::size_t parseSize(const std::string& name, const std::string& raw, std::size_t fallback,
                      std::size_t minValue, std::size_t maxValue) {
    if (raw.empty()) return fallback;
    try {
        std::size_t pos = 0;
        unsigned long long v = std::stoull(raw, &pos);
        if (pos != raw.size() || v < minValue || v > maxValue) {
            LOG_WARN("Ignoring {}={} (expected integer in [{}, {}])", name, raw, minValue, maxValue);
            return fallback;
        }
        return static_cast<std::size_t>(v);
    } catch (const std::exception&) {
        LOG_WARN("Ignoring malformed {}={}", name, raw);
        return fallback;
    }
}

validation::ValidationMode parseValidation(const std::string& name, const std::string& raw,
                                          validation::ValidationMode fallback) {
    if (auto mode = validation::parseMode(raw)) return mode.value();
    LOG_WARN("Ignoring {}={} (expected off or strict)", name, raw);
    return fallback;
}

bool parseFlag(const std::string& raw, bool fallback) {
    if (raw == "1" || raw == "true" || raw == "TRUE" || raw == "on") return true;
    if (raw == "0" || raw == "false" || raw == "FALSE" || raw == "off") return false;
    return fallback;
}

} // namespace

ServerConfig LoadServerConfigFromEnv() {
    FUNC_SCOPE();
    ServerConfig cfg;
    cfg.logLevel = GetEnvOrDefault("DLAB_LOG_LEVEL", cfg.logLevel);
    cfg.logFile = GetEnvOrDefault("DLAB_LOG_FILE", "");
    cfg.logColor = GetEnvFlag("DLAB_LOG_COLOR", cfg.logColor);
    cfg.validation = parseValidation("DLAB_VALIDATION", GetEnvOrDefault("DLAB_VALIDATION", ""), cfg.validation);
    cfg.workers = parseSize("DLAB_WORKERS", GetEnvOrDefault("DLAB_WORKERS", ""), cfg.workers, 1, 256);
    cfg.maxLineBytes = parseSize("DLAB_MAX_LINE_BYTES", GetEnvOrDefault("DLAB_MAX_LINE_BYTES", ""),
                                 cfg.maxLineBytes, 1, std::numeric_limits<uint32_t>::max());
    cfg.gatewayAddress = GetEnvOrDefault("DLAB_GATEWAY_ADDRESS", cfg.gatewayAddress);
    cfg.gatewayPort = static_cast<uint16_t>(
        parseSize("DLAB_GATEWAY_PORT", GetEnvOrDefault("DLAB_GATEWAY_PORT", ""), cfg.gatewayPort, 0, 65535));
    return cfg;
}

std::optional<std::string> GetArgValue(int argc, char** argv, const std::string& key) {
    const std::string prefix = key + "=";
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i] ? argv[i] : "";
        if (a.rfind(prefix, 0) == 0) {
            return a.substr(prefix.size());
        }
    }
    return std::nullopt;
}

void ApplyArgOverrides(ServerConfig& config, int argc, char** argv) {
    if (auto v = GetArgValue(argc, argv, "--log-level")) config.logLevel = *v;
    if (auto v = GetArgValue(argc, argv, "--log-file")) config.logFile = *v;
    if (auto v = GetArgValue(argc, argv, "--log-color")) config.logColor = parseFlag(*v, config.logColor);
    if (auto v = GetArgValue(argc, argv, "--validation")) {
        config.validation = parseValidation("--validation", *v, config.validation);
    }
    if (auto v = GetArgValue(argc, argv, "--workers")) {
        config.workers = parseSize("--workers", *v, config.workers, 1, 256);
    }
    if (auto v = GetArgValue(argc, argv, "--max-line-bytes")) {
        config.maxLineBytes = parseSize("--max-line-bytes", *v, config.maxLineBytes, 1,
                                        std::numeric_limits<uint32_t>::max());
    }
    if (auto v = GetArgValue(argc, argv, "--address")) config.gatewayAddress = *v;
    if (auto v = GetArgValue(argc, argv, "--port")) {
        config.gatewayPort = static_cast<uint16_t>(parseSize("--port", *v, config.gatewayPort, 0, 65535));
    }
}

void ApplyLoggingConfig(const ServerConfig& config) {
    Logger::setLogLevelFromString(config.logLevel);
    Logger::setColorEnabled(config.logColor);
    if (!config.logFile.empty() && !Logger::setLogFile(config.logFile)) {
        LOG_WARN("Continuing without log file {}", config.logFile);
    }
}

} // namespace dlab
