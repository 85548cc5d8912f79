//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_config.cpp
// Purpose: Tests for DLAB_* environment configuration and --key=value overrides
//==========================================================================================================

#include <gtest/gtest.h>

#include <cstdlib>
#include <string>
#include <vector>

#include "dlab/Config.h"
#include "env/EnvVars.h"

using namespace dlab;

namespace {

// Sets a variable for the lifetime of the guard.
class ScopedEnv {
public:
    ScopedEnv(const char* n, const char* value) : name(n) {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name); }

private:
    const char* name;
};

} // namespace

TEST(ConfigEnv, DefaultsWhenUnset) {
    ServerConfig cfg = LoadServerConfigFromEnv();
    EXPECT_EQ(cfg.logLevel, "INFO");
    EXPECT_EQ(cfg.validation, validation::ValidationMode::Off);
    EXPECT_EQ(cfg.workers, 4u);
    EXPECT_EQ(cfg.maxLineBytes, 1024u * 1024u);
    EXPECT_EQ(cfg.gatewayAddress, "127.0.0.1");
    EXPECT_EQ(cfg.gatewayPort, 3848);
}

TEST(ConfigEnv, ReadsVariables) {
    ScopedEnv level("DLAB_LOG_LEVEL", "DEBUG");
    ScopedEnv mode("DLAB_VALIDATION", "strict");
    ScopedEnv workers("DLAB_WORKERS", "2");
    ScopedEnv port("DLAB_GATEWAY_PORT", "4000");
    ScopedEnv color("DLAB_LOG_COLOR", "0");
    ServerConfig cfg = LoadServerConfigFromEnv();
    EXPECT_EQ(cfg.logLevel, "DEBUG");
    EXPECT_EQ(cfg.validation, validation::ValidationMode::Strict);
    EXPECT_EQ(cfg.workers, 2u);
    EXPECT_EQ(cfg.gatewayPort, 4000);
    EXPECT_FALSE(cfg.logColor);
}

TEST(ConfigEnv, MalformedNumbersKeepDefaults) {
    ScopedEnv workers("DLAB_WORKERS", "many");
    ScopedEnv port("DLAB_GATEWAY_PORT", "70000");
    ScopedEnv lines("DLAB_MAX_LINE_BYTES", "0");
    ServerConfig cfg = LoadServerConfigFromEnv();
    EXPECT_EQ(cfg.workers, 4u);
    EXPECT_EQ(cfg.gatewayPort, 3848);
    EXPECT_EQ(cfg.maxLineBytes, 1024u * 1024u);
}

TEST(ConfigArgs, OverridesApplyOnTopOfEnvironment) {
    std::vector<std::string> args = {"dlab", "--workers=1", "--port=0", "--validation=Strict",
                                     "--address=0.0.0.0", "--max-line-bytes=4096", "positional"};
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());

    ServerConfig cfg;
    ApplyArgOverrides(cfg, static_cast<int>(argv.size()), argv.data());
    EXPECT_EQ(cfg.workers, 1u);
    EXPECT_EQ(cfg.gatewayPort, 0);
    EXPECT_EQ(cfg.validation, validation::ValidationMode::Strict);
    EXPECT_EQ(cfg.gatewayAddress, "0.0.0.0");
    EXPECT_EQ(cfg.maxLineBytes, 4096u);

    EXPECT_EQ(GetArgValue(static_cast<int>(argv.size()), argv.data(), "--port").value_or(""), "0");
    EXPECT_FALSE(GetArgValue(static_cast<int>(argv.size()), argv.data(), "--log-file").has_value());
}

TEST(ConfigValidation, ModeSpellings) {
    using validation::ValidationMode;
    EXPECT_EQ(validation::parseMode("STRICT"), ValidationMode::Strict);
    EXPECT_EQ(validation::parseMode("On"), ValidationMode::Strict);
    EXPECT_EQ(validation::parseMode("none"), ValidationMode::Off);
    EXPECT_EQ(validation::parseMode(""), ValidationMode::Off);
    EXPECT_FALSE(validation::parseMode("paranoid").has_value());
    EXPECT_STREQ(validation::toString(ValidationMode::Strict), "strict");
    EXPECT_STREQ(validation::toString(ValidationMode::Off), "off");
}

TEST(ConfigValidation, UnknownModeKeepsCurrentSetting) {
    {
        ScopedEnv mode("DLAB_VALIDATION", "paranoid");
        EXPECT_EQ(LoadServerConfigFromEnv().validation, validation::ValidationMode::Off);
    }
    std::vector<std::string> args = {"dlab", "--validation=sometimes"};
    std::vector<char*> argv;
    for (auto& a : args) argv.push_back(a.data());
    ServerConfig cfg;
    cfg.validation = validation::ValidationMode::Strict;
    ApplyArgOverrides(cfg, static_cast<int>(argv.size()), argv.data());
    EXPECT_EQ(cfg.validation, validation::ValidationMode::Strict);
}

TEST(EnvVars, Helpers) {
    EXPECT_EQ(GetEnvOrDefault("DLAB_TEST_SURELY_UNSET", "fallback"), "fallback");
    EXPECT_EQ(GetEnvOrDefault(nullptr, "x"), "x");
    ScopedEnv flag("DLAB_TEST_FLAG", "true");
    EXPECT_TRUE(GetEnvFlag("DLAB_TEST_FLAG", false));
    EXPECT_FALSE(GetEnvFlag("DLAB_TEST_SURELY_UNSET", false));
}
