// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Configuration for models and sessions.
//
// Config files are JSON:
//   {
//     "agent":      {"name": "gpt-4o-mini", "base_url": "https://api.openai.com/v1",
//                    "auth_token": "...", "pricing": {"input": 0.00015, "output": 0.0006}},
//     "validation": {"name": "...", "base_url": "..."},
//     "max_iterations": 7,
//     "session_timeout": 120
//   }
// Only agent.name and agent.base_url are required.

#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "triage/export.h"

namespace triage {

using json = nlohmann::json;

/// Price in USD per 1K tokens.
struct Pricing {
    double input = 0.0;
    double output = 0.0;
};

struct ModelConfig {
    std::string name;
    std::string baseUrl;
    std::string authToken;
    std::string azureApiVersion;  // non-empty selects Azure OpenAI auth and URL
    Pricing pricing;
    double temperature = 0.0;
    int connectionTimeout = 30;   // seconds
    int readTimeout = 120;        // seconds
    bool debug = false;
};

struct TriageConfig {
    ModelConfig agent;
    std::optional<ModelConfig> validation;
    int maxIterations = 7;
    int correctionAttempts = 3;
    int sessionTimeoutSeconds = 120;
    bool debug = false;
    bool showPrompts = false;
    bool showUsage = false;
    bool silentMode = false;

    bool useModelForValidation() const { return validation.has_value(); }
};

TRIAGE_API void from_json(const json& j, Pricing& p);
TRIAGE_API void to_json(json& j, const Pricing& p);
TRIAGE_API void from_json(const json& j, ModelConfig& m);
TRIAGE_API void to_json(json& j, const ModelConfig& m);
TRIAGE_API void from_json(const json& j, TriageConfig& c);
TRIAGE_API void to_json(json& j, const TriageConfig& c);

/// The config written when none exists yet.
TRIAGE_API TriageConfig defaultConfig();

/// $XDG_CONFIG_HOME/triage/config.json, or ~/.config/triage/config.json.
TRIAGE_API std::string defaultConfigPath();

/// ~/.triage.json
TRIAGE_API std::string legacyConfigPath();

/// Check required fields.
/// @throws ConfigError naming the first missing field
TRIAGE_API void validateConfig(const TriageConfig& config);

/// Parse, validate and apply environment overrides (TRIAGE_AGENT_TOKEN,
/// TRIAGE_VALIDATION_TOKEN).
/// @throws ConfigError on malformed JSON or missing fields
TRIAGE_API TriageConfig parseConfig(const std::string& text);

/// Load a config file. With an empty path the default location is used,
/// then the legacy one; if neither exists a default file is created at the
/// default location.
/// @throws ConfigError if the file cannot be read, created or parsed
TRIAGE_API TriageConfig loadConfig(const std::string& path = "");

/// Write a config as pretty JSON, creating parent directories.
/// @throws ConfigError on I/O failure
TRIAGE_API void writeConfig(const std::string& path, const TriageConfig& config);

} // namespace triage
