// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "triage/config.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

#include "triage/errors.h"

namespace fs = std::filesystem;

namespace triage {

namespace {

std::string homeDirectory() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        throw ConfigError("error getting user home directory: HOME is not set");
    }
    return home;
}

void applyEnvironment(TriageConfig& config) {
    if (const char* token = std::getenv("TRIAGE_AGENT_TOKEN"); token && *token) {
        config.agent.authToken = token;
    }
    if (config.validation.has_value()) {
        if (const char* token = std::getenv("TRIAGE_VALIDATION_TOKEN"); token && *token) {
            config.validation->authToken = token;
        }
    }
}

} // namespace

// ---- JSON mapping ----

void from_json(const json& j, Pricing& p) {
    p.input = j.value("input", 0.0);
    p.output = j.value("output", 0.0);
}

void to_json(json& j, const Pricing& p) {
    j = json{{"input", p.input}, {"output", p.output}};
}

void from_json(const json& j, ModelConfig& m) {
    m.name = j.value("name", "");
    m.baseUrl = j.value("base_url", "");
    m.authToken = j.value("auth_token", "");
    m.azureApiVersion = j.value("azure_api_version", "");
    m.pricing = j.value("pricing", Pricing{});
    m.temperature = j.value("temperature", 0.0);
    m.connectionTimeout = j.value("connection_timeout", 30);
    m.readTimeout = j.value("read_timeout", 120);
}

void to_json(json& j, const ModelConfig& m) {
    j = json{
        {"name", m.name},
        {"base_url", m.baseUrl},
        {"pricing", m.pricing}
    };
    if (!m.authToken.empty()) j["auth_token"] = m.authToken;
    if (!m.azureApiVersion.empty()) j["azure_api_version"] = m.azureApiVersion;
}

void from_json(const json& j, TriageConfig& c) {
    c.agent = j.value("agent", ModelConfig{});
    if (j.contains("validation") && !j["validation"].is_null()) {
        c.validation = j["validation"].get<ModelConfig>();
    } else {
        c.validation = std::nullopt;
    }
    c.maxIterations = j.value("max_iterations", 7);
    c.correctionAttempts = j.value("correction_attempts", 3);
    c.sessionTimeoutSeconds = j.value("session_timeout", 120);
    c.debug = j.value("debug", false);
    c.showPrompts = j.value("show_prompts", false);
    c.showUsage = j.value("show_usage", false);
}

void to_json(json& j, const TriageConfig& c) {
    j = json{{"agent", c.agent}};
    if (c.validation.has_value()) j["validation"] = c.validation.value();
    j["max_iterations"] = c.maxIterations;
    j["session_timeout"] = c.sessionTimeoutSeconds;
}

// ---- Defaults and paths ----

TriageConfig defaultConfig() {
    TriageConfig config;
    config.agent.name = "gpt-4o-mini";
    config.agent.baseUrl = "https://api.openai.com/v1";
    config.agent.pricing.input = 0.00015;
    config.agent.pricing.output = 0.0006;
    return config;
}

std::string defaultConfigPath() {
    std::string base;
    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    if (xdg != nullptr && *xdg != '\0') {
        base = xdg;
    } else {
        base = (fs::path(homeDirectory()) / ".config").string();
    }
    return (fs::path(base) / "triage" / "config.json").string();
}

std::string legacyConfigPath() {
    return (fs::path(homeDirectory()) / ".triage.json").string();
}

// ---- Validation and loading ----

void validateConfig(const TriageConfig& config) {
    if (config.agent.baseUrl.empty()) {
        throw ConfigError("agent base URL is required in the configuration");
    }
    if (config.agent.name.empty()) {
        throw ConfigError("agent name is required in the configuration");
    }
    if (config.validation.has_value()) {
        if (config.validation->baseUrl.empty()) {
            throw ConfigError("validation base URL is required in the configuration");
        }
        if (config.validation->name.empty()) {
            throw ConfigError("validation name is required in the configuration");
        }
    }
    if (config.maxIterations < 1) {
        throw ConfigError("max_iterations must be at least 1");
    }
    if (config.correctionAttempts < 1) {
        throw ConfigError("correction_attempts must be at least 1");
    }
}

TriageConfig parseConfig(const std::string& text) {
    TriageConfig config;
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            throw ConfigError("unable to decode config: top level must be an object");
        }
        config = j.get<TriageConfig>();
    } catch (const json::exception& e) {
        throw ConfigError(std::string("unable to decode config: ") + e.what());
    }

    validateConfig(config);
    applyEnvironment(config);
    return config;
}

void writeConfig(const std::string& path, const TriageConfig& config) {
    std::error_code ec;
    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            throw ConfigError("error creating config directory " + parent.string() +
                              ": " + ec.message());
        }
    }

    std::ofstream out(path);
    if (!out) {
        throw ConfigError("error writing config file " + path);
    }
    out << json(config).dump(2) << "\n";
}

TriageConfig loadConfig(const std::string& path) {
    std::string configPath = path;

    if (configPath.empty()) {
        std::string xdgPath = defaultConfigPath();
        if (fs::exists(xdgPath)) {
            configPath = xdgPath;
        } else if (fs::exists(legacyConfigPath())) {
            configPath = legacyConfigPath();
        } else {
            writeConfig(xdgPath, defaultConfig());
            configPath = xdgPath;
        }
    }

    std::ifstream in(configPath);
    if (!in) {
        throw ConfigError("unable to read config: " + configPath);
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return parseConfig(buffer.str());
}

} // namespace triage
