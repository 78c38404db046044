// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Fatal error types. Recoverable outcomes (command rejection, command
// failure) are reported as values instead; see command_validator.h and
// executer.h.

#pragma once

#include <stdexcept>
#include <string>

namespace triage {

/// The model could not be reached or replied with an unusable envelope.
class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message)
        : std::runtime_error(message) {}
};

/// The model never produced a reply matching the requested schema.
class SchemaError : public std::runtime_error {
public:
    SchemaError(const std::string& message, int attempts)
        : std::runtime_error(message), attempts_(attempts) {}

    int attempts() const { return attempts_; }

private:
    int attempts_;
};

/// Configuration is missing, unreadable or incomplete.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace triage
