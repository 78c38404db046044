// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Chat model transport.
//
// ModelTransport is what the rest of triage talks to: one prompt in, one
// reply out, with the transport owning the conversation history. LlmClient
// implements it over an OpenAI-compatible /chat/completions endpoint.

#pragma once

#include <string>
#include <vector>

#include "config.h"
#include "context.h"
#include "types.h"
#include "triage/export.h"

namespace triage {

class ModelTransport {
public:
    virtual ~ModelTransport() = default;

    /// Send prompt as the next user turn and return the raw reply text.
    /// On success the prompt and reply are appended to the history.
    /// @throws TransportError on any failure; history is left unchanged
    virtual std::string ask(const Context& ctx, const std::string& prompt) = 0;

    /// Replace (or insert) the leading system message.
    virtual void setSystemPrompt(const std::string& prompt) = 0;

    /// Drop every message except the system prompt.
    virtual void resetHistory() = 0;

    virtual std::string modelName() const = 0;

    /// One-line cost summary. Empty when the transport does not track usage.
    virtual std::string usageSummary() const { return ""; }
};

class TRIAGE_API LlmClient : public ModelTransport {
public:
    explicit LlmClient(ModelConfig config);

    /// Connection and read timeouts are clamped to the context. The call
    /// as a whole is bounded too: a server that keeps sending slowly is
    /// disconnected once the context ends, and a reply completing after
    /// that point is discarded.
    std::string ask(const Context& ctx, const std::string& prompt) override;
    void setSystemPrompt(const std::string& prompt) override;
    void resetHistory() override;
    std::string modelName() const override { return config_.name; }
    std::string usageSummary() const override;

    const std::vector<Message>& history() const { return history_; }
    const Usage& usage() const { return usage_; }
    const ModelConfig& config() const { return config_; }

    /// Request path relative to the host, e.g. "/v1/chat/completions".
    std::string requestPath() const { return path_; }
    const std::string& host() const { return host_; }
    int port() const { return port_; }
    bool useSsl() const { return useSsl_; }

    /// Build the JSON request body for the next prompt.
    json buildRequest(const std::string& prompt) const;

private:
    void parseBaseUrl();

    ModelConfig config_;
    std::vector<Message> history_;
    Usage usage_;

    std::string host_;
    std::string path_;
    int port_ = 80;
    bool useSsl_ = false;
};

} // namespace triage
