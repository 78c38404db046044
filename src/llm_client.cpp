// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "triage/llm_client.h"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstdio>
#include <iostream>
#include <mutex>
#include <thread>

#include <httplib.h>

#include "triage/errors.h"

namespace triage {

namespace {

void setTimeout(std::chrono::milliseconds timeout, time_t& sec, time_t& usec) {
    sec = static_cast<time_t>(timeout.count() / 1000);
    usec = static_cast<time_t>((timeout.count() % 1000) * 1000);
}

template <typename ClientT>
std::string postChat(ClientT& cli, const std::string& path, const httplib::Headers& headers,
                     const std::string& body,
                     std::chrono::milliseconds connTimeout,
                     std::chrono::milliseconds readTimeout,
                     const Context& ctx) {
    time_t sec = 0;
    time_t usec = 0;
    setTimeout(connTimeout, sec, usec);
    cli.set_connection_timeout(sec, usec);
    setTimeout(readTimeout, sec, usec);
    cli.set_read_timeout(sec, usec);

    // The read timeout bounds each socket read, not the whole response.
    // Close the connection from another thread once the context ends.
    std::mutex mu;
    std::condition_variable cv;
    bool finished = false;
    std::thread watchdog([&]() {
        std::unique_lock<std::mutex> lock(mu);
        while (!finished) {
            cv.wait_for(lock, std::chrono::milliseconds(20));
            if (!finished && ctx.done()) {
                cli.stop();
                return;
            }
        }
    });

    auto res = cli.Post(path, headers, body, "application/json");
    {
        std::lock_guard<std::mutex> lock(mu);
        finished = true;
    }
    cv.notify_one();
    watchdog.join();

    if (ctx.done()) {
        throw TransportError("failed to send request: " + ctx.errorText());
    }
    if (!res) {
        throw TransportError("failed to send request: " + httplib::to_string(res.error()));
    }
    if (res->status != 200) {
        throw TransportError("unexpected status code: " + std::to_string(res->status) +
                             "\n" + res->body);
    }
    return res->body;
}

} // namespace

LlmClient::LlmClient(ModelConfig config)
    : config_(std::move(config)) {
    parseBaseUrl();
}

void LlmClient::parseBaseUrl() {
    std::string baseUrl = config_.baseUrl;

    // Extract scheme
    if (baseUrl.substr(0, 8) == "https://") {
        useSsl_ = true;
        baseUrl = baseUrl.substr(8);
        port_ = 443;
    } else if (baseUrl.substr(0, 7) == "http://") {
        baseUrl = baseUrl.substr(7);
    }

    // Extract host:port and path
    auto slashPos = baseUrl.find('/');
    if (slashPos != std::string::npos) {
        host_ = baseUrl.substr(0, slashPos);
        path_ = baseUrl.substr(slashPos);
    } else {
        host_ = baseUrl;
        path_ = "";
    }

    auto colonPos = host_.find(':');
    if (colonPos != std::string::npos) {
        try {
            port_ = std::stoi(host_.substr(colonPos + 1));
        } catch (const std::exception&) {
            throw TransportError("invalid port in base URL: " + config_.baseUrl);
        }
        host_ = host_.substr(0, colonPos);
    }

    if (path_.empty() || path_.back() != '/') {
        path_ += "/chat/completions";
    } else {
        path_ += "chat/completions";
    }

    if (!config_.azureApiVersion.empty()) {
        path_ += "?api-version=" + config_.azureApiVersion;
    }
}

void LlmClient::setSystemPrompt(const std::string& prompt) {
    if (!history_.empty() && history_.front().role == MessageRole::SYSTEM) {
        history_.front().content = prompt;
    } else {
        history_.insert(history_.begin(), Message{MessageRole::SYSTEM, prompt});
    }
}

void LlmClient::resetHistory() {
    if (!history_.empty() && history_.front().role == MessageRole::SYSTEM) {
        history_.erase(history_.begin() + 1, history_.end());
    } else {
        history_.clear();
    }
}

json LlmClient::buildRequest(const std::string& prompt) const {
    json msgArray = json::array();
    for (const auto& msg : history_) {
        msgArray.push_back(msg.toJson());
    }
    msgArray.push_back(Message{MessageRole::USER, prompt}.toJson());

    return json{
        {"model", config_.name},
        {"temperature", config_.temperature},
        {"messages", msgArray}
    };
}

std::string LlmClient::ask(const Context& ctx, const std::string& prompt) {
    if (ctx.done()) {
        throw TransportError("failed to send request: " + ctx.errorText());
    }

    json requestBody = buildRequest(prompt);

    httplib::Headers headers;
    if (!config_.authToken.empty()) {
        if (!config_.azureApiVersion.empty()) {
            headers.emplace("api-key", config_.authToken);
        } else {
            headers.emplace("Authorization", "Bearer " + config_.authToken);
        }
    }

    // Never wait past the session deadline.
    auto readTimeout = std::chrono::milliseconds(static_cast<long long>(config_.readTimeout) * 1000);
    readTimeout = std::min(readTimeout, ctx.remaining());
    auto connTimeout = std::chrono::milliseconds(static_cast<long long>(config_.connectionTimeout) * 1000);
    connTimeout = std::min(connTimeout, ctx.remaining());

    if (config_.debug) {
        std::cerr << "[LLM] Calling " << host_ << ":" << port_ << path_ << std::endl;
        std::cerr << "[LLM] Messages: " << requestBody["messages"].size() << std::endl;
    }

    std::string responseBody;
    if (useSsl_) {
#ifdef CPPHTTPLIB_OPENSSL_SUPPORT
        httplib::SSLClient cli(host_, port_);
        responseBody = postChat(cli, path_, headers, requestBody.dump(), connTimeout, readTimeout, ctx);
#else
        throw TransportError("SSL not supported. Use http:// base URL.");
#endif
    } else {
        httplib::Client cli(host_, port_);
        responseBody = postChat(cli, path_, headers, requestBody.dump(), connTimeout, readTimeout, ctx);
    }

    std::string content;
    Usage usage;
    try {
        json responseJson = json::parse(responseBody);
        if (!responseJson.contains("choices") || !responseJson["choices"].is_array() ||
            responseJson["choices"].empty()) {
            throw TransportError("unexpected chat response: no choices | body: " +
                                 responseBody.substr(0, 200));
        }
        const auto& message = responseJson["choices"][0].value("message", json::object());
        if (!message.contains("content") || !message["content"].is_string()) {
            throw TransportError("unexpected chat response: missing message content | body: " +
                                 responseBody.substr(0, 200));
        }
        content = message["content"].get<std::string>();

        if (responseJson.contains("usage") && responseJson["usage"].is_object()) {
            const auto& u = responseJson["usage"];
            usage.promptTokens = u.value("prompt_tokens", 0);
            usage.completionTokens = u.value("completion_tokens", 0);
            usage.totalTokens = u.value("total_tokens", 0);
        }
    } catch (const json::exception& e) {
        throw TransportError(std::string("failed to unmarshal chat response: ") + e.what());
    }

    if (config_.debug) {
        std::cerr << "[LLM] " << config_.name << " responded: " << content << std::endl;
    }

    history_.push_back(Message{MessageRole::USER, prompt});
    usage_.add(usage);
    history_.push_back(Message{MessageRole::ASSISTANT, content});

    return content;
}

std::string LlmClient::usageSummary() const {
    double inputPrice = config_.pricing.input * usage_.promptTokens / 1000.0;
    double outputPrice = config_.pricing.output * usage_.completionTokens / 1000.0;

    char buffer[256];
    std::snprintf(buffer, sizeof(buffer), "%.4f$ for input(%d), %.4f$ for output(%d)",
                  inputPrice, usage_.promptTokens, outputPrice, usage_.completionTokens);
    return config_.name + ": " + buffer;
}

} // namespace triage
