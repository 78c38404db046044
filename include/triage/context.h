// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT
//
// Cancellable deadline shared by a session, its model calls and the
// subprocesses it starts.

#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace triage {

class Context {
public:
    using Clock = std::chrono::steady_clock;

    /// A context without a deadline. It only ends when cancelled.
    Context() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    static Context withTimeout(std::chrono::milliseconds timeout) {
        Context ctx;
        ctx.deadline_ = Clock::now() + timeout;
        return ctx;
    }

    static Context withDeadline(Clock::time_point deadline) {
        Context ctx;
        ctx.deadline_ = deadline;
        return ctx;
    }

    std::optional<Clock::time_point> deadline() const { return deadline_; }

    bool expired() const {
        return deadline_.has_value() && Clock::now() >= deadline_.value();
    }

    bool cancelled() const { return cancelled_->load(); }

    bool done() const { return cancelled() || expired(); }

    /// Cancels this context and every copy of it.
    void cancel() { cancelled_->store(true); }

    /// Time left before the deadline. Without a deadline this is
    /// std::chrono::milliseconds::max().
    std::chrono::milliseconds remaining() const {
        if (!deadline_.has_value()) return std::chrono::milliseconds::max();
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline_.value() - Clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }

    /// Reason the context ended, or an empty string while it is still live.
    std::string errorText() const {
        if (cancelled()) return "context canceled";
        if (expired()) return "context deadline exceeded";
        return "";
    }

private:
    std::optional<Clock::time_point> deadline_;
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace triage
