// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#pragma once

#include <memory>

#include "agent.h"
#include "triage/export.h"

namespace triage {

/// Kubernetes troubleshooting agent: read-only kubectl with text filters.
class TRIAGE_API KubernetesAgent : public Agent {
public:
    explicit KubernetesAgent(std::unique_ptr<ModelTransport> model,
                             const AgentConfig& config = {});

protected:
    std::string getSystemPrompt() const override;
    Policy commandPolicy() const override;
};

} // namespace triage
