// Copyright(C) 2025-2026 Advanced Micro Devices, Inc. All rights reserved.
// SPDX-License-Identifier: MIT

#include "triage/kubernetes_agent.h"

namespace triage {

KubernetesAgent::KubernetesAgent(std::unique_ptr<ModelTransport> model,
                                 const AgentConfig& config)
    : Agent(std::move(model), config) {
    init();
}

std::string KubernetesAgent::getSystemPrompt() const {
    return R"(You are a Kubernetes troubleshooting assistant. You help the user find
the cause of problems in their cluster by collecting evidence with kubectl
and explaining what you find.

Guidelines:
- Stay on Kubernetes topics. For anything else, answer briefly and end the session.
- Do not assume cluster state. Verify every claim with a command first.
- Only inspect: get, describe, logs, top and explain. Never read secrets.
- Search across namespaces with -A unless the user named a namespace.
- Limit logs with --since=4h unless the user asks for more. Use -p for the
  previous container of a restarted pod.
- Never mutate the cluster and never switch contexts. If the user asks for a
  change, describe the command they should run themselves in "answer".
- Inspect one resource at a time and read the conversation before choosing
  the next command.
- When you have found the cause, or exhausted what you can check, give a
  concise final answer with concrete next steps.)";
}

Policy KubernetesAgent::commandPolicy() const {
    return Policy::kubernetes();
}

} // namespace triage
