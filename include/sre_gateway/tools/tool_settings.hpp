#pragma once

#include <sre_gateway/config/app_config.hpp>

#include <chrono>
#include <map>
#include <string>

namespace sre_gateway {

// ---------------------------------------------------------------------------
// ToolSettings — the slice of AppConfig the tools read. Copied into each
// registry so a reload never changes settings under a running call.
// ---------------------------------------------------------------------------
struct ToolSettings {
    std::string kube_context;
    std::string kube_namespace = "default";
    std::string flux_namespace = "flux-system";
    std::string repo_path = "/app/k8s-repo";
    std::string clone_url;
    std::string workdir = "/app/work";
    std::chrono::milliseconds timeout{60000};
    bool sops_enabled = true;
    std::string age_key;
    std::map<std::string, std::string> services;

    static ToolSettings FromConfig(const AppConfig& config);
};

} // namespace sre_gateway
