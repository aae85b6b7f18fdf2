#include <sre_gateway/tools/tool_settings.hpp>

namespace sre_gateway {

ToolSettings ToolSettings::FromConfig(const AppConfig& config) {
    ToolSettings settings;
    settings.kube_context = config.kubernetes.context;
    settings.kube_namespace = config.kubernetes.default_namespace;
    settings.flux_namespace = config.flux.default_namespace;
    settings.repo_path = config.git.repo_path;
    settings.clone_url = config.git.clone_url;
    settings.workdir = config.execution.workdir;
    settings.timeout = std::chrono::seconds(config.execution.timeout_seconds);
    settings.sops_enabled = config.secrets.sops_enabled;
    settings.age_key = config.secrets.age_key;
    settings.services = config.services;
    return settings;
}

} // namespace sre_gateway
