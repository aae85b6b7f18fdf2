#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sre_gateway {

// Snapshot of the process environment, taken once at startup.
using Environment = std::map<std::string, std::string>;

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 8080;     // HTTP: /health, /mcp/http and the REST endpoints
    uint16_t ws_port = 8081;  // WebSocket: /mcp
};

struct ExecutionConfig {
    std::string workdir = "/app/work";
    int timeout_seconds = 60;
    bool dry_run = false;
    int max_concurrent_processes = 16;
    int kill_grace_ms = 2000;
};

struct KubernetesConfig {
    std::string context;  // empty: kubectl's current context
    std::string default_namespace = "default";
};

struct FluxConfig {
    std::string default_namespace = "flux-system";
};

struct GitConfig {
    std::string repo_path = "/app/k8s-repo";
    std::string clone_url;  // default for POST /git/clone
};

struct ToolsConfig {
    std::vector<std::string> enabled_categories{"all"};
    std::vector<std::string> enabled_tools;
    std::vector<std::string> disabled_tools;
};

struct SecretsConfig {
    bool sops_enabled = true;
    std::string age_key;  // never serialized
};

struct LoggingConfig {
    std::string level = "INFO";
    bool json = false;
    std::optional<std::string> file;
    bool verbose = false;
    bool quiet = false;
};

struct WebSocketConfig {
    int worker_threads = 4;
};

struct AppConfig {
    ServerConfig server;
    ExecutionConfig execution;
    KubernetesConfig kubernetes;
    FluxConfig flux;
    GitConfig git;
    ToolsConfig tools;
    SecretsConfig secrets;
    std::map<std::string, std::string> services;
    LoggingConfig logging;
    WebSocketConfig websocket;

    std::optional<std::string> config_file;  // file the config was loaded from
    Environment environment;                 // base environment for child processes
};

/// Observability endpoints known out of the box, overridable via <NAME>_URL.
std::map<std::string, std::string> DefaultServiceEndpoints();

} // namespace sre_gateway
