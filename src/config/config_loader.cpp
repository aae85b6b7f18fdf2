#include <sre_gateway/config/config_loader.hpp>

#include <sre_gateway/core/log.hpp>
#include <sre_gateway/core/version.hpp>

#include <argparse/argparse.hpp>
#include <nlohmann/json.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <sstream>

namespace sre_gateway {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", message, std::nullopt, ErrorCategory::Config};
}

std::string ToUpper(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::vector<std::string> SplitCsv(const std::string& text) {
    std::vector<std::string> out;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto first = item.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        auto last = item.find_last_not_of(" \t");
        out.push_back(item.substr(first, last - first + 1));
    }
    return out;
}

std::optional<bool> ParseBool(std::string value) {
    value = ToUpper(std::move(value));
    if (value == "TRUE" || value == "1" || value == "YES" || value == "ON") {
        return true;
    }
    if (value == "FALSE" || value == "0" || value == "NO" || value == "OFF" ||
        value.empty()) {
        return false;
    }
    return std::nullopt;
}

std::optional<int> ParseInt(const std::string& value) {
    try {
        size_t pos = 0;
        int parsed = std::stoi(value, &pos);
        if (pos != value.size()) {
            return std::nullopt;
        }
        return parsed;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::vector<std::string> YamlStringList(const YAML::Node& node) {
    std::vector<std::string> out;
    if (node.IsScalar()) {
        return SplitCsv(node.as<std::string>());
    }
    for (const auto& item : node) {
        out.push_back(item.as<std::string>());
    }
    return out;
}

const std::string* Lookup(const Environment& env, const std::string& key) {
    auto it = env.find(key);
    return it == env.end() ? nullptr : &it->second;
}

// Environment key whose value must be an integer.
Result<void, Error> ApplyIntEnv(const Environment& env, const std::string& key,
                                int& target) {
    if (const auto* raw = Lookup(env, key)) {
        auto parsed = ParseInt(*raw);
        if (!parsed.has_value()) {
            return Result<void, Error>::Err(
                MakeConfigError(key + " must be an integer, got '" + *raw + "'"));
        }
        target = *parsed;
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ApplyBoolEnv(const Environment& env, const std::string& key,
                                 bool& target) {
    if (const auto* raw = Lookup(env, key)) {
        auto parsed = ParseBool(*raw);
        if (!parsed.has_value()) {
            return Result<void, Error>::Err(
                MakeConfigError(key + " must be true or false, got '" + *raw + "'"));
        }
        target = *parsed;
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ApplyPortEnv(const Environment& env, const std::string& key,
                                 uint16_t& target) {
    int value = target;
    auto r = ApplyIntEnv(env, key, value);
    if (r.IsErr()) {
        return r;
    }
    if (value < 0 || value > 65535) {
        return Result<void, Error>::Err(
            MakeConfigError(key + " out of range: " + std::to_string(value)));
    }
    target = static_cast<uint16_t>(value);
    return Result<void, Error>::Ok();
}

} // anonymous namespace

std::map<std::string, std::string> DefaultServiceEndpoints() {
    return {
        {"prometheus", "http://prometheus:9090"},
        {"alertmanager", "http://alertmanager:9093"},
        {"grafana", "http://grafana:3000"},
        {"kuma", "http://kuma:5681"},
        {"jaeger", "http://jaeger:16686"},
        {"loki", "http://loki:3100"},
        {"tempo", "http://tempo:3200"},
        {"consul", "http://consul:8500"},
        {"vault", "http://vault:8200"},
        {"elasticsearch", "http://elasticsearch:9200"},
        {"kibana", "http://kibana:5601"},
        {"minio", "http://minio:9000"},
        {"argo", "http://argo-workflows:2746"},
        {"opa", "http://opa:8181"},
        {"cert_manager", "http://cert-manager:9402"},
        {"nginx_ingress", "http://nginx-ingress:10254"},
        {"traefik", "http://traefik:8080"},
        {"envoy", "http://envoy:9901"},
        {"coredns", "http://coredns:9153"},
        {"etcd", "http://etcd:2379"},
    };
}

// ---------------------------------------------------------------------------
// CaptureEnvironment
// ---------------------------------------------------------------------------
Environment CaptureEnvironment(const char* const* envp) {
    Environment env;
    if (envp == nullptr) {
        return env;
    }
    for (const char* const* p = envp; *p != nullptr; ++p) {
        std::string entry(*p);
        auto eq = entry.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        env.emplace(entry.substr(0, eq), entry.substr(eq + 1));
    }
    return env;
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path, AppConfig base) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config = std::move(base);
    config.config_file = std::string(file_path);
    if (root.IsNull()) {
        return Result<AppConfig, Error>::Ok(std::move(config));
    }

    try {
        if (const auto server = root["server"]) {
            if (server["host"]) config.server.host = server["host"].as<std::string>();
            if (server["port"]) config.server.port = server["port"].as<uint16_t>();
            if (server["ws_port"]) config.server.ws_port = server["ws_port"].as<uint16_t>();
        }

        if (const auto exec = root["execution"]) {
            if (exec["workdir"]) config.execution.workdir = exec["workdir"].as<std::string>();
            if (exec["timeout_seconds"]) {
                config.execution.timeout_seconds = exec["timeout_seconds"].as<int>();
            }
            if (exec["dry_run"]) config.execution.dry_run = exec["dry_run"].as<bool>();
            if (exec["max_concurrent_processes"]) {
                config.execution.max_concurrent_processes =
                    exec["max_concurrent_processes"].as<int>();
            }
            if (exec["kill_grace_ms"]) {
                config.execution.kill_grace_ms = exec["kill_grace_ms"].as<int>();
            }
        }

        if (const auto kube = root["kubernetes"]) {
            if (kube["context"]) config.kubernetes.context = kube["context"].as<std::string>();
            if (kube["namespace"]) {
                config.kubernetes.default_namespace = kube["namespace"].as<std::string>();
            }
        }

        if (const auto flux = root["flux"]) {
            if (flux["namespace"]) {
                config.flux.default_namespace = flux["namespace"].as<std::string>();
            }
        }

        if (const auto git = root["git"]) {
            if (git["repo_path"]) config.git.repo_path = git["repo_path"].as<std::string>();
            if (git["clone_url"]) config.git.clone_url = git["clone_url"].as<std::string>();
        }

        if (const auto tools = root["tools"]) {
            if (tools["enabled_categories"]) {
                config.tools.enabled_categories = YamlStringList(tools["enabled_categories"]);
            }
            if (tools["enabled_tools"]) {
                config.tools.enabled_tools = YamlStringList(tools["enabled_tools"]);
            }
            if (tools["disabled_tools"]) {
                config.tools.disabled_tools = YamlStringList(tools["disabled_tools"]);
            }
        }

        if (const auto secrets = root["secrets"]) {
            if (secrets["sops_enabled"]) {
                config.secrets.sops_enabled = secrets["sops_enabled"].as<bool>();
            }
            if (secrets["age_key"]) config.secrets.age_key = secrets["age_key"].as<std::string>();
        }

        if (const auto services = root["services"]) {
            if (!services.IsMap()) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("'services' must be a map of name to URL"));
            }
            for (const auto& entry : services) {
                config.services[entry.first.as<std::string>()] =
                    entry.second.as<std::string>();
            }
        }

        if (const auto logging = root["logging"]) {
            if (logging["level"]) config.logging.level = logging["level"].as<std::string>();
            if (logging["json"]) config.logging.json = logging["json"].as<bool>();
            if (logging["file"]) config.logging.file = logging["file"].as<std::string>();
        }

        if (const auto ws = root["websocket"]) {
            if (ws["worker_threads"]) {
                config.websocket.worker_threads = ws["worker_threads"].as<int>();
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in " + std::string(file_path) + ": " + e.what()));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// ApplyEnvironment
// ---------------------------------------------------------------------------
Result<AppConfig, Error> ApplyEnvironment(AppConfig config, const Environment& env) {
    using R = Result<AppConfig, Error>;

    if (auto r = ApplyPortEnv(env, "MCP_SERVER_PORT", config.server.port); r.IsErr()) {
        return R::Err(r.Error());
    }
    if (auto r = ApplyPortEnv(env, "MCP_WS_PORT", config.server.ws_port); r.IsErr()) {
        return R::Err(r.Error());
    }
    if (auto r = ApplyIntEnv(env, "COMMAND_TIMEOUT", config.execution.timeout_seconds);
        r.IsErr()) {
        return R::Err(r.Error());
    }
    if (auto r = ApplyIntEnv(env, "MAX_CONCURRENT_PROCESSES",
                             config.execution.max_concurrent_processes);
        r.IsErr()) {
        return R::Err(r.Error());
    }
    if (auto r = ApplyBoolEnv(env, "DRY_RUN", config.execution.dry_run); r.IsErr()) {
        return R::Err(r.Error());
    }
    if (auto r = ApplyBoolEnv(env, "SOPS_ENABLED", config.secrets.sops_enabled);
        r.IsErr()) {
        return R::Err(r.Error());
    }

    if (const auto* v = Lookup(env, "AGENT_WORKDIR")) config.execution.workdir = *v;
    if (const auto* v = Lookup(env, "KUBE_CONTEXT")) config.kubernetes.context = *v;
    if (const auto* v = Lookup(env, "KUBE_NAMESPACE")) config.kubernetes.default_namespace = *v;
    if (const auto* v = Lookup(env, "FLUX_NAMESPACE")) config.flux.default_namespace = *v;
    if (const auto* v = Lookup(env, "LOCAL_REPO_PATH")) config.git.repo_path = *v;
    if (const auto* v = Lookup(env, "K8S_REPO_PATH")) config.git.repo_path = *v;
    if (const auto* v = Lookup(env, "GITHUB_REPO")) config.git.clone_url = *v;
    if (const auto* v = Lookup(env, "SOPS_AGE_KEY")) config.secrets.age_key = *v;
    if (const auto* v = Lookup(env, "AGENT_LOG_LEVEL")) config.logging.level = *v;

    if (const auto* v = Lookup(env, "TOOLS_ENABLED_CATEGORIES")) {
        config.tools.enabled_categories = SplitCsv(*v);
    }
    if (const auto* v = Lookup(env, "TOOLS_ENABLED")) {
        config.tools.enabled_tools = SplitCsv(*v);
    }
    if (const auto* v = Lookup(env, "TOOLS_DISABLED")) {
        config.tools.disabled_tools = SplitCsv(*v);
    }

    for (auto& [name, url] : config.services) {
        if (const auto* v = Lookup(env, ToUpper(name) + "_URL")) {
            url = *v;
        }
    }

    config.environment = env;
    return R::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOverrides, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("sre-gateway", kVersion);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file (default: $CONFIG_FILE or /app/config/config.yaml)");
    program.add_argument("--host")
        .help("Address to bind");
    program.add_argument("--port")
        .help("HTTP port (REST, /health, /mcp/http)")
        .scan<'i', int>();
    program.add_argument("--ws-port")
        .help("WebSocket port (/mcp)")
        .scan<'i', int>();
    program.add_argument("--workdir")
        .help("Default working directory for commands");
    program.add_argument("--timeout")
        .help("Command timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--max-processes")
        .help("Maximum number of concurrently running commands")
        .scan<'i', int>();
    program.add_argument("--dry-run")
        .help("Report commands instead of running them")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-level")
        .help("DEBUG, INFO, WARN or ERROR");
    program.add_argument("--log-json")
        .help("Log as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Also append log lines to this file");
    program.add_argument("-v", "--verbose")
        .help("Verbose output (DEBUG)")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-q", "--quiet")
        .help("Only log errors")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<CliOverrides, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOverrides cli;
    cli.config_file = program.present("--config");
    cli.host = program.present("--host");
    for (const auto& [flag, target] :
         {std::pair<const char*, std::optional<uint16_t>*>{"--port", &cli.port},
          std::pair<const char*, std::optional<uint16_t>*>{"--ws-port", &cli.ws_port}}) {
        if (auto val = program.present<int>(flag)) {
            if (*val < 0 || *val > 65535) {
                return Result<CliOverrides, Error>::Err(
                    MakeConfigError(std::string(flag) + " out of range: " +
                                    std::to_string(*val)));
            }
            *target = static_cast<uint16_t>(*val);
        }
    }
    cli.workdir = program.present("--workdir");
    cli.timeout_seconds = program.present<int>("--timeout");
    cli.max_concurrent_processes = program.present<int>("--max-processes");
    cli.dry_run = program.get<bool>("--dry-run");
    cli.log_level = program.present("--log-level");
    cli.log_json = program.get<bool>("--log-json");
    cli.log_file = program.present("--log-file");
    cli.verbose = program.get<bool>("--verbose");
    cli.quiet = program.get<bool>("--quiet");

    return Result<CliOverrides, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const CliOverrides& cli) {
    AppConfig merged = base;

    if (cli.host) merged.server.host = *cli.host;
    if (cli.port) merged.server.port = *cli.port;
    if (cli.ws_port) merged.server.ws_port = *cli.ws_port;
    if (cli.workdir) merged.execution.workdir = *cli.workdir;
    if (cli.timeout_seconds) merged.execution.timeout_seconds = *cli.timeout_seconds;
    if (cli.max_concurrent_processes) {
        merged.execution.max_concurrent_processes = *cli.max_concurrent_processes;
    }
    if (cli.dry_run) merged.execution.dry_run = true;
    if (cli.log_level) merged.logging.level = *cli.log_level;
    if (cli.log_json) merged.logging.json = true;
    if (cli.log_file) merged.logging.file = *cli.log_file;
    if (cli.verbose) merged.logging.verbose = true;
    if (cli.quiet) merged.logging.quiet = true;

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.server.port == 0) {
        return Result<void, Error>::Err(MakeConfigError("Invalid port: 0"));
    }
    if (config.server.ws_port == 0) {
        return Result<void, Error>::Err(MakeConfigError("Invalid WebSocket port: 0"));
    }
    if (config.server.port == config.server.ws_port) {
        return Result<void, Error>::Err(MakeConfigError(
            "HTTP and WebSocket ports must differ, both are " +
            std::to_string(config.server.port)));
    }
    if (config.execution.timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must be positive, got " +
                            std::to_string(config.execution.timeout_seconds)));
    }
    if (config.execution.max_concurrent_processes <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("max_concurrent_processes must be positive, got " +
                            std::to_string(config.execution.max_concurrent_processes)));
    }
    if (config.execution.kill_grace_ms < 0) {
        return Result<void, Error>::Err(MakeConfigError("kill_grace_ms must not be negative"));
    }
    if (config.websocket.worker_threads <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("websocket.worker_threads must be positive"));
    }
    if (!ParseLogLevel(config.logging.level).has_value()) {
        return Result<void, Error>::Err(
            MakeConfigError("Unknown log level: " + config.logging.level));
    }
    if (config.logging.verbose && config.logging.quiet) {
        return Result<void, Error>::Err(
            MakeConfigError("Cannot use both --verbose and --quiet"));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// LoadAppConfig
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadAppConfig(const CliOverrides& cli, const Environment& env) {
    AppConfig config;
    config.services = DefaultServiceEndpoints();

    std::string path = kDefaultConfigFile;
    bool explicit_path = false;
    if (cli.config_file) {
        path = *cli.config_file;
        explicit_path = true;
    } else if (auto it = env.find("CONFIG_FILE"); it != env.end()) {
        path = it->second;
        explicit_path = true;
    }

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        auto yaml = LoadFromYaml(path, std::move(config));
        if (yaml.IsErr()) {
            return yaml;
        }
        config = std::move(yaml).Value();
    } else if (explicit_path) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Config file not found: " + path));
    }

    auto with_env = ApplyEnvironment(std::move(config), env);
    if (with_env.IsErr()) {
        return with_env;
    }

    auto merged = MergeConfigs(with_env.Value(), cli);
    auto valid = ValidateConfig(merged);
    if (valid.IsErr()) {
        return Result<AppConfig, Error>::Err(valid.Error());
    }
    return Result<AppConfig, Error>::Ok(std::move(merged));
}

// ---------------------------------------------------------------------------
// RedactedConfigJson
// ---------------------------------------------------------------------------
nlohmann::json RedactedConfigJson(const AppConfig& config) {
    nlohmann::json j;
    j["server"] = {
        {"host", config.server.host},
        {"port", config.server.port},
        {"ws_port", config.server.ws_port},
    };
    j["execution"] = {
        {"workdir", config.execution.workdir},
        {"timeout_seconds", config.execution.timeout_seconds},
        {"dry_run", config.execution.dry_run},
        {"max_concurrent_processes", config.execution.max_concurrent_processes},
        {"kill_grace_ms", config.execution.kill_grace_ms},
    };
    j["kubernetes"] = {
        {"context", config.kubernetes.context},
        {"namespace", config.kubernetes.default_namespace},
    };
    j["flux"] = {{"namespace", config.flux.default_namespace}};
    j["git"] = {{"repo_path", config.git.repo_path}};
    j["tools"] = {
        {"enabled_categories", config.tools.enabled_categories},
        {"enabled_tools", config.tools.enabled_tools},
        {"disabled_tools", config.tools.disabled_tools},
    };
    j["secrets"] = {
        {"sops_enabled", config.secrets.sops_enabled},
        {"age_key_configured", !config.secrets.age_key.empty()},
    };
    j["services"] = config.services;
    j["logging"] = {
        {"level", config.logging.level},
        {"json", config.logging.json},
    };
    if (config.logging.file) {
        j["logging"]["file"] = *config.logging.file;
    }
    j["websocket"] = {{"worker_threads", config.websocket.worker_threads}};
    if (config.config_file) {
        j["config_file"] = *config.config_file;
    }
    return j;
}

} // namespace sre_gateway
