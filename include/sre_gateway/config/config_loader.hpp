#pragma once

#include <sre_gateway/config/app_config.hpp>
#include <sre_gateway/core/result.hpp>

#include <nlohmann/json_fwd.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace sre_gateway {

constexpr const char* kDefaultConfigFile = "/app/config/config.yaml";

// Flags given on the command line. Unset flags leave lower layers untouched.
struct CliOverrides {
    std::optional<std::string> config_file;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<uint16_t> ws_port;
    std::optional<std::string> workdir;
    std::optional<int> timeout_seconds;
    std::optional<int> max_concurrent_processes;
    bool dry_run = false;
    std::optional<std::string> log_level;
    bool log_json = false;
    std::optional<std::string> log_file;
    bool verbose = false;
    bool quiet = false;
};

// Copy of `envp` (as passed to main or `environ`).
Environment CaptureEnvironment(const char* const* envp);

// Parse a YAML config file on top of the defaults in `base`.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path,
                                      AppConfig base = AppConfig{});

// Apply the recognized environment keys to `base` and remember `env`
// as the base environment of child processes.
Result<AppConfig, Error> ApplyEnvironment(AppConfig base, const Environment& env);

// Parse CLI arguments.
Result<CliOverrides, Error> LoadFromCli(int argc, const char* const* argv);

// Apply CLI overrides on top of `base`.
AppConfig MergeConfigs(const AppConfig& base, const CliOverrides& cli);

// Validate ports, limits and flag combinations.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Full pipeline: defaults -> YAML -> environment -> CLI -> validate.
// A missing file at the default location is skipped; an explicitly named
// file that does not exist is an error.
Result<AppConfig, Error> LoadAppConfig(const CliOverrides& cli, const Environment& env);

// Configuration as JSON with secrets reduced to flags.
nlohmann::json RedactedConfigJson(const AppConfig& config);

} // namespace sre_gateway
