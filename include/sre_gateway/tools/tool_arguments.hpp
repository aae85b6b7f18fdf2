#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace sre_gateway {

// ---------------------------------------------------------------------------
// Typed arguments of the built-in tools, produced by schema validation.
// Defaults have already been applied when one of these exists.
// ---------------------------------------------------------------------------

struct KubectlGetArgs {
    std::string resource;
    std::string ns;
    std::optional<std::string> name;
    std::string output = "json";
};

struct KubectlDescribeArgs {
    std::string resource;
    std::string name;
    std::string ns;
};

struct KubectlLogsArgs {
    std::string pod;
    std::string ns;
    std::optional<std::string> container;
    int lines = 100;
};

struct FluxStatusArgs {
    std::string ns;
    std::string resource = "all";
};

struct GitStatusArgs {
    std::string path;
};

struct GitPullArgs {
    std::optional<std::string> branch;
    bool force = false;
};

struct GitCommitArgs {
    std::string message;
    std::vector<std::string> files;
    bool all = false;
};

struct GitPushArgs {
    std::optional<std::string> branch;
    bool force = false;
};

struct CliToolArgs {
    std::string tool;
    std::vector<std::string> args;
    std::optional<std::string> input;
};

struct HealthCheckArgs {
    std::optional<std::string> service;
};

using ToolArguments = std::variant<KubectlGetArgs,
                                   KubectlDescribeArgs,
                                   KubectlLogsArgs,
                                   FluxStatusArgs,
                                   GitStatusArgs,
                                   GitPullArgs,
                                   GitCommitArgs,
                                   GitPushArgs,
                                   CliToolArgs,
                                   HealthCheckArgs>;

} // namespace sre_gateway
