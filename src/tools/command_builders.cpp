#include <sre_gateway/tools/command_builders.hpp>

#include <set>

namespace sre_gateway {

namespace {

std::string FlagValue(const nlohmann::json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

std::vector<std::string> KubectlPrefix(const ToolSettings& settings) {
    std::vector<std::string> argv{"kubectl"};
    if (!settings.kube_context.empty()) {
        argv.push_back("--context");
        argv.push_back(settings.kube_context);
    }
    return argv;
}

bool HasString(const nlohmann::json& params, const char* key) {
    return params.is_object() && params.contains(key) && params[key].is_string();
}

bool BoolParam(const nlohmann::json& params, const char* key) {
    return params.is_object() && params.contains(key) && params[key].is_boolean() &&
           params[key].get<bool>();
}

} // anonymous namespace

std::string StringParam(const nlohmann::json& params, const char* key,
                        const std::string& fallback) {
    if (params.is_object()) {
        auto it = params.find(key);
        if (it != params.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return fallback;
}

Command BaseCommand(const ToolSettings& settings, std::vector<std::string> argv) {
    Command cmd;
    cmd.argv = std::move(argv);
    cmd.working_directory = settings.workdir;
    cmd.timeout = settings.timeout;
    return cmd;
}

void AppendFlags(std::vector<std::string>& argv, const nlohmann::json& flags,
                 const std::string& prefix) {
    if (!flags.is_object()) {
        return;
    }
    for (const auto& [name, value] : flags.items()) {
        if (value.is_boolean()) {
            if (value.get<bool>()) {
                argv.push_back(prefix + name);
            }
            continue;
        }
        if (value.is_null()) {
            continue;
        }
        argv.push_back(prefix + name);
        argv.push_back(FlagValue(value));
    }
}

// ---------------------------------------------------------------------------
// MCP tools
// ---------------------------------------------------------------------------

Command KubectlGetCommand(const ToolSettings& settings, const KubectlGetArgs& args) {
    auto argv = KubectlPrefix(settings);
    argv.insert(argv.end(), {"get", "-n", args.ns, args.resource});
    if (args.name && !args.name->empty()) {
        argv.push_back(*args.name);
    }
    argv.insert(argv.end(), {"-o", args.output});
    return BaseCommand(settings, std::move(argv));
}

Command KubectlDescribeCommand(const ToolSettings& settings,
                               const KubectlDescribeArgs& args) {
    auto argv = KubectlPrefix(settings);
    argv.insert(argv.end(), {"describe", "-n", args.ns, args.resource, args.name});
    return BaseCommand(settings, std::move(argv));
}

Command KubectlLogsCommand(const ToolSettings& settings, const KubectlLogsArgs& args) {
    auto argv = KubectlPrefix(settings);
    argv.insert(argv.end(), {"logs", "-n", args.ns, "--tail", std::to_string(args.lines)});
    if (args.container && !args.container->empty()) {
        argv.push_back("-c");
        argv.push_back(*args.container);
    }
    argv.push_back(args.pod);
    return BaseCommand(settings, std::move(argv));
}

Command FluxStatusCommand(const ToolSettings& settings, const FluxStatusArgs& args) {
    return BaseCommand(settings, {"flux", "get", "-n", args.ns, args.resource});
}

Command GitStatusCommand(const ToolSettings& settings, const GitStatusArgs& args) {
    auto cmd = BaseCommand(settings, {"git", "status", "--porcelain"});
    cmd.working_directory = args.path;
    return cmd;
}

Command HealthProbeCommand(const ToolSettings& settings, const std::string& service) {
    return BaseCommand(settings, {"curl", "-s", "-o", "/dev/null", "-w", "%{http_code}",
                                  "http://" + service + ":8080/health"});
}

// ---------------------------------------------------------------------------
// REST actions
// ---------------------------------------------------------------------------

Command KubectlActionCommand(const ToolSettings& settings, const std::string& action,
                             const nlohmann::json& params) {
    auto argv = KubectlPrefix(settings);
    argv.push_back(action);
    if (HasString(params, "resource")) {
        argv.push_back(params["resource"].get<std::string>());
    }
    if (HasString(params, "name")) {
        argv.push_back(params["name"].get<std::string>());
    }
    const auto ns = StringParam(params, "namespace", settings.kube_namespace);
    if (!ns.empty() && action != "get-contexts" && action != "config") {
        argv.push_back("-n");
        argv.push_back(ns);
    }
    if (HasString(params, "output")) {
        argv.push_back("-o");
        argv.push_back(params["output"].get<std::string>());
    }
    if (params.is_object() && params.contains("flags")) {
        AppendFlags(argv, params["flags"], "--");
    }
    return BaseCommand(settings, std::move(argv));
}

Command FluxActionCommand(const ToolSettings& settings, const std::string& action,
                          const nlohmann::json& params) {
    std::vector<std::string> argv{"flux", action};
    if (HasString(params, "resource")) {
        argv.push_back(params["resource"].get<std::string>());
    }
    if (HasString(params, "name")) {
        argv.push_back(params["name"].get<std::string>());
    }
    argv.push_back("-n");
    argv.push_back(StringParam(params, "namespace", settings.flux_namespace));
    if (params.is_object() && params.contains("flags")) {
        AppendFlags(argv, params["flags"], "--");
    }
    return BaseCommand(settings, std::move(argv));
}

Result<Command, Error> GitActionCommand(const ToolSettings& settings,
                                        const std::string& action,
                                        const nlohmann::json& params) {
    static const std::set<std::string> kActions = {
        "clone", "pull", "push", "commit", "checkout", "branch", "status", "diff", "log"};
    if (kActions.count(action) == 0) {
        return Result<Command, Error>::Err(
            Error::Validation("GitActionCommand", "action", "Unknown git action: " + action));
    }

    std::vector<std::string> argv{"git", action};
    if (action == "clone") {
        const auto repo = StringParam(params, "repo", settings.clone_url);
        if (repo.empty()) {
            return Result<Command, Error>::Err(Error::Validation(
                "GitActionCommand", "repo",
                "clone needs 'repo' or a configured repository URL"));
        }
        argv.push_back(repo);
        if (HasString(params, "target")) {
            argv.push_back(params["target"].get<std::string>());
        }
    } else if (action == "commit") {
        if (HasString(params, "message")) {
            argv.push_back("-m");
            argv.push_back(params["message"].get<std::string>());
        }
        if (BoolParam(params, "all")) {
            argv.push_back("-a");
        }
    } else if (action == "checkout") {
        if (BoolParam(params, "create")) {
            argv.push_back("-b");
        }
        if (HasString(params, "branch")) {
            argv.push_back(params["branch"].get<std::string>());
        }
    } else if (action == "push" || action == "pull") {
        if (HasString(params, "remote")) {
            argv.push_back(params["remote"].get<std::string>());
        }
        if (HasString(params, "branch")) {
            argv.push_back(params["branch"].get<std::string>());
        }
    }

    auto cmd = BaseCommand(settings, std::move(argv));
    cmd.working_directory = StringParam(params, "cwd", settings.repo_path);
    return Result<Command, Error>::Ok(std::move(cmd));
}

} // namespace sre_gateway
