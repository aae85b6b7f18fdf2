#include <sre_gateway/tools/sre_tools.hpp>

#include <sre_gateway/core/timestamp.hpp>
#include <sre_gateway/core/version.hpp>
#include <sre_gateway/tools/cli_runner.hpp>
#include <sre_gateway/tools/command_builders.hpp>
#include <sre_gateway/tools/git_workflows.hpp>

#include "tool_utils.hpp"

#include <nlohmann/json.hpp>

#include <limits>

namespace sre_gateway {

namespace {

using Json = nlohmann::json;

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

Json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

Json StringProp(const std::string& desc, const std::string& default_value) {
    return {{"type", "string"}, {"description", desc}, {"default", default_value}};
}

Json BoolProp(const std::string& desc) {
    return {{"type", "boolean"}, {"description", desc}, {"default", false}};
}

Json StringArrayProp(const std::string& desc) {
    return {{"type", "array"}, {"items", {{"type", "string"}}}, {"description", desc}};
}

Json MakeSchema(const Json& properties, const Json& required = Json::array()) {
    return {{"type", "object"}, {"properties", properties}, {"required", required}};
}

// ---------------------------------------------------------------------------
// Argument access (input already passed schema validation)
// ---------------------------------------------------------------------------

std::string Str(const Json& args, const char* key, const std::string& fallback = {}) {
    auto it = args.find(key);
    return it != args.end() && it->is_string() ? it->get<std::string>() : fallback;
}

std::optional<std::string> OptStr(const Json& args, const char* key) {
    auto it = args.find(key);
    if (it != args.end() && it->is_string() && !it->get<std::string>().empty()) {
        return it->get<std::string>();
    }
    return std::nullopt;
}

bool Bool(const Json& args, const char* key) {
    auto it = args.find(key);
    return it != args.end() && it->is_boolean() && it->get<bool>();
}

template <typename Args>
Result<Args, Error> Ok(Args args) {
    return Result<Args, Error>::Ok(std::move(args));
}

Json ServerInfo() {
    return {{"name", kServerName}, {"version", kVersion}};
}

// ---------------------------------------------------------------------------
// kubectl
// ---------------------------------------------------------------------------

ToolBinding<KubectlGetArgs> KubectlGet(const ToolSettings& s) {
    ToolBinding<KubectlGetArgs> b;
    b.descriptor = {
        "kubectl_get", "Execute kubectl get commands",
        MakeSchema({{"resource", StringProp("Kubernetes resource type (pods, nodes, services, etc.)")},
                    {"namespace", StringProp("Kubernetes namespace", s.kube_namespace)},
                    {"name", StringProp("Specific resource name (optional)")},
                    {"output", StringProp("Output format (json, yaml, wide, etc.)", "json")}},
                   {"resource"})};
    b.parse = [s](const Json& a) {
        KubectlGetArgs args;
        args.resource = Str(a, "resource");
        args.ns = Str(a, "namespace", s.kube_namespace);
        args.name = OptStr(a, "name");
        args.output = Str(a, "output", "json");
        return Ok(std::move(args));
    };
    b.build = [s](const KubectlGetArgs& args) { return KubectlGetCommand(s, args); };
    b.invoke = [s](const KubectlGetArgs& args, ToolRunContext& ctx) {
        auto result = tool_utils::Run(ctx, KubectlGetCommand(s, args));
        auto out = result.ToJson();
        if (args.output == "json" && result.succeeded) {
            auto parsed = Json::parse(result.stdout_data, nullptr, false);
            out["data"] = parsed.is_discarded() ? Json(result.stdout_data) : parsed;
        }
        return out;
    };
    return b;
}

ToolBinding<KubectlDescribeArgs> KubectlDescribe(const ToolSettings& s) {
    ToolBinding<KubectlDescribeArgs> b;
    b.descriptor = {
        "kubectl_describe", "Execute kubectl describe commands",
        MakeSchema({{"resource", StringProp("Kubernetes resource type")},
                    {"name", StringProp("Resource name")},
                    {"namespace", StringProp("Kubernetes namespace", s.kube_namespace)}},
                   {"resource", "name"})};
    b.parse = [s](const Json& a) {
        KubectlDescribeArgs args;
        args.resource = Str(a, "resource");
        args.name = Str(a, "name");
        args.ns = Str(a, "namespace", s.kube_namespace);
        return Ok(std::move(args));
    };
    b.build = [s](const KubectlDescribeArgs& args) { return KubectlDescribeCommand(s, args); };
    b.invoke = [s](const KubectlDescribeArgs& args, ToolRunContext& ctx) {
        return tool_utils::Run(ctx, KubectlDescribeCommand(s, args)).ToJson();
    };
    return b;
}

ToolBinding<KubectlLogsArgs> KubectlLogs(const ToolSettings& s) {
    ToolBinding<KubectlLogsArgs> b;
    b.descriptor = {
        "kubectl_logs", "Get pod logs",
        MakeSchema({{"pod", StringProp("Pod name")},
                    {"namespace", StringProp("Kubernetes namespace", s.kube_namespace)},
                    {"container", StringProp("Container name (optional)")},
                    {"lines", {{"type", "integer"},
                               {"description", "Number of lines to retrieve"},
                               {"default", 100}}}},
                   {"pod"})};
    b.parse = [s](const Json& a) -> Result<KubectlLogsArgs, Error> {
        KubectlLogsArgs args;
        args.pod = Str(a, "pod");
        args.ns = Str(a, "namespace", s.kube_namespace);
        args.container = OptStr(a, "container");
        const double lines = a.value("lines", 100.0);
        if (lines < 0) {
            return Result<KubectlLogsArgs, Error>::Err(Error::Validation(
                "kubectl_logs", "lines", "field 'lines' must not be negative"));
        }
        if (lines > static_cast<double>(std::numeric_limits<int>::max())) {
            return Result<KubectlLogsArgs, Error>::Err(Error::Validation(
                "kubectl_logs", "lines", "field 'lines' is too large"));
        }
        args.lines = static_cast<int>(lines);
        return Ok(std::move(args));
    };
    b.build = [s](const KubectlLogsArgs& args) { return KubectlLogsCommand(s, args); };
    b.invoke = [s](const KubectlLogsArgs& args, ToolRunContext& ctx) {
        return tool_utils::Run(ctx, KubectlLogsCommand(s, args)).ToJson();
    };
    return b;
}

// ---------------------------------------------------------------------------
// flux
// ---------------------------------------------------------------------------

ToolBinding<FluxStatusArgs> FluxStatus(const ToolSettings& s) {
    ToolBinding<FluxStatusArgs> b;
    b.descriptor = {
        "flux_status", "Get Flux GitOps status",
        MakeSchema({{"namespace", StringProp("Flux namespace", s.flux_namespace)},
                    {"resource", StringProp("Flux resource type (sources, kustomizations, etc.)",
                                            "all")}})};
    b.parse = [s](const Json& a) {
        FluxStatusArgs args;
        args.ns = Str(a, "namespace", s.flux_namespace);
        args.resource = Str(a, "resource", "all");
        return Ok(std::move(args));
    };
    b.build = [s](const FluxStatusArgs& args) { return FluxStatusCommand(s, args); };
    b.invoke = [s](const FluxStatusArgs& args, ToolRunContext& ctx) {
        return tool_utils::Run(ctx, FluxStatusCommand(s, args)).ToJson();
    };
    return b;
}

// ---------------------------------------------------------------------------
// git
// ---------------------------------------------------------------------------

ToolBinding<GitStatusArgs> GitStatus(const ToolSettings& s) {
    ToolBinding<GitStatusArgs> b;
    b.descriptor = {"git_status", "Get git repository status",
                    MakeSchema({{"path", StringProp("Git repository path", s.repo_path)}})};
    b.parse = [s](const Json& a) {
        return Ok(GitStatusArgs{Str(a, "path", s.repo_path)});
    };
    b.build = [s](const GitStatusArgs& args) { return GitStatusCommand(s, args); };
    b.invoke = [s](const GitStatusArgs& args, ToolRunContext& ctx) {
        return tool_utils::Run(ctx, GitStatusCommand(s, args)).ToJson();
    };
    return b;
}

ToolBinding<GitPullArgs> GitPull(const ToolSettings& s) {
    ToolBinding<GitPullArgs> b;
    b.descriptor = {
        "git_pull", "Pull latest changes from the Kubernetes Git repository",
        MakeSchema({{"branch", StringProp("Branch to pull (default: current branch)")},
                    {"force", BoolProp("Force pull even if there are local changes")}})};
    b.parse = [](const Json& a) {
        return Ok(GitPullArgs{OptStr(a, "branch"), Bool(a, "force")});
    };
    b.invoke = [s](const GitPullArgs& args, ToolRunContext& ctx) {
        return GitPullWorkflow(s, args, ctx);
    };
    return b;
}

ToolBinding<GitCommitArgs> GitCommit(const ToolSettings& s) {
    ToolBinding<GitCommitArgs> b;
    b.descriptor = {
        "git_commit", "Commit changes to the Kubernetes Git repository",
        MakeSchema({{"message", StringProp("Commit message")},
                    {"files", StringArrayProp("Specific files to commit (optional)")},
                    {"all", BoolProp("Commit all changes")}},
                   {"message"})};
    b.parse = [](const Json& a) -> Result<GitCommitArgs, Error> {
        GitCommitArgs args;
        args.message = Str(a, "message");
        if (args.message.empty()) {
            return Result<GitCommitArgs, Error>::Err(Error::Validation(
                "git_commit", "message", "field 'message' must not be empty"));
        }
        if (a.contains("files")) {
            args.files = a["files"].get<std::vector<std::string>>();
        }
        args.all = Bool(a, "all");
        return Ok(std::move(args));
    };
    b.invoke = [s](const GitCommitArgs& args, ToolRunContext& ctx) {
        return GitCommitWorkflow(s, args, ctx);
    };
    return b;
}

ToolBinding<GitPushArgs> GitPush(const ToolSettings& s) {
    ToolBinding<GitPushArgs> b;
    b.descriptor = {
        "git_push", "Push changes to the Kubernetes Git repository",
        MakeSchema({{"branch", StringProp("Branch to push (default: current branch)")},
                    {"force", BoolProp("Force push")}})};
    b.parse = [](const Json& a) {
        return Ok(GitPushArgs{OptStr(a, "branch"), Bool(a, "force")});
    };
    b.invoke = [s](const GitPushArgs& args, ToolRunContext& ctx) {
        return GitPushWorkflow(s, args, ctx);
    };
    return b;
}

// ---------------------------------------------------------------------------
// cli_tool, health_check
// ---------------------------------------------------------------------------

ToolBinding<CliToolArgs> CliTool(const ToolSettings& s,
                                 std::shared_ptr<const CliCatalog> catalog) {
    ToolBinding<CliToolArgs> b;
    b.descriptor = {
        "cli_tool", "Execute CLI tools (jq, grep, sed, etc.)",
        MakeSchema({{"tool", StringProp("CLI tool name (jq, grep, sed, curl, etc.)")},
                    {"args", StringArrayProp("Command line arguments")},
                    {"input", StringProp("Input data to process")}},
                   {"tool"})};
    b.parse = [](const Json& a) {
        CliToolArgs args;
        args.tool = Str(a, "tool");
        if (a.contains("args")) {
            args.args = a["args"].get<std::vector<std::string>>();
        }
        args.input = OptStr(a, "input");
        return Ok(std::move(args));
    };
    auto runner = std::make_shared<const CliToolRunner>(s, std::move(catalog));
    b.invoke = [runner](const CliToolArgs& args, ToolRunContext& ctx) {
        Json params = {{"args", args.args}};
        if (args.input) {
            params["input"] = *args.input;
        }
        return runner->Run(args.tool, params, ctx);
    };
    return b;
}

ToolBinding<HealthCheckArgs> HealthCheck(const ToolSettings& s) {
    ToolBinding<HealthCheckArgs> b;
    b.descriptor = {"health_check", "Check system and service health",
                    MakeSchema({{"service", StringProp("Service name to check (optional)")}})};
    b.parse = [](const Json& a) { return Ok(HealthCheckArgs{OptStr(a, "service")}); };
    b.invoke = [s](const HealthCheckArgs& args, ToolRunContext& ctx) -> Json {
        if (!args.service) {
            return {{"status", "healthy"}, {"timestamp", Iso8601Now()}, {"server", ServerInfo()}};
        }
        auto probe = tool_utils::Run(ctx, HealthProbeCommand(s, *args.service));
        const auto code = tool_utils::Trim(probe.stdout_data);
        return {
            {"service", *args.service},
            {"status", probe.succeeded && code == "200" ? "healthy" : "unhealthy"},
            {"response_code", code},
        };
    };
    return b;
}

} // anonymous namespace

void RegisterSreTools(ToolRegistry& registry, const ToolSettings& settings,
                      std::shared_ptr<const CliCatalog> catalog) {
    registry.Register(KubectlGet(settings));
    registry.Register(KubectlDescribe(settings));
    registry.Register(KubectlLogs(settings));
    registry.Register(FluxStatus(settings));
    registry.Register(GitStatus(settings));
    registry.Register(CliTool(settings, std::move(catalog)));
    registry.Register(HealthCheck(settings));
    registry.Register(GitPull(settings));
    registry.Register(GitCommit(settings));
    registry.Register(GitPush(settings));
}

std::shared_ptr<const ToolRegistry> BuildSreRegistry(const ToolSettings& settings,
                                                     std::shared_ptr<const CliCatalog> catalog) {
    auto registry = std::make_shared<ToolRegistry>();
    RegisterSreTools(*registry, settings, std::move(catalog));
    return registry;
}

} // namespace sre_gateway
