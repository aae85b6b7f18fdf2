#pragma once

#include <sre_gateway/core/result.hpp>
#include <sre_gateway/exec/command.hpp>
#include <sre_gateway/tools/tool_arguments.hpp>
#include <sre_gateway/tools/tool_settings.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace sre_gateway {

// ---------------------------------------------------------------------------
// Pure argv construction for every command the gateway runs. Nothing here
// spawns a process; the results feed ProcessRunner::Run.
// ---------------------------------------------------------------------------

/// String member of a request body, or the fallback; non-strings count as absent.
std::string StringParam(const nlohmann::json& params, const char* key,
                        const std::string& fallback = {});

/// Command skeleton: timeout and working directory from settings.
Command BaseCommand(const ToolSettings& settings, std::vector<std::string> argv);

/// {"name": true} -> prefix+name; {"name": false} -> nothing;
/// {"name": v} -> prefix+name, v. Non-object `flags` is ignored.
void AppendFlags(std::vector<std::string>& argv, const nlohmann::json& flags,
                 const std::string& prefix);

// MCP tools
Command KubectlGetCommand(const ToolSettings& settings, const KubectlGetArgs& args);
Command KubectlDescribeCommand(const ToolSettings& settings, const KubectlDescribeArgs& args);
Command KubectlLogsCommand(const ToolSettings& settings, const KubectlLogsArgs& args);
Command FluxStatusCommand(const ToolSettings& settings, const FluxStatusArgs& args);
Command GitStatusCommand(const ToolSettings& settings, const GitStatusArgs& args);

/// curl probe printing the HTTP status of http://<service>:8080/health.
Command HealthProbeCommand(const ToolSettings& settings, const std::string& service);

// REST actions (POST /kubectl/{action}, /flux/{action}, /git/{action})
Command KubectlActionCommand(const ToolSettings& settings, const std::string& action,
                             const nlohmann::json& params);
Command FluxActionCommand(const ToolSettings& settings, const std::string& action,
                          const nlohmann::json& params);

/// Known actions: clone, pull, push, commit, checkout, branch, status, diff, log.
/// Runs in params["cwd"] or the repository path.
Result<Command, Error> GitActionCommand(const ToolSettings& settings,
                                        const std::string& action,
                                        const nlohmann::json& params);

} // namespace sre_gateway
