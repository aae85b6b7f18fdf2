#pragma once

#include <sre_gateway/mcp/tool_registry.hpp>
#include <sre_gateway/tools/tool_arguments.hpp>
#include <sre_gateway/tools/tool_settings.hpp>

#include <nlohmann/json.hpp>

namespace sre_gateway {

// ---------------------------------------------------------------------------
// Multi-step git operations on the configured Kubernetes manifest
// repository. Each step is one ProcessRunner call; the first failing step
// ends the workflow with {"success": false, "error": ...}.
//
// Every workflow first requires <repo_path>/.git to exist.
// ---------------------------------------------------------------------------

/// branch (or current, or "main") -> fetch origin -> pull | reset --hard
/// -> status + last commit.
nlohmann::json GitPullWorkflow(const ToolSettings& settings, const GitPullArgs& args,
                               ToolRunContext& context);

/// status (nothing to do when clean) -> add -A | add <files> | add -u
/// -> commit -m -> rev-parse HEAD.
nlohmann::json GitCommitWorkflow(const ToolSettings& settings, const GitCommitArgs& args,
                                 ToolRunContext& context);

/// branch -> pending commits (origin/<branch>..HEAD) -> push [--force].
nlohmann::json GitPushWorkflow(const ToolSettings& settings, const GitPushArgs& args,
                               ToolRunContext& context);

} // namespace sre_gateway
