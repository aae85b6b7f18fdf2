#pragma once

#include <sre_gateway/mcp/tool_registry.hpp>
#include <sre_gateway/tools/cli_catalog.hpp>
#include <sre_gateway/tools/tool_settings.hpp>

#include <memory>

namespace sre_gateway {

// Registers kubectl_get, kubectl_describe, kubectl_logs, flux_status,
// git_status, git_pull, git_commit, git_push, cli_tool and health_check.
// Handlers capture copies of `settings` and the catalog, so the registry
// stays valid after a reload replaces both.
void RegisterSreTools(ToolRegistry& registry, const ToolSettings& settings,
                      std::shared_ptr<const CliCatalog> catalog);

std::shared_ptr<const ToolRegistry> BuildSreRegistry(const ToolSettings& settings,
                                                     std::shared_ptr<const CliCatalog> catalog);

} // namespace sre_gateway
