#pragma once

#include <sre_gateway/mcp/tool_registry.hpp>
#include <sre_gateway/tools/cli_catalog.hpp>
#include <sre_gateway/tools/tool_settings.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>

namespace sre_gateway {

// ---------------------------------------------------------------------------
// CliToolRunner — runs catalog tools on behalf of cli_tool, POST /cli/{tool}
// and POST /cli/chain.
//
// Parameters (all optional):
//   args   array of strings, or one string split on whitespace
//   flags  {"x": true} -> -x, {"x": v} -> -x v
//   input  piped to stdin
//   cwd    working directory (default: execution.workdir)
//
// `sops` takes a separate path: the AGE key is written to a 0600 temp file
// handed to sops through SOPS_AGE_KEY_FILE, and removed afterwards.
// ---------------------------------------------------------------------------
class CliToolRunner {
public:
    CliToolRunner(ToolSettings settings, std::shared_ptr<const CliCatalog> catalog);

    [[nodiscard]] nlohmann::json Run(const std::string& tool, const nlohmann::json& params,
                                     ToolRunContext& context) const;

    /// Runs `commands` in order; each step's stdout becomes the next one's
    /// stdin. Stops at the first failure.
    [[nodiscard]] nlohmann::json RunChain(const nlohmann::json& commands,
                                          ToolRunContext& context) const;

    [[nodiscard]] const CliCatalog& Catalog() const noexcept { return *catalog_; }

private:
    nlohmann::json RunSops(const nlohmann::json& params, ToolRunContext& context) const;
    std::string WorkingDirectory(const nlohmann::json& params) const;

    ToolSettings settings_;
    std::shared_ptr<const CliCatalog> catalog_;
};

} // namespace sre_gateway
