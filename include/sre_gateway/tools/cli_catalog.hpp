#pragma once

#include <sre_gateway/config/app_config.hpp>

#include <nlohmann/json.hpp>

#include <set>
#include <string>
#include <vector>

namespace sre_gateway {

struct CliToolInfo {
    std::string name;
    std::string executable;
    std::string category;
};

// ---------------------------------------------------------------------------
// CliCatalog — diagnostic CLI tools the gateway may run, and the subset
// that configuration activates:
//   active = (every tool if "all", else tools in an enabled category)
//            + enabled_tools - disabled_tools
// ---------------------------------------------------------------------------
class CliCatalog {
public:
    explicit CliCatalog(const ToolsConfig& config);

    /// Every known tool, in catalog order.
    [[nodiscard]] static const std::vector<CliToolInfo>& Available();

    [[nodiscard]] const CliToolInfo* Find(const std::string& name) const;
    [[nodiscard]] bool IsActive(const std::string& name) const;
    [[nodiscard]] const std::vector<std::string>& ActiveNames() const noexcept {
        return active_;
    }
    [[nodiscard]] std::set<std::string> Categories() const;
    [[nodiscard]] const ToolsConfig& Config() const noexcept { return config_; }

    /// {"tool": {"cmd", "category"}, ...} for every known tool.
    [[nodiscard]] static nlohmann::json AvailableJson();

private:
    ToolsConfig config_;
    std::vector<std::string> active_;
};

} // namespace sre_gateway
