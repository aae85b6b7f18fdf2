#include <sre_gateway/tools/cli_catalog.hpp>

#include <algorithm>

namespace sre_gateway {

namespace {

bool Contains(const std::vector<std::string>& values, const std::string& value) {
    return std::find(values.begin(), values.end(), value) != values.end();
}

} // anonymous namespace

const std::vector<CliToolInfo>& CliCatalog::Available() {
    static const std::vector<CliToolInfo> kTools = {
        {"sed", "sed", "text"},
        {"curl", "curl", "network"},
        {"cat", "cat", "text"},
        {"tree", "tree", "filesystem"},
        {"find", "find", "filesystem"},
        {"grep", "grep", "text"},
        {"awk", "awk", "text"},
        {"sort", "sort", "text"},
        {"uniq", "uniq", "text"},
        {"wc", "wc", "text"},
        {"head", "head", "text"},
        {"tail", "tail", "text"},
        {"less", "less", "text"},
        {"more", "more", "text"},
        {"jq", "jq", "json"},
        {"yq", "yq", "yaml"},
        {"base64", "base64", "encoding"},
        {"tr", "tr", "text"},
        {"cut", "cut", "text"},
        {"paste", "paste", "text"},
        {"diff", "diff", "text"},
        {"tar", "tar", "archive"},
        {"gzip", "gzip", "archive"},
        {"ps", "ps", "system"},
        {"top", "top", "system"},
        {"df", "df", "system"},
        {"du", "du", "system"},
        {"free", "free", "system"},
        {"netstat", "netstat", "network"},
        {"ss", "ss", "network"},
        {"lsof", "lsof", "system"},
        {"tcpdump", "tcpdump", "network"},
        {"ping", "ping", "network"},
        {"nslookup", "nslookup", "network"},
        {"dig", "dig", "network"},
        {"sops", "sops", "security"},
        {"age", "age", "security"},
        {"kustomize", "kustomize", "kubernetes"},
        {"helm", "helm", "kubernetes"},
        {"k9s", "k9s", "kubernetes"},
        {"kubectx", "kubectx", "kubernetes"},
        {"kubens", "kubens", "kubernetes"},
    };
    return kTools;
}

CliCatalog::CliCatalog(const ToolsConfig& config) : config_(config) {
    const bool all = Contains(config_.enabled_categories, "all");
    for (const auto& tool : Available()) {
        if (Contains(config_.disabled_tools, tool.name)) {
            continue;
        }
        if (all || Contains(config_.enabled_tools, tool.name) ||
            Contains(config_.enabled_categories, tool.category)) {
            active_.push_back(tool.name);
        }
    }
}

const CliToolInfo* CliCatalog::Find(const std::string& name) const {
    const auto& tools = Available();
    auto it = std::find_if(tools.begin(), tools.end(),
                           [&](const CliToolInfo& t) { return t.name == name; });
    return it != tools.end() ? &*it : nullptr;
}

bool CliCatalog::IsActive(const std::string& name) const {
    return Contains(active_, name);
}

std::set<std::string> CliCatalog::Categories() const {
    std::set<std::string> out;
    for (const auto& tool : Available()) {
        out.insert(tool.category);
    }
    return out;
}

nlohmann::json CliCatalog::AvailableJson() {
    nlohmann::json out = nlohmann::json::object();
    for (const auto& tool : Available()) {
        out[tool.name] = {{"cmd", tool.executable}, {"category", tool.category}};
    }
    return out;
}

} // namespace sre_gateway
