#include <sre_gateway/mcp/tool_registry.hpp>

#include <sre_gateway/mcp/schema_validator.hpp>

#include <atomic>

namespace sre_gateway {

nlohmann::json ToolDescriptor::ToJson() const {
    return {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema},
    };
}

ToolResult ToolResult::FromJson(nlohmann::json content) {
    bool failed = content.is_object() && content.contains("success") &&
                  content["success"].is_boolean() && !content["success"].get<bool>();
    return ToolResult{failed, std::move(content)};
}

// ---------------------------------------------------------------------------
// ToolRegistry
// ---------------------------------------------------------------------------

const ToolRegistry::Entry* ToolRegistry::Find(const std::string& name) const {
    auto it = index_.find(name);
    if (it == index_.end()) {
        return nullptr;
    }
    return &entries_[it->second];
}

Error ToolRegistry::ArgumentMismatch(const std::string& name) {
    return Error{"ToolRegistry", "arguments do not belong to tool '" + name + "'",
                 std::nullopt, ErrorCategory::Internal};
}

const ToolDescriptor* ToolRegistry::Lookup(const std::string& name) const {
    const auto* entry = Find(name);
    return entry != nullptr ? &entry->descriptor : nullptr;
}

std::vector<ToolDescriptor> ToolRegistry::Descriptors() const {
    std::vector<ToolDescriptor> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) {
        out.push_back(entry.descriptor);
    }
    return out;
}

Result<ToolArguments, Error> ToolRegistry::Validate(const std::string& name,
                                                    const nlohmann::json& arguments) const {
    const auto* entry = Find(name);
    if (entry == nullptr) {
        return Result<ToolArguments, Error>::Err(
            Error::NotFound("ToolRegistry", "Unknown tool: " + name));
    }
    auto normalized = ValidateArguments(entry->descriptor.input_schema, arguments);
    if (normalized.IsErr()) {
        return Result<ToolArguments, Error>::Err(normalized.Error());
    }
    return entry->parse(normalized.Value());
}

Result<Command, Error> ToolRegistry::Build(const std::string& name,
                                           const ToolArguments& arguments) const {
    const auto* entry = Find(name);
    if (entry == nullptr) {
        return Result<Command, Error>::Err(
            Error::NotFound("ToolRegistry", "Unknown tool: " + name));
    }
    if (!entry->build) {
        return Result<Command, Error>::Err(
            Error{"ToolRegistry", "tool '" + name + "' runs several commands",
                  std::nullopt, ErrorCategory::Unsupported});
    }
    return entry->build(arguments);
}

ToolResult ToolRegistry::Invoke(const std::string& name,
                                const ToolArguments& arguments,
                                ToolRunContext& context) const {
    const auto* entry = Find(name);
    if (entry == nullptr) {
        return ToolResult{true, {{"success", false}, {"error", "Unknown tool: " + name}}};
    }
    return ToolResult::FromJson(entry->invoke(arguments, context));
}

// ---------------------------------------------------------------------------
// SharedToolRegistry
// ---------------------------------------------------------------------------

SharedToolRegistry::SharedToolRegistry(std::shared_ptr<const ToolRegistry> initial)
    : current_(std::move(initial)) {}

std::shared_ptr<const ToolRegistry> SharedToolRegistry::Snapshot() const {
    return std::atomic_load(&current_);
}

void SharedToolRegistry::Reload(std::shared_ptr<const ToolRegistry> registry) {
    std::atomic_store(&current_, std::move(registry));
}

} // namespace sre_gateway
