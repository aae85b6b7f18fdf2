#pragma once

#include <sre_gateway/core/result.hpp>
#include <sre_gateway/exec/cancellation.hpp>
#include <sre_gateway/exec/command.hpp>
#include <sre_gateway/tools/tool_arguments.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace sre_gateway {

class ProcessRunner;

// ---------------------------------------------------------------------------
// ToolDescriptor — name, description and JSON Schema of one tool, as
// advertised by tools/list.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object

    [[nodiscard]] nlohmann::json ToJson() const;
};

// ---------------------------------------------------------------------------
// ToolResult — structured outcome of one tool invocation. `content` is the
// tool's own JSON object; is_error mirrors its "success": false.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content;

    static ToolResult FromJson(nlohmann::json content);
};

// Everything a tool may touch while it runs.
struct ToolRunContext {
    ProcessRunner& runner;
    const CancellationToken* cancel = nullptr;
};

// ---------------------------------------------------------------------------
// ToolBinding<Args> — the typed pieces of one tool.
//   parse:  validated JSON arguments -> Args
//   build:  Args -> Command (only for tools that are a single command)
//   invoke: Args + run context -> result JSON
// ---------------------------------------------------------------------------
template <typename Args>
struct ToolBinding {
    ToolDescriptor descriptor;
    std::function<Result<Args, Error>(const nlohmann::json&)> parse;
    std::function<Command(const Args&)> build;
    std::function<nlohmann::json(const Args&, ToolRunContext&)> invoke;
};

// ---------------------------------------------------------------------------
// ToolRegistry — immutable-after-construction set of tools, kept in
// registration order. Concurrent readers are safe once populated.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    template <typename Args>
    void Register(ToolBinding<Args> binding);

    [[nodiscard]] const ToolDescriptor* Lookup(const std::string& name) const;
    [[nodiscard]] std::vector<ToolDescriptor> Descriptors() const;
    [[nodiscard]] size_t Size() const noexcept { return entries_.size(); }

    /// Schema validation followed by typed parsing.
    [[nodiscard]] Result<ToolArguments, Error> Validate(
        const std::string& name, const nlohmann::json& arguments) const;

    /// Command for single-command tools; Unsupported for workflow tools.
    [[nodiscard]] Result<Command, Error> Build(const std::string& name,
                                               const ToolArguments& arguments) const;

    /// Runs the tool. Handler exceptions propagate to the caller.
    [[nodiscard]] ToolResult Invoke(const std::string& name,
                                    const ToolArguments& arguments,
                                    ToolRunContext& context) const;

private:
    struct Entry {
        ToolDescriptor descriptor;
        std::function<Result<ToolArguments, Error>(const nlohmann::json&)> parse;
        std::function<Result<Command, Error>(const ToolArguments&)> build;  // may be empty
        std::function<nlohmann::json(const ToolArguments&, ToolRunContext&)> invoke;
    };

    const Entry* Find(const std::string& name) const;
    static Error ArgumentMismatch(const std::string& name);

    std::vector<Entry> entries_;
    std::map<std::string, size_t> index_;
};

template <typename Args>
void ToolRegistry::Register(ToolBinding<Args> binding) {
    Entry entry;
    entry.descriptor = binding.descriptor;
    const std::string name = binding.descriptor.name;

    entry.parse = [parse = binding.parse](const nlohmann::json& json)
        -> Result<ToolArguments, Error> {
        auto typed = parse(json);
        if (typed.IsErr()) {
            return Result<ToolArguments, Error>::Err(typed.Error());
        }
        return Result<ToolArguments, Error>::Ok(ToolArguments(std::move(typed).Value()));
    };

    if (binding.build) {
        entry.build = [build = binding.build, name](const ToolArguments& args)
            -> Result<Command, Error> {
            const auto* typed = std::get_if<Args>(&args);
            if (typed == nullptr) {
                return Result<Command, Error>::Err(ArgumentMismatch(name));
            }
            return Result<Command, Error>::Ok(build(*typed));
        };
    }

    entry.invoke = [invoke = binding.invoke, name](const ToolArguments& args,
                                                   ToolRunContext& context) {
        const auto* typed = std::get_if<Args>(&args);
        if (typed == nullptr) {
            return ArgumentMismatch(name).ToJson();
        }
        return invoke(*typed, context);
    };

    auto existing = index_.find(name);
    if (existing != index_.end()) {
        entries_[existing->second] = std::move(entry);
        return;
    }
    index_[name] = entries_.size();
    entries_.push_back(std::move(entry));
}

// ---------------------------------------------------------------------------
// SharedToolRegistry — the registry all sessions read. Readers take a
// snapshot per call; Reload publishes a new registry atomically.
// ---------------------------------------------------------------------------
class SharedToolRegistry {
public:
    explicit SharedToolRegistry(std::shared_ptr<const ToolRegistry> initial);

    [[nodiscard]] std::shared_ptr<const ToolRegistry> Snapshot() const;
    void Reload(std::shared_ptr<const ToolRegistry> registry);

private:
    std::shared_ptr<const ToolRegistry> current_;
};

} // namespace sre_gateway
