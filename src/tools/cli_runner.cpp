#include <sre_gateway/tools/cli_runner.hpp>

#include <sre_gateway/core/log.hpp>
#include <sre_gateway/exec/scoped_secret_file.hpp>
#include <sre_gateway/tools/command_builders.hpp>

#include "tool_utils.hpp"

#include <optional>
#include <set>

namespace sre_gateway {

using tool_utils::Failure;

namespace {

constexpr const char* kComponent = "cli";

std::vector<std::string> ArgumentList(const nlohmann::json& args) {
    if (args.is_string()) {
        return tool_utils::SplitWhitespace(args.get<std::string>());
    }
    std::vector<std::string> out;
    if (args.is_array()) {
        for (const auto& arg : args) {
            out.push_back(arg.is_string() ? arg.get<std::string>() : arg.dump());
        }
    }
    return out;
}

std::optional<std::string> OptionalString(const nlohmann::json& params, const char* key) {
    if (params.is_object() && params.contains(key) && params[key].is_string()) {
        return params[key].get<std::string>();
    }
    return std::nullopt;
}

} // anonymous namespace

CliToolRunner::CliToolRunner(ToolSettings settings, std::shared_ptr<const CliCatalog> catalog)
    : settings_(std::move(settings)), catalog_(std::move(catalog)) {}

std::string CliToolRunner::WorkingDirectory(const nlohmann::json& params) const {
    return OptionalString(params, "cwd").value_or(settings_.workdir);
}

nlohmann::json CliToolRunner::Run(const std::string& tool, const nlohmann::json& params,
                                  ToolRunContext& context) const {
    if (!catalog_->IsActive(tool)) {
        return Failure("Unknown CLI tool: " + tool + ". Available tools: " +
                       nlohmann::json(catalog_->ActiveNames()).dump());
    }
    if (tool == "sops") {
        return RunSops(params, context);
    }

    std::vector<std::string> argv{catalog_->Find(tool)->executable};
    if (params.is_object() && params.contains("args")) {
        auto args = ArgumentList(params["args"]);
        argv.insert(argv.end(), args.begin(), args.end());
    }
    if (params.is_object() && params.contains("flags")) {
        AppendFlags(argv, params["flags"], "-");
    }

    auto cmd = BaseCommand(settings_, std::move(argv));
    cmd.working_directory = WorkingDirectory(params);
    cmd.stdin_data = OptionalString(params, "input");

    return tool_utils::Run(context, cmd).ToJson();
}

nlohmann::json CliToolRunner::RunSops(const nlohmann::json& params,
                                      ToolRunContext& context) const {
    static const std::set<std::string> kOperations = {"encrypt", "decrypt", "version"};

    const auto operation = OptionalString(params, "operation").value_or("encrypt");
    auto fail = [&operation](const std::string& message) {
        auto out = Failure(message);
        out["operation"] = operation;
        return out;
    };

    if (!settings_.sops_enabled) {
        return fail("SOPS support is disabled (secrets.sops_enabled)");
    }
    if (kOperations.count(operation) == 0) {
        return fail("Unknown SOPS operation: " + operation +
                    ". Available: encrypt, decrypt, version");
    }

    std::vector<std::string> argv{"sops", operation};
    auto cmd = BaseCommand(settings_, {});
    cmd.working_directory = WorkingDirectory(params);

    std::optional<ScopedSecretFile> key_file;
    std::optional<ScopedSecretFile> data_file;

    if (operation != "version") {
        const auto age_key = OptionalString(params, "age_key").value_or(settings_.age_key);
        if (age_key.empty()) {
            return fail("AGE key not provided. Set SOPS_AGE_KEY or pass age_key in params.");
        }
        auto created = ScopedSecretFile::Create(age_key, "sops-age-key-");
        if (created.IsErr()) {
            return fail(created.Error().message);
        }
        key_file.emplace(std::move(created).Value());
        cmd.environment["SOPS_AGE_KEY_FILE"] = key_file->Path();

        if (auto recipient = OptionalString(params, "recipient")) {
            argv.push_back("--age");
            argv.push_back(*recipient);
        }
    }

    if (params.is_object() && params.contains("flags")) {
        AppendFlags(argv, params["flags"], "--");
    }

    if (auto file = OptionalString(params, "file")) {
        argv.push_back(*file);
    } else if (auto data = OptionalString(params, "data")) {
        auto created = ScopedSecretFile::Create(*data, "sops-input-");
        if (created.IsErr()) {
            return fail(created.Error().message);
        }
        data_file.emplace(std::move(created).Value());
        argv.push_back(data_file->Path());
    }

    cmd.argv = std::move(argv);
    LogDebug(kComponent, "sops " + operation);

    auto result = tool_utils::Run(context, cmd).ToJson();
    result["operation"] = operation;
    return result;
}

nlohmann::json CliToolRunner::RunChain(const nlohmann::json& commands,
                                       ToolRunContext& context) const {
    if (!commands.is_array() || commands.empty()) {
        return Failure("No commands provided");
    }

    nlohmann::json results = nlohmann::json::array();
    std::string carried;

    for (size_t i = 0; i < commands.size(); ++i) {
        const auto& step = commands[i];
        auto tool = OptionalString(step, "tool");
        if (!tool || tool->empty()) {
            return Failure("Command " + std::to_string(i) + ": tool not specified");
        }

        nlohmann::json params = step;
        if (!carried.empty()) {
            params["input"] = carried;
        }

        auto result = Run(*tool, params, context);
        results.push_back(result);

        if (!result.value("success", false)) {
            std::string reason = result.value("stderr", std::string());
            if (reason.empty()) {
                reason = result.value("error", std::string());
            }
            auto out = Failure("Command " + std::to_string(i) + " failed: " + reason);
            out["results"] = std::move(results);
            return out;
        }
        carried = result.value("stdout", std::string());
    }

    return {
        {"success", true},
        {"results", results},
        {"final_output", carried},
    };
}

} // namespace sre_gateway
