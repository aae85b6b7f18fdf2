#include <sre_gateway/tools/git_workflows.hpp>

#include <sre_gateway/core/log.hpp>
#include <sre_gateway/tools/command_builders.hpp>

#include "tool_utils.hpp"

#include <filesystem>
#include <system_error>

namespace sre_gateway {

using tool_utils::Failure;
using tool_utils::Trim;

namespace {

constexpr const char* kComponent = "git";

bool RepositoryExists(const std::string& repo_path) {
    std::error_code ec;
    return std::filesystem::exists(std::filesystem::path(repo_path) / ".git", ec);
}

nlohmann::json MissingRepository(const std::string& repo_path) {
    return Failure("Git repository not found at " + repo_path +
                   ". Make sure the repository is cloned or git.repo_path is configured.");
}

Command Git(const ToolSettings& settings, std::vector<std::string> args) {
    args.insert(args.begin(), "git");
    auto cmd = BaseCommand(settings, std::move(args));
    cmd.working_directory = settings.repo_path;
    return cmd;
}

std::string ResolveBranch(const ToolSettings& settings,
                          const std::optional<std::string>& requested,
                          ToolRunContext& context) {
    if (requested && !requested->empty()) {
        return *requested;
    }
    auto current = tool_utils::Run(context, Git(settings, {"branch", "--show-current"}));
    auto branch = Trim(current.stdout_data);
    if (!current.succeeded || branch.empty()) {
        return "main";
    }
    return branch;
}

// Trimmed stdout when the step succeeded, empty otherwise.
std::string StdoutIfOk(const ExecutionResult& result) {
    return result.succeeded ? Trim(result.stdout_data) : std::string();
}

} // anonymous namespace

nlohmann::json GitPullWorkflow(const ToolSettings& settings, const GitPullArgs& args,
                               ToolRunContext& context) {
    if (!RepositoryExists(settings.repo_path)) {
        return MissingRepository(settings.repo_path);
    }

    const auto branch = ResolveBranch(settings, args.branch, context);

    auto fetch = tool_utils::Run(context, Git(settings, {"fetch", "origin"}));
    if (!fetch.succeeded) {
        return Failure("Failed to fetch from origin: " + fetch.stderr_data);
    }

    if (args.force) {
        auto reset = tool_utils::Run(context,
                                     Git(settings, {"reset", "--hard", "origin/" + branch}));
        if (!reset.succeeded) {
            return Failure("Failed to reset to origin/" + branch + ": " + reset.stderr_data);
        }
    } else {
        auto pull = tool_utils::Run(context, Git(settings, {"pull", "origin", branch}));
        if (!pull.succeeded) {
            return Failure("Failed to pull from origin/" + branch + ": " + pull.stderr_data);
        }
    }

    auto status = tool_utils::Run(context, Git(settings, {"status", "--porcelain"}));
    auto last = tool_utils::Run(context, Git(settings, {"log", "--oneline", "-1"}));

    LogInfo(kComponent, "pulled origin/" + branch + (args.force ? " (forced)" : ""));
    return {
        {"success", true},
        {"branch", branch},
        {"force", args.force},
        {"status", StdoutIfOk(status)},
        {"latest_commit", StdoutIfOk(last)},
        {"message", "Successfully pulled latest changes from origin/" + branch},
    };
}

nlohmann::json GitCommitWorkflow(const ToolSettings& settings, const GitCommitArgs& args,
                                 ToolRunContext& context) {
    if (!RepositoryExists(settings.repo_path)) {
        return MissingRepository(settings.repo_path);
    }

    auto status = tool_utils::Run(context, Git(settings, {"status", "--porcelain"}));
    if (!status.succeeded || Trim(status.stdout_data).empty()) {
        return {
            {"success", true},
            {"message", "No changes to commit"},
            {"status", Trim(status.stdout_data)},
        };
    }

    std::vector<std::string> add{"add"};
    if (args.all) {
        add.push_back("-A");
    } else if (!args.files.empty()) {
        add.push_back("--");
        add.insert(add.end(), args.files.begin(), args.files.end());
    } else {
        add.push_back("-u");
    }
    auto staged = tool_utils::Run(context, Git(settings, std::move(add)));
    if (!staged.succeeded) {
        return Failure("Failed to stage files: " + staged.stderr_data);
    }

    auto commit = tool_utils::Run(context, Git(settings, {"commit", "-m", args.message}));
    if (!commit.succeeded) {
        return Failure("Failed to commit: " + commit.stderr_data);
    }

    auto head = tool_utils::Run(context, Git(settings, {"rev-parse", "HEAD"}));

    nlohmann::json files_committed = "all modified files";
    if (!args.files.empty() && !args.all) {
        files_committed = args.files;
    }
    LogInfo(kComponent, "committed: " + args.message);
    return {
        {"success", true},
        {"message", "Successfully committed: " + args.message},
        {"commit_hash", StdoutIfOk(head)},
        {"files_committed", files_committed},
    };
}

nlohmann::json GitPushWorkflow(const ToolSettings& settings, const GitPushArgs& args,
                               ToolRunContext& context) {
    if (!RepositoryExists(settings.repo_path)) {
        return MissingRepository(settings.repo_path);
    }

    const auto branch = ResolveBranch(settings, args.branch, context);

    auto pending = tool_utils::Run(
        context, Git(settings, {"log", "origin/" + branch + "..HEAD", "--oneline"}));
    const auto commits = Trim(pending.stdout_data);
    if (commits.empty()) {
        return {
            {"success", true},
            {"message", "No commits to push to origin/" + branch},
            {"branch", branch},
        };
    }

    std::vector<std::string> push{"push", "origin", branch};
    if (args.force) {
        push.push_back("--force");
    }
    auto pushed = tool_utils::Run(context, Git(settings, std::move(push)));
    if (!pushed.succeeded) {
        return Failure("Failed to push to origin/" + branch + ": " + pushed.stderr_data);
    }

    LogInfo(kComponent, "pushed to origin/" + branch + (args.force ? " (forced)" : ""));
    return {
        {"success", true},
        {"message", "Successfully pushed to origin/" + branch},
        {"branch", branch},
        {"force", args.force},
        {"commits_pushed", commits},
    };
}

} // namespace sre_gateway
