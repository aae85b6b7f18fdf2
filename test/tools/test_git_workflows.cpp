#include <catch2/catch_test_macros.hpp>

#include <sre_gateway/exec/process_runner.hpp>
#include <sre_gateway/tools/git_workflows.hpp>

#include "../mocks/mock_process_spawner.hpp"

#include <filesystem>
#include <memory>
#include <string>

#include <unistd.h>

using namespace sre_gateway;
using sre_gateway::testing::MockProcessSpawner;
using Argv = std::vector<std::string>;

namespace {

// Scratch directory with an empty .git folder; no real git repository is
// needed because every git call goes to the mock spawner.
class FakeRepository {
public:
    explicit FakeRepository(const std::string& name) {
        path_ = std::filesystem::temp_directory_path() /
                ("sre_gateway_git_" + std::to_string(::getpid()) + "_" + name);
        std::filesystem::create_directories(path_ / ".git");
    }
    ~FakeRepository() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    FakeRepository(const FakeRepository&) = delete;
    FakeRepository& operator=(const FakeRepository&) = delete;

    [[nodiscard]] std::string Path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

struct WorkflowFixture {
    explicit WorkflowFixture(const std::string& name)
        : repo(name), runner(MakeSpawner(), RunnerOptions{}), context{runner} {
        settings.repo_path = repo.Path();
    }

    std::unique_ptr<IProcessSpawner> MakeSpawner() {
        auto spawner = std::make_unique<MockProcessSpawner>();
        spy = spawner.get();
        return spawner;
    }

    FakeRepository repo;
    MockProcessSpawner* spy = nullptr;
    ProcessRunner runner;
    ToolRunContext context;
    ToolSettings settings;
};

} // anonymous namespace

// ===========================================================================
// Missing repository
// ===========================================================================

TEST_CASE("Git workflows: missing repository fails without running git", "[tools][git]") {
    auto spawner = std::make_unique<MockProcessSpawner>();
    auto* spy = spawner.get();
    ProcessRunner runner(std::move(spawner), RunnerOptions{});
    ToolRunContext context{runner};
    ToolSettings settings;
    settings.repo_path = "/nonexistent/sre-gateway-repo";

    auto pull = GitPullWorkflow(settings, GitPullArgs{}, context);
    auto commit = GitCommitWorkflow(settings, GitCommitArgs{"msg", {}, false}, context);
    auto push = GitPushWorkflow(settings, GitPushArgs{}, context);

    for (const auto& result : {pull, commit, push}) {
        CHECK(result["success"] == false);
        CHECK(result["error"].get<std::string>().find(
                  "Git repository not found at /nonexistent/sre-gateway-repo") == 0);
    }
    CHECK(spy->CallCount() == 0);
}

// ===========================================================================
// git_pull
// ===========================================================================

TEST_CASE("GitPullWorkflow: current branch, fetch, pull", "[tools][git][pull]") {
    WorkflowFixture f("pull");
    f.spy->Enqueue(MockProcessSpawner::Exit(0, "develop\n"));   // branch --show-current
    f.spy->Enqueue(MockProcessSpawner::Exit(0));                // fetch
    f.spy->Enqueue(MockProcessSpawner::Exit(0, "Already up to date.\n"));
    f.spy->Enqueue(MockProcessSpawner::Exit(0, ""));            // status
    f.spy->Enqueue(MockProcessSpawner::Exit(0, "abc123 Bump image\n"));

    auto result = GitPullWorkflow(f.settings, GitPullArgs{}, f.context);

    CHECK(result["success"] == true);
    CHECK(result["branch"] == "develop");
    CHECK(result["force"] == false);
    CHECK(result["latest_commit"] == "abc123 Bump image");
    CHECK(result["message"] == "Successfully pulled latest changes from origin/develop");

    auto argvs = f.spy->Argvs();
    REQUIRE(argvs.size() == 5);
    CHECK(argvs[0] == Argv{"git", "branch", "--show-current"});
    CHECK(argvs[1] == Argv{"git", "fetch", "origin"});
    CHECK(argvs[2] == Argv{"git", "pull", "origin", "develop"});
    for (const auto& call : f.spy->Calls()) {
        CHECK(call.command.working_directory == f.repo.Path());
    }
}

TEST_CASE("GitPullWorkflow: force resets to the remote branch", "[tools][git][pull]") {
    WorkflowFixture f("pull_force");
    auto result = GitPullWorkflow(f.settings, GitPullArgs{std::string("main"), true}, f.context);

    CHECK(result["success"] == true);
    auto argvs = f.spy->Argvs();
    REQUIRE(argvs.size() >= 2);
    CHECK(argvs[0] == Argv{"git", "fetch", "origin"});
    CHECK(argvs[1] == Argv{"git", "reset", "--hard", "origin/main"});
}

TEST_CASE("GitPullWorkflow: unknown current branch falls back to main", "[tools][git][pull]") {
    WorkflowFixture f("pull_main");
    f.spy->Enqueue(MockProcessSpawner::Exit(128, "", "fatal: not a git repository"));

    auto result = GitPullWorkflow(f.settings, GitPullArgs{}, f.context);
    CHECK(result["branch"] == "main");
}

TEST_CASE("GitPullWorkflow: fetch failure stops the workflow", "[tools][git][pull]") {
    WorkflowFixture f("pull_fetch");
    f.spy->Enqueue(MockProcessSpawner::Exit(1, "", "could not resolve host"));

    auto result = GitPullWorkflow(f.settings, GitPullArgs{std::string("main"), false}, f.context);
    CHECK(result["success"] == false);
    CHECK(result["error"] == "Failed to fetch from origin: could not resolve host");
    CHECK(f.spy->CallCount() == 1);
}

// ===========================================================================
// git_commit
// ===========================================================================

TEST_CASE("GitCommitWorkflow: clean tree has nothing to commit", "[tools][git][commit]") {
    WorkflowFixture f("commit_clean");
    f.spy->Enqueue(MockProcessSpawner::Exit(0, ""));

    auto result = GitCommitWorkflow(f.settings, GitCommitArgs{"msg", {}, false}, f.context);
    CHECK(result["success"] == true);
    CHECK(result["message"] == "No changes to commit");
    CHECK(f.spy->CallCount() == 1);
}

TEST_CASE("GitCommitWorkflow: named files are staged and committed", "[tools][git][commit]") {
    WorkflowFixture f("commit_files");
    f.spy->Enqueue(MockProcessSpawner::Exit(0, " M apps/web.yaml\n"));
    f.spy->Enqueue(MockProcessSpawner::Exit(0));
    f.spy->Enqueue(MockProcessSpawner::Exit(0));
    f.spy->Enqueue(MockProcessSpawner::Exit(0, "0123abcd\n"));

    GitCommitArgs args{"Scale web", {"apps/web.yaml"}, false};
    auto result = GitCommitWorkflow(f.settings, args, f.context);

    CHECK(result["success"] == true);
    CHECK(result["message"] == "Successfully committed: Scale web");
    CHECK(result["commit_hash"] == "0123abcd");
    CHECK(result["files_committed"] == nlohmann::json::array({"apps/web.yaml"}));

    auto argvs = f.spy->Argvs();
    REQUIRE(argvs.size() == 4);
    CHECK(argvs[1] == Argv{"git", "add", "--", "apps/web.yaml"});
    CHECK(argvs[2] == Argv{"git", "commit", "-m", "Scale web"});
    CHECK(argvs[3] == Argv{"git", "rev-parse", "HEAD"});
}

TEST_CASE("GitCommitWorkflow: all stages everything", "[tools][git][commit]") {
    WorkflowFixture f("commit_all");
    f.spy->Enqueue(MockProcessSpawner::Exit(0, "?? new.yaml\n"));

    auto result = GitCommitWorkflow(f.settings, GitCommitArgs{"Add", {}, true}, f.context);
    CHECK(result["files_committed"] == "all modified files");
    CHECK(f.spy->Argvs()[1] == Argv{"git", "add", "-A"});
}

TEST_CASE("GitCommitWorkflow: default stages tracked files only", "[tools][git][commit]") {
    WorkflowFixture f("commit_tracked");
    f.spy->Enqueue(MockProcessSpawner::Exit(0, " M a.yaml\n"));

    (void)GitCommitWorkflow(f.settings, GitCommitArgs{"Update", {}, false}, f.context);
    CHECK(f.spy->Argvs()[1] == Argv{"git", "add", "-u"});
}

TEST_CASE("GitCommitWorkflow: commit failure is reported", "[tools][git][commit]") {
    WorkflowFixture f("commit_fail");
    f.spy->Enqueue(MockProcessSpawner::Exit(0, " M a.yaml\n"));
    f.spy->Enqueue(MockProcessSpawner::Exit(0));
    f.spy->Enqueue(MockProcessSpawner::Exit(1, "", "Please tell me who you are"));

    auto result = GitCommitWorkflow(f.settings, GitCommitArgs{"x", {}, false}, f.context);
    CHECK(result["success"] == false);
    CHECK(result["error"] == "Failed to commit: Please tell me who you are");
}

// ===========================================================================
// git_push
// ===========================================================================

TEST_CASE("GitPushWorkflow: nothing pending is a no-op", "[tools][git][push]") {
    WorkflowFixture f("push_none");
    f.spy->Enqueue(MockProcessSpawner::Exit(0, ""));

    auto result = GitPushWorkflow(f.settings, GitPushArgs{std::string("main"), false}, f.context);
    CHECK(result["success"] == true);
    CHECK(result["message"] == "No commits to push to origin/main");
    CHECK(f.spy->CallCount() == 1);
    CHECK(f.spy->Argvs()[0] == Argv{"git", "log", "origin/main..HEAD", "--oneline"});
}

TEST_CASE("GitPushWorkflow: pending commits are pushed with force", "[tools][git][push]") {
    WorkflowFixture f("push_force");
    f.spy->Enqueue(MockProcessSpawner::Exit(0, "abc123 one\ndef456 two\n"));
    f.spy->Enqueue(MockProcessSpawner::Exit(0));

    auto result = GitPushWorkflow(f.settings, GitPushArgs{std::string("main"), true}, f.context);
    CHECK(result["success"] == true);
    CHECK(result["force"] == true);
    CHECK(result["commits_pushed"] == "abc123 one\ndef456 two");
    CHECK(f.spy->Argvs()[1] == Argv{"git", "push", "origin", "main", "--force"});
}

TEST_CASE("GitPushWorkflow: push failure is reported", "[tools][git][push]") {
    WorkflowFixture f("push_fail");
    f.spy->Enqueue(MockProcessSpawner::Exit(0, "abc123 one\n"));
    f.spy->Enqueue(MockProcessSpawner::Exit(1, "", "rejected"));

    auto result = GitPushWorkflow(f.settings, GitPushArgs{std::string("main"), false}, f.context);
    CHECK(result["success"] == false);
    CHECK(result["error"] == "Failed to push to origin/main: rejected");
}
