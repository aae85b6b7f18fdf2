#include <sre_gateway/exec/process_runner.hpp>

#include <sre_gateway/core/log.hpp>

#include <algorithm>
#include <functional>

namespace sre_gateway {

namespace {

using Clock = std::chrono::steady_clock;

constexpr auto kAdmissionPoll = std::chrono::milliseconds(50);

std::chrono::milliseconds Since(Clock::time_point start) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

// Releases an admission slot on every exit path.
class SlotGuard {
public:
    explicit SlotGuard(std::function<void()> release) : release_(std::move(release)) {}
    ~SlotGuard() { release_(); }

    SlotGuard(const SlotGuard&) = delete;
    SlotGuard& operator=(const SlotGuard&) = delete;

private:
    std::function<void()> release_;
};

} // anonymous namespace

RunnerOptions RunnerOptions::FromConfig(const AppConfig& config) {
    RunnerOptions options;
    options.dry_run = config.execution.dry_run;
    options.max_concurrent_processes = config.execution.max_concurrent_processes;
    options.kill_grace = std::chrono::milliseconds(config.execution.kill_grace_ms);
    options.base_environment = config.environment;
    return options;
}

ProcessRunner::ProcessRunner(std::unique_ptr<IProcessSpawner> spawner,
                             RunnerOptions options)
    : spawner_(std::move(spawner)), options_(std::move(options)) {}

int ProcessRunner::RunningCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

bool ProcessRunner::AcquireSlot(Clock::time_point deadline,
                                const CancellationToken* cancel) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_ >= options_.max_concurrent_processes) {
        if (cancel != nullptr && cancel->IsCancelled()) {
            return false;
        }
        const auto now = Clock::now();
        if (now >= deadline) {
            return false;
        }
        slot_freed_.wait_until(lock, std::min(deadline, now + kAdmissionPoll));
    }
    ++running_;
    return true;
}

void ProcessRunner::ReleaseSlot() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --running_;
    }
    slot_freed_.notify_one();
}

std::vector<std::string> ProcessRunner::MergedEnvironment(const Command& command) const {
    Environment merged = options_.base_environment;
    for (const auto& [key, value] : command.environment) {
        merged[key] = value;
    }
    std::vector<std::string> out;
    out.reserve(merged.size());
    for (const auto& [key, value] : merged) {
        out.push_back(key + "=" + value);
    }
    return out;
}

ExecutionResult ProcessRunner::Run(const Command& command,
                                   const CancellationToken* cancel) {
    if (options_.dry_run) {
        LogInfo("exec", "DRY RUN: would execute: " + command.Display());
        ExecutionResult result;
        result.succeeded = true;
        result.exit_code = 0;
        result.stdout_data = "DRY RUN: " + command.Display();
        return result;
    }

    const auto start = Clock::now();

    if (command.argv.empty()) {
        return ExecutionResult::Failure("Command has no executable");
    }

    if (cancel != nullptr && cancel->IsCancelled()) {
        return ExecutionResult::Failure("Command cancelled");
    }

    if (!AcquireSlot(start + command.timeout, cancel)) {
        if (cancel != nullptr && cancel->IsCancelled()) {
            return ExecutionResult::Failure("Command cancelled", Since(start));
        }
        LogWarn("exec", "admission refused for: " + command.Display());
        return ExecutionResult::Failure(
            "Process limit reached (" + std::to_string(options_.max_concurrent_processes) +
                " running)",
            Since(start));
    }
    SlotGuard slot([this] { ReleaseSlot(); });

    LogDebug("exec", "run: " + command.Display() +
                         (command.working_directory.empty()
                              ? std::string()
                              : " (cwd " + command.working_directory + ")"));

    SpawnRequest request{command, MergedEnvironment(command), options_.kill_grace, cancel};
    SpawnOutcome outcome = spawner_->Spawn(request);

    ExecutionResult result;
    result.stdout_data = std::move(outcome.stdout_data);
    result.stderr_data = std::move(outcome.stderr_data);
    result.duration = Since(start);

    switch (outcome.termination) {
        case Termination::Exited:
            result.exit_code = outcome.status;
            result.succeeded = outcome.status == 0;
            break;
        case Termination::Signaled:
            result.exit_code = 128 + outcome.status;
            break;
        case Termination::TimedOut:
            result.exit_code = kNoExitCode;
            result.stdout_data.clear();
            result.stderr_data = "Command timed out after " + FormatTimeout(command.timeout);
            LogWarn("exec", "timeout after " + FormatTimeout(command.timeout) + ": " +
                                command.Display());
            break;
        case Termination::Cancelled:
            result.exit_code = kNoExitCode;
            result.stderr_data = "Command cancelled";
            LogInfo("exec", "cancelled: " + command.Display());
            break;
        case Termination::SpawnFailed:
            result.exit_code = kNoExitCode;
            result.stderr_data = outcome.error;
            LogError("exec", "spawn failed: " + outcome.error);
            break;
    }

    LogDebug("exec", command.argv.front() + " exit " + std::to_string(result.exit_code) +
                         " in " + std::to_string(result.duration.count()) + "ms");
    return result;
}

} // namespace sre_gateway
