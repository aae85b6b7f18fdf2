#pragma once

#include <sre_gateway/config/app_config.hpp>
#include <sre_gateway/exec/cancellation.hpp>
#include <sre_gateway/exec/command.hpp>
#include <sre_gateway/exec/execution_result.hpp>
#include <sre_gateway/exec/i_process_spawner.hpp>

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sre_gateway {

struct RunnerOptions {
    bool dry_run = false;
    int max_concurrent_processes = 16;
    std::chrono::milliseconds kill_grace{2000};
    Environment base_environment;

    static RunnerOptions FromConfig(const AppConfig& config);
};

// ---------------------------------------------------------------------------
// ProcessRunner — runs one Command to completion and reports the outcome as
// an ExecutionResult. Never throws; every failure is data.
//
// Dry-run is decided before anything else: nothing is spawned and the
// result echoes the command line. Live runs pass an admission gate that
// bounds concurrently running children; a caller waits for a slot at most
// as long as the command's own timeout.
//
// Thread-safe: one runner serves all transports.
// ---------------------------------------------------------------------------
class ProcessRunner {
public:
    ProcessRunner(std::unique_ptr<IProcessSpawner> spawner, RunnerOptions options);

    ProcessRunner(const ProcessRunner&) = delete;
    ProcessRunner& operator=(const ProcessRunner&) = delete;

    [[nodiscard]] ExecutionResult Run(const Command& command,
                                      const CancellationToken* cancel = nullptr);

    [[nodiscard]] bool DryRun() const noexcept { return options_.dry_run; }
    [[nodiscard]] int RunningCount();

private:
    bool AcquireSlot(std::chrono::steady_clock::time_point deadline,
                     const CancellationToken* cancel);
    void ReleaseSlot();
    std::vector<std::string> MergedEnvironment(const Command& command) const;

    std::unique_ptr<IProcessSpawner> spawner_;
    RunnerOptions options_;

    std::mutex mutex_;
    std::condition_variable slot_freed_;
    int running_ = 0;
};

} // namespace sre_gateway
