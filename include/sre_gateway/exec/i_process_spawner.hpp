#pragma once

#include <sre_gateway/exec/cancellation.hpp>
#include <sre_gateway/exec/command.hpp>

#include <chrono>
#include <string>
#include <vector>

namespace sre_gateway {

// ---------------------------------------------------------------------------
// SpawnRequest — everything a spawner needs to run one Command.
// `environment` is the fully merged KEY=VALUE list for the child.
// ---------------------------------------------------------------------------
struct SpawnRequest {
    const Command& command;
    std::vector<std::string> environment;
    std::chrono::milliseconds kill_grace{2000};
    const CancellationToken* cancel = nullptr;
};

// ---------------------------------------------------------------------------
// SpawnOutcome — how the child ended. The child has been reaped.
// ---------------------------------------------------------------------------
enum class Termination {
    Exited,       // status holds the exit code
    Signaled,     // status holds the signal number
    TimedOut,
    Cancelled,
    SpawnFailed,  // error holds the diagnostic
};

struct SpawnOutcome {
    Termination termination = Termination::SpawnFailed;
    int status = 0;
    std::string stdout_data;
    std::string stderr_data;
    std::string error;
};

// ---------------------------------------------------------------------------
// IProcessSpawner — the OS seam of the process runner.
//
// Implementations must enforce command.timeout, honour the cancellation
// token, and never return while the child is still running.
// ---------------------------------------------------------------------------
class IProcessSpawner {
public:
    IProcessSpawner() = default;
    virtual ~IProcessSpawner() = default;

    IProcessSpawner(const IProcessSpawner&) = delete;
    IProcessSpawner& operator=(const IProcessSpawner&) = delete;
    IProcessSpawner(IProcessSpawner&&) = delete;
    IProcessSpawner& operator=(IProcessSpawner&&) = delete;

    [[nodiscard]] virtual SpawnOutcome Spawn(const SpawnRequest& request) = 0;
};

} // namespace sre_gateway
