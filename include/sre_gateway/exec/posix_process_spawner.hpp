#pragma once

#include <sre_gateway/exec/i_process_spawner.hpp>

namespace sre_gateway {

// ---------------------------------------------------------------------------
// PosixProcessSpawner — fork/exec with pipes for stdin, stdout and stderr.
//
// The child leads its own process group so that a timeout or cancellation
// can take down everything it started: SIGTERM to the group, SIGKILL after
// the grace period, then waitpid. stdin is written and stdout/stderr are
// drained from one poll loop, so no pipe can fill up and stall the child.
// ---------------------------------------------------------------------------
class PosixProcessSpawner : public IProcessSpawner {
public:
    PosixProcessSpawner();

    [[nodiscard]] SpawnOutcome Spawn(const SpawnRequest& request) override;
};

} // namespace sre_gateway
