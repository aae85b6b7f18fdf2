#pragma once

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <string>
#include <utility>

namespace sre_gateway {

// Exit code used when no process exit status exists (timeout, cancellation,
// spawn failure, admission refusal).
constexpr int kNoExitCode = -1;

// ---------------------------------------------------------------------------
// ExecutionResult — outcome of exactly one Command.
// ---------------------------------------------------------------------------
struct ExecutionResult {
    bool succeeded = false;  // exit_code == 0 and no timeout or spawn error
    std::string stdout_data;
    std::string stderr_data;
    int exit_code = kNoExitCode;
    std::chrono::milliseconds duration{0};

    static ExecutionResult Failure(std::string stderr_text,
                                   std::chrono::milliseconds duration = {}) {
        ExecutionResult r;
        r.stderr_data = std::move(stderr_text);
        r.duration = duration;
        return r;
    }

    /// {"success", "stdout", "stderr", "exitcode", "duration" (seconds)}
    [[nodiscard]] nlohmann::json ToJson() const;
};

} // namespace sre_gateway
