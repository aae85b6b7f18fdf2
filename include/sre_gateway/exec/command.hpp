#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sre_gateway {

// ---------------------------------------------------------------------------
// Command — one external process invocation. argv[0] is the executable,
// resolved through PATH. An empty working_directory inherits the gateway's.
// ---------------------------------------------------------------------------
struct Command {
    std::vector<std::string> argv;
    std::string working_directory;
    std::map<std::string, std::string> environment;  // merged over the base env
    std::chrono::milliseconds timeout{std::chrono::seconds(60)};
    std::optional<std::string> stdin_data;

    /// argv joined by single spaces.
    [[nodiscard]] std::string Display() const;
};

/// "60 seconds" for whole seconds, "250ms" otherwise.
std::string FormatTimeout(std::chrono::milliseconds timeout);

} // namespace sre_gateway
