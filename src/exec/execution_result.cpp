#include <sre_gateway/exec/command.hpp>
#include <sre_gateway/exec/execution_result.hpp>

#include <nlohmann/json.hpp>

namespace sre_gateway {

std::string Command::Display() const {
    std::string out;
    for (const auto& arg : argv) {
        if (!out.empty()) {
            out += ' ';
        }
        out += arg;
    }
    return out;
}

std::string FormatTimeout(std::chrono::milliseconds timeout) {
    const auto ms = timeout.count();
    if (ms % 1000 == 0) {
        return std::to_string(ms / 1000) + " seconds";
    }
    return std::to_string(ms) + "ms";
}

nlohmann::json ExecutionResult::ToJson() const {
    return nlohmann::json{
        {"success", succeeded},
        {"stdout", stdout_data},
        {"stderr", stderr_data},
        {"exitcode", exit_code},
        {"duration", static_cast<double>(duration.count()) / 1000.0},
    };
}

} // namespace sre_gateway
