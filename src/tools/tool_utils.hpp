#pragma once

#include <sre_gateway/exec/process_runner.hpp>
#include <sre_gateway/mcp/tool_registry.hpp>

#include <cctype>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace sre_gateway::tool_utils {

inline std::string Trim(std::string_view text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) {
        ++begin;
    }
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
        --end;
    }
    return std::string(text.substr(begin, end - begin));
}

inline std::vector<std::string> SplitWhitespace(const std::string& text) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string word;
    while (in >> word) {
        out.push_back(word);
    }
    return out;
}

inline ExecutionResult Run(ToolRunContext& context, const Command& command) {
    return context.runner.Run(command, context.cancel);
}

inline nlohmann::json Failure(const std::string& message) {
    return {{"success", false}, {"error", message}};
}

} // namespace sre_gateway::tool_utils
