#pragma once

#include <sre_gateway/mcp/session.hpp>
#include <sre_gateway/mcp/tool_registry.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace sre_gateway {

class ProcessRunner;

// ---------------------------------------------------------------------------
// McpDispatcher — MCP 2024-11-05 over JSON-RPC 2.0, independent of the
// transport.
//
// Methods:
//   - initialize
//   - tools/list, tools/call
//   - resources/list, resources/read
//   - notifications/initialized, notifications/cancelled (no response)
//
// Every handler fault is turned into a JSON-RPC error here; nothing
// escapes HandleMessage. Notifications never produce a response.
// ---------------------------------------------------------------------------
class McpDispatcher {
public:
    static constexpr const char* kProtocolVersion = "2024-11-05";

    /// Supplies the redacted configuration shown by config://main.
    using ConfigView = std::function<nlohmann::json()>;

    McpDispatcher(std::shared_ptr<SharedToolRegistry> registry, ProcessRunner& runner,
                  ConfigView config_view = {});

    /// Parses one text frame. Malformed JSON yields a -32700 error with a
    /// null id.
    [[nodiscard]] std::optional<nlohmann::json> HandleText(const std::string& raw,
                                                           Session& session);

    /// Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(const nlohmann::json& message,
                                                              Session& session);

    /// Applies a notifications/cancelled message immediately. Transports
    /// call this on arrival so the cancel reaches a call that is still
    /// running. Returns true when `message` was such a notification.
    static bool ApplyCancellation(const nlohmann::json& message, Session& session);

    [[nodiscard]] static nlohmann::json ServerInfo();
    [[nodiscard]] static nlohmann::json MakeError(const nlohmann::json& id, int code,
                                                  const std::string& message);
    [[nodiscard]] static nlohmann::json MakeResult(const nlohmann::json& id,
                                                   const nlohmann::json& result);

private:
    nlohmann::json Route(const std::string& method, const nlohmann::json& params,
                         const nlohmann::json& id, Session& session);

    nlohmann::json HandleInitialize(const nlohmann::json& params, const nlohmann::json& id,
                                    Session& session);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params, const nlohmann::json& id,
                                   Session& session);
    nlohmann::json HandleResourcesList(const nlohmann::json& id);
    nlohmann::json HandleResourcesRead(const nlohmann::json& params, const nlohmann::json& id);

    nlohmann::json ReadResource(const std::string& uri) const;

    static nlohmann::json Capabilities();
    static nlohmann::json ResourceDescriptors();

    std::shared_ptr<SharedToolRegistry> registry_;
    ProcessRunner& runner_;
    ConfigView config_view_;
};

} // namespace sre_gateway
