#include <sre_gateway/mcp/mcp_dispatcher.hpp>

#include <sre_gateway/core/log.hpp>
#include <sre_gateway/core/timestamp.hpp>
#include <sre_gateway/core/version.hpp>

#include <optional>
#include <string>

namespace sre_gateway {

namespace {

constexpr const char* kComponent = "mcp";

bool IsValidId(const nlohmann::json& id) {
    return id.is_string() || id.is_number() || id.is_null();
}

// Removes the call from the session's in-flight table on every exit path.
class InFlightCall {
public:
    InFlightCall(Session& session, const nlohmann::json& id)
        : session_(session), id_(id), token_(session.BeginCall(id)) {}
    ~InFlightCall() { session_.EndCall(id_); }

    InFlightCall(const InFlightCall&) = delete;
    InFlightCall& operator=(const InFlightCall&) = delete;

    [[nodiscard]] const CancellationToken* Token() const noexcept { return token_.get(); }

private:
    Session& session_;
    nlohmann::json id_;
    std::shared_ptr<CancellationToken> token_;
};

} // anonymous namespace

McpDispatcher::McpDispatcher(std::shared_ptr<SharedToolRegistry> registry,
                             ProcessRunner& runner, ConfigView config_view)
    : registry_(std::move(registry)), runner_(runner), config_view_(std::move(config_view)) {}

std::optional<nlohmann::json> McpDispatcher::HandleText(const std::string& raw,
                                                        Session& session) {
    auto message = nlohmann::json::parse(raw, nullptr, false);
    if (message.is_discarded()) {
        LogDebug(kComponent, "session " + session.Id() + ": unparseable message");
        return MakeError(nullptr, rpc_code::kParseError, "Parse error");
    }
    return HandleMessage(message, session);
}

std::optional<nlohmann::json> McpDispatcher::HandleMessage(const nlohmann::json& message,
                                                           Session& session) {
    if (!message.is_object()) {
        return MakeError(nullptr, rpc_code::kInvalidRequest, "Invalid Request");
    }

    const bool has_id = message.contains("id");
    const nlohmann::json id = has_id && IsValidId(message["id"]) ? message["id"]
                                                                 : nlohmann::json(nullptr);

    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        return MakeError(id, rpc_code::kInvalidRequest, "Invalid Request: jsonrpc must be \"2.0\"");
    }
    if (has_id && !IsValidId(message["id"])) {
        return MakeError(nullptr, rpc_code::kInvalidRequest, "Invalid Request: bad id");
    }
    if (!message.contains("method") || !message["method"].is_string()) {
        return MakeError(id, rpc_code::kInvalidRequest, "Invalid Request: missing method");
    }

    const auto method = message["method"].get<std::string>();
    const auto params = message.contains("params") && message["params"].is_object()
        ? message["params"]
        : nlohmann::json::object();

    // Notifications: no "id", no response.
    if (!has_id) {
        if (method == "notifications/cancelled") {
            if (ApplyCancellation(message, session)) {
                LogDebug(kComponent, "session " + session.Id() + ": cancellation received");
            }
        } else if (method == "notifications/initialized") {
            LogDebug(kComponent, "session " + session.Id() + ": client initialized");
        } else {
            LogDebug(kComponent, "session " + session.Id() + ": ignored notification " + method);
        }
        return std::nullopt;
    }

    try {
        return Route(method, params, id, session);
    } catch (const std::exception& e) {
        LogError(kComponent, method + " failed: " + e.what());
        return MakeError(id, rpc_code::kInternalError, std::string("Internal error: ") + e.what());
    }
}

bool McpDispatcher::ApplyCancellation(const nlohmann::json& message, Session& session) {
    if (!message.is_object() || !message.contains("method") ||
        message["method"] != "notifications/cancelled") {
        return false;
    }
    if (message.contains("params") && message["params"].is_object() &&
        message["params"].contains("requestId")) {
        session.Cancel(message["params"]["requestId"]);
    }
    return true;
}

nlohmann::json McpDispatcher::Route(const std::string& method, const nlohmann::json& params,
                                    const nlohmann::json& id, Session& session) {
    if (method == "initialize") {
        return HandleInitialize(params, id, session);
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id, session);
    } else if (method == "resources/list") {
        return HandleResourcesList(id);
    } else if (method == "resources/read") {
        return HandleResourcesRead(params, id);
    }
    return MakeError(id, rpc_code::kMethodNotFound, "Method not found: " + method);
}

// ---------------------------------------------------------------------------
// initialize
// ---------------------------------------------------------------------------

nlohmann::json McpDispatcher::HandleInitialize(const nlohmann::json& params,
                                               const nlohmann::json& id, Session& session) {
    auto client_info = params.value("clientInfo", nlohmann::json::object());
    auto client_caps = params.value("capabilities", nlohmann::json::object());
    if (!client_info.is_object()) {
        client_info = nlohmann::json::object();
    }

    const auto capabilities = Capabilities();
    std::vector<std::string> negotiated;
    for (const auto& [name, value] : capabilities.items()) {
        negotiated.push_back(name);
    }

    // clientInfo is opaque; the name is only read for the log line.
    std::string client_name = "unknown client";
    if (client_info.contains("name") && client_info["name"].is_string()) {
        client_name = client_info["name"].get<std::string>();
    }

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = capabilities;
    result["serverInfo"] = ServerInfo();

    session.MarkInitialized(client_info, client_caps, std::move(negotiated));
    LogInfo(kComponent, "session " + session.Id() + " initialized by " + client_name);
    return MakeResult(id, result);
}

// ---------------------------------------------------------------------------
// tools
// ---------------------------------------------------------------------------

nlohmann::json McpDispatcher::HandleToolsList(const nlohmann::json& id) {
    auto registry = registry_->Snapshot();
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& descriptor : registry->Descriptors()) {
        tools.push_back(descriptor.ToJson());
    }
    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpDispatcher::HandleToolsCall(const nlohmann::json& params,
                                              const nlohmann::json& id, Session& session) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, rpc_code::kInvalidParams, "Missing 'name' parameter");
    }
    const auto tool_name = params["name"].get<std::string>();
    const auto arguments = params.value("arguments", nlohmann::json::object());

    // One snapshot for the whole call; a reload does not affect it.
    auto registry = registry_->Snapshot();
    if (registry->Lookup(tool_name) == nullptr) {
        return MakeError(id, rpc_code::kInternalError, "Unknown tool: " + tool_name);
    }

    auto validated = registry->Validate(tool_name, arguments);
    if (validated.IsErr()) {
        const auto& error = validated.Error();
        return MakeError(id, error.RpcCode(), "Invalid arguments for " + tool_name + ": " +
                                                  error.message);
    }

    LogDebug(kComponent, "session " + session.Id() + ": tools/call " + tool_name);

    InFlightCall call(session, id);
    ToolRunContext context{runner_, call.Token()};
    auto result = registry->Invoke(tool_name, validated.Value(), context);

    nlohmann::json response;
    response["content"] = nlohmann::json::array(
        {{{"type", "text"}, {"text", result.content.dump(2)}}});
    if (result.is_error) {
        response["isError"] = true;
    }
    return MakeResult(id, response);
}

// ---------------------------------------------------------------------------
// resources
// ---------------------------------------------------------------------------

nlohmann::json McpDispatcher::ResourceDescriptors() {
    return nlohmann::json::array({
        {{"uri", "config://main"},
         {"name", "Main Configuration"},
         {"description", "Main server configuration"},
         {"mimeType", "application/json"}},
        {{"uri", "version://info"},
         {"name", "Version Information"},
         {"description", "Server version and tool information"},
         {"mimeType", "application/json"}},
        {{"uri", "tools://list"},
         {"name", "Available Tools"},
         {"description", "List of available tools"},
         {"mimeType", "application/json"}},
    });
}

nlohmann::json McpDispatcher::HandleResourcesList(const nlohmann::json& id) {
    return MakeResult(id, {{"resources", ResourceDescriptors()}});
}

nlohmann::json McpDispatcher::HandleResourcesRead(const nlohmann::json& params,
                                                  const nlohmann::json& id) {
    if (!params.contains("uri") || !params["uri"].is_string()) {
        return MakeError(id, rpc_code::kInvalidParams, "Missing 'uri' parameter");
    }
    const auto uri = params["uri"].get<std::string>();

    auto content = ReadResource(uri);
    if (content.is_null()) {
        return MakeError(id, rpc_code::kInternalError, "Unknown resource: " + uri);
    }

    nlohmann::json entry = {
        {"uri", uri},
        {"mimeType", "application/json"},
        {"text", content.dump(2)},
    };
    return MakeResult(id, {{"contents", nlohmann::json::array({entry})}});
}

// Null for an unknown uri.
nlohmann::json McpDispatcher::ReadResource(const std::string& uri) const {
    auto registry = registry_->Snapshot();

    nlohmann::json names = nlohmann::json::array();
    for (const auto& descriptor : registry->Descriptors()) {
        names.push_back(descriptor.name);
    }

    if (uri == "config://main") {
        nlohmann::json content = {
            {"tools_enabled", names},
            {"server_info", ServerInfo()},
            {"capabilities", Capabilities()},
        };
        if (config_view_) {
            content["configuration"] = config_view_();
        }
        return content;
    }
    if (uri == "version://info") {
        return {
            {"server", ServerInfo()},
            {"tools_count", registry->Size()},
            {"resources_count", ResourceDescriptors().size()},
            {"timestamp", Iso8601Now()},
        };
    }
    if (uri == "tools://list") {
        nlohmann::json tools = nlohmann::json::object();
        for (const auto& descriptor : registry->Descriptors()) {
            tools[descriptor.name] = descriptor.ToJson();
        }
        return {{"available_tools", names}, {"tools", tools}};
    }
    return nullptr;
}

// ---------------------------------------------------------------------------
// Envelopes
// ---------------------------------------------------------------------------

nlohmann::json McpDispatcher::Capabilities() {
    return {
        {"tools", {{"listChanged", true}}},
        {"resources", {{"listChanged", false}, {"subscribe", false}}},
    };
}

nlohmann::json McpDispatcher::ServerInfo() {
    return {{"name", kServerName}, {"version", kVersion}};
}

nlohmann::json McpDispatcher::MakeError(const nlohmann::json& id, int code,
                                        const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json McpDispatcher::MakeResult(const nlohmann::json& id,
                                         const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

} // namespace sre_gateway
