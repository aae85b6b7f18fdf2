#include <sre_gateway/server/http_api.hpp>

#include <sre_gateway/config/config_loader.hpp>
#include <sre_gateway/core/log.hpp>
#include <sre_gateway/core/timestamp.hpp>
#include <sre_gateway/core/version.hpp>
#include <sre_gateway/tools/command_builders.hpp>

#include <algorithm>
#include <cctype>
#include <functional>
#include <optional>

namespace sre_gateway {

namespace {

using Json = nlohmann::json;
using Handler = std::function<void(const httplib::Request&, httplib::Response&)>;

constexpr const char* kComponent = "http";
constexpr time_t kUpstreamTimeoutSeconds = 10;

void SendJson(httplib::Response& res, int status, const Json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

// Converts an escaped exception into a 500 with the message only.
Handler Guarded(const std::string& route, Handler handler) {
    return [route, handler = std::move(handler)](const httplib::Request& req,
                                                 httplib::Response& res) {
        try {
            handler(req, res);
        } catch (const std::exception& e) {
            LogError(kComponent, route + ": " + e.what());
            SendJson(res, 500, Error{route, e.what(), std::nullopt,
                                     ErrorCategory::Internal}.ToJson());
        }
    };
}

// Request body as a JSON object. An empty body counts as {}.
Result<Json, Error> ParseBody(const httplib::Request& req) {
    if (req.body.empty()) {
        return Result<Json, Error>::Ok(Json::object());
    }
    auto body = Json::parse(req.body, nullptr, false);
    if (body.is_discarded()) {
        return Result<Json, Error>::Err(
            Error::Validation("ParseBody", "body", "request body is not valid JSON"));
    }
    if (!body.is_object()) {
        return Result<Json, Error>::Err(
            Error::Validation("ParseBody", "body", "request body must be a JSON object"));
    }
    return Result<Json, Error>::Ok(std::move(body));
}

Json Envelope(const std::string& command, const char* key, const std::string& value,
              const Json& params, const Json& result) {
    return {
        {"command", command},
        {key, value},
        {"parameters", params},
        {"result", result},
        {"timestamp", Iso8601Now()},
    };
}

// The AGE key never travels back in the echo of the parameters.
Json MaskAgeKey(Json params) {
    if (params.is_object() && params.contains("age_key")) {
        params["age_key"] = "***";
    }
    return params;
}

bool IsSensitiveName(const std::string& name) {
    static const char* kMarkers[] = {"PASSWORD", "SECRET", "TOKEN", "KEY", "CREDENTIAL"};
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    for (const char* marker : kMarkers) {
        if (upper.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::unique_ptr<httplib::Client> UpstreamClient(const std::string& url) {
    auto client = std::make_unique<httplib::Client>(url);
    client->set_connection_timeout(kUpstreamTimeoutSeconds, 0);
    client->set_read_timeout(kUpstreamTimeoutSeconds, 0);
    return client;
}

std::string HostWithoutPort(const std::string& host_header) {
    if (!host_header.empty() && host_header.front() == '[') {
        auto close = host_header.find(']');
        return close == std::string::npos ? host_header : host_header.substr(0, close + 1);
    }
    return host_header.substr(0, host_header.find(':'));
}

} // anonymous namespace

HttpApi::HttpApi(Gateway& gateway) : gateway_(gateway) {}

void HttpApi::Mount(httplib::Server& server) {
    auto bind = [this](void (HttpApi::*method)(const httplib::Request&, httplib::Response&)) {
        return [this, method](const httplib::Request& req, httplib::Response& res) {
            (this->*method)(req, res);
        };
    };

    server.Get("/health", Guarded("/health", bind(&HttpApi::HandleHealth)));
    server.Post("/mcp/http", Guarded("/mcp/http", bind(&HttpApi::HandleMcpHttp)));
    server.Get("/mcp", Guarded("/mcp", bind(&HttpApi::HandleMcpUpgradeHint)));

    server.Post(R"(/kubectl/([^/]+))", Guarded("/kubectl", bind(&HttpApi::HandleKubectl)));
    server.Post(R"(/git/([^/]+))", Guarded("/git", bind(&HttpApi::HandleGit)));
    server.Post(R"(/flux/([^/]+))", Guarded("/flux", bind(&HttpApi::HandleFlux)));
    server.Post("/cli/chain", Guarded("/cli/chain", bind(&HttpApi::HandleCliChain)));
    server.Post(R"(/cli/([^/]+))", Guarded("/cli", bind(&HttpApi::HandleCli)));
    server.Get("/cli/tools", Guarded("/cli/tools", bind(&HttpApi::HandleCliTools)));

    server.Get("/config", Guarded("/config", bind(&HttpApi::HandleConfig)));
    server.Post("/config/reload", Guarded("/config/reload", bind(&HttpApi::HandleConfigReload)));
    server.Get("/config/tools", Guarded("/config/tools", bind(&HttpApi::HandleConfigTools)));

    server.Get("/services", Guarded("/services", bind(&HttpApi::HandleServices)));
    server.Get(R"(/services/([^/]+))", Guarded("/services", bind(&HttpApi::HandleServiceHealth)));

    server.Get("/prometheus/query", Guarded("/prometheus/query",
        [this](const httplib::Request& req, httplib::Response& res) {
            if (!req.has_param("query") || req.get_param_value("query").empty()) {
                SendJson(res, 400, {{"error", "Query parameter required"}});
                return;
            }
            Relay("prometheus", "/api/v1/query", {{"query", req.get_param_value("query")}},
                  true, res);
        }));
    server.Get("/alertmanager/alerts", Guarded("/alertmanager/alerts",
        [this](const httplib::Request&, httplib::Response& res) {
            Relay("alertmanager", "/api/v2/alerts", {}, false, res);
        }));
    server.Get("/grafana/dashboards", Guarded("/grafana/dashboards",
        [this](const httplib::Request&, httplib::Response& res) {
            Relay("grafana", "/api/dashboards/home", {}, false, res);
        }));
    server.Get("/kuma/mesh", Guarded("/kuma/mesh",
        [this](const httplib::Request&, httplib::Response& res) {
            Relay("kuma", "/meshes", {}, false, res);
        }));
    server.Get("/jaeger/traces", Guarded("/jaeger/traces",
        [this](const httplib::Request& req, httplib::Response& res) {
            httplib::Params params;
            for (const char* key : {"service", "operation"}) {
                if (req.has_param(key) && !req.get_param_value(key).empty()) {
                    params.emplace(key, req.get_param_value(key));
                }
            }
            Relay("jaeger", "/api/traces", params, false, res);
        }));
    server.Get("/loki/query", Guarded("/loki/query",
        [this](const httplib::Request& req, httplib::Response& res) {
            if (!req.has_param("query") || req.get_param_value("query").empty()) {
                SendJson(res, 400, {{"error", "Query parameter required"}});
                return;
            }
            Relay("loki", "/loki/api/v1/query", {{"query", req.get_param_value("query")}},
                  true, res);
        }));

    server.Get("/ready", Guarded("/ready", bind(&HttpApi::HandleReady)));
    server.Get("/version", Guarded("/version", bind(&HttpApi::HandleVersion)));
    server.Get("/env", Guarded("/env", bind(&HttpApi::HandleEnvironment)));
}

// ---------------------------------------------------------------------------
// MCP
// ---------------------------------------------------------------------------

void HttpApi::HandleHealth(const httplib::Request&, httplib::Response& res) {
    SendJson(res, 200, {
        {"status", "healthy"},
        {"protocol", "MCP"},
        {"server_info", McpDispatcher::ServerInfo()},
        {"timestamp", Iso8601Now()},
    });
}

void HttpApi::HandleMcpHttp(const httplib::Request& req, httplib::Response& res) {
    auto message = Json::parse(req.body, nullptr, false);
    if (message.is_discarded()) {
        SendJson(res, 400, Error::Validation("/mcp/http", "body",
                                             "request body is not valid JSON").ToJson());
        return;
    }

    auto session = Session::ForHttpRequest();
    auto response = gateway_.Dispatcher().HandleMessage(message, *session);
    if (!response) {
        SendJson(res, 200, {{"status", "notification_processed"}});
        return;
    }
    SendJson(res, 200, *response);
}

void HttpApi::HandleMcpUpgradeHint(const httplib::Request& req, httplib::Response& res) {
    const auto state = gateway_.State();
    std::string host = HostWithoutPort(req.get_header_value("Host"));
    if (host.empty()) {
        host = state->config.server.host;
    }
    SendJson(res, 426, {
        {"error", "WebSocket upgrade required"},
        {"websocket_url", "ws://" + host + ":" +
                              std::to_string(state->config.server.ws_port) + "/mcp"},
        {"http_endpoint", "/mcp/http"},
    });
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

void HttpApi::HandleKubectl(const httplib::Request& req, httplib::Response& res) {
    auto params = ParseBody(req);
    if (params.IsErr()) {
        SendJson(res, 400, params.Error().ToJson());
        return;
    }
    const std::string action = req.matches[1];
    const auto state = gateway_.State();

    auto run = gateway_.Runner().Run(KubectlActionCommand(state->settings, action, params.Value()));
    auto result = run.ToJson();
    result["data"] = run.stdout_data;
    if (StringParam(params.Value(), "output") == "json" && run.succeeded) {
        auto data = Json::parse(run.stdout_data, nullptr, false);
        if (!data.is_discarded()) {
            result["data"] = std::move(data);
        }
    }
    SendJson(res, 200, Envelope("kubectl", "action", action, params.Value(), result));
}

void HttpApi::HandleGit(const httplib::Request& req, httplib::Response& res) {
    auto params = ParseBody(req);
    if (params.IsErr()) {
        SendJson(res, 400, params.Error().ToJson());
        return;
    }
    const std::string action = req.matches[1];
    const auto state = gateway_.State();

    Json result;
    auto command = GitActionCommand(state->settings, action, params.Value());
    if (command.IsErr()) {
        result = {{"success", false}, {"error", command.Error().message}};
    } else {
        result = gateway_.Runner().Run(command.Value()).ToJson();
    }
    SendJson(res, 200, Envelope("git", "action", action, params.Value(), result));
}

void HttpApi::HandleFlux(const httplib::Request& req, httplib::Response& res) {
    auto params = ParseBody(req);
    if (params.IsErr()) {
        SendJson(res, 400, params.Error().ToJson());
        return;
    }
    const std::string action = req.matches[1];
    const auto state = gateway_.State();

    auto result = gateway_.Runner()
                      .Run(FluxActionCommand(state->settings, action, params.Value()))
                      .ToJson();
    SendJson(res, 200, Envelope("flux", "action", action, params.Value(), result));
}

void HttpApi::HandleCli(const httplib::Request& req, httplib::Response& res) {
    auto params = ParseBody(req);
    if (params.IsErr()) {
        SendJson(res, 400, params.Error().ToJson());
        return;
    }
    const std::string tool = req.matches[1];
    const auto state = gateway_.State();

    ToolRunContext context{gateway_.Runner()};
    auto result = state->cli->Run(tool, params.Value(), context);

    SendJson(res, 200, Envelope("cli", "tool", tool, MaskAgeKey(params.Value()), result));
}

void HttpApi::HandleCliChain(const httplib::Request& req, httplib::Response& res) {
    auto body = ParseBody(req);
    if (body.IsErr()) {
        SendJson(res, 400, body.Error().ToJson());
        return;
    }
    const auto commands = body.Value().value("commands", Json::array());
    const auto state = gateway_.State();

    ToolRunContext context{gateway_.Runner()};
    auto result = state->cli->RunChain(commands, context);
    Json echoed = Json::array();
    if (commands.is_array()) {
        for (const auto& step : commands) {
            echoed.push_back(MaskAgeKey(step));
        }
    }
    SendJson(res, 200, {
        {"command", "cli-chain"},
        {"commands", echoed},
        {"result", result},
        {"timestamp", Iso8601Now()},
    });
}

void HttpApi::HandleCliTools(const httplib::Request&, httplib::Response& res) {
    const auto state = gateway_.State();
    SendJson(res, 200, {
        {"active_tools", state->catalog->ActiveNames()},
        {"available_tools", CliCatalog::AvailableJson()},
        {"active_count", state->catalog->ActiveNames().size()},
        {"total_count", CliCatalog::Available().size()},
        {"timestamp", Iso8601Now()},
    });
}

// ---------------------------------------------------------------------------
// Config
// ---------------------------------------------------------------------------

void HttpApi::HandleConfig(const httplib::Request&, httplib::Response& res) {
    SendJson(res, 200, {
        {"configuration", RedactedConfigJson(gateway_.State()->config)},
        {"timestamp", Iso8601Now()},
    });
}

void HttpApi::HandleConfigReload(const httplib::Request&, httplib::Response& res) {
    auto reloaded = gateway_.Reload();
    if (reloaded.IsErr()) {
        SendJson(res, 500, {
            {"status", "error"},
            {"error", reloaded.Error().ToString()},
            {"timestamp", Iso8601Now()},
        });
        return;
    }
    SendJson(res, 200, {
        {"status", "success"},
        {"message", "Configuration reloaded successfully"},
        {"timestamp", Iso8601Now()},
    });
}

void HttpApi::HandleConfigTools(const httplib::Request&, httplib::Response& res) {
    const auto state = gateway_.State();
    const auto& tools = state->catalog->Config();
    SendJson(res, 200, {
        {"tool_configuration", {
            {"enabled_categories", tools.enabled_categories},
            {"enabled_tools", tools.enabled_tools},
            {"disabled_tools", tools.disabled_tools},
        }},
        {"available_categories", state->catalog->Categories()},
        {"active_tools", state->catalog->ActiveNames()},
        {"timestamp", Iso8601Now()},
    });
}

// ---------------------------------------------------------------------------
// Services and monitoring
// ---------------------------------------------------------------------------

void HttpApi::HandleServices(const httplib::Request&, httplib::Response& res) {
    const auto state = gateway_.State();
    SendJson(res, 200, {
        {"services", state->config.services},
        {"count", state->config.services.size()},
        {"timestamp", Iso8601Now()},
    });
}

void HttpApi::HandleServiceHealth(const httplib::Request& req, httplib::Response& res) {
    const std::string service = req.matches[1];
    const auto state = gateway_.State();

    auto it = state->config.services.find(service);
    if (it == state->config.services.end()) {
        Json names = Json::array();
        for (const auto& [name, url] : state->config.services) {
            names.push_back(name);
        }
        SendJson(res, 404, {{"error", "Unknown service: " + service},
                            {"available_services", names}});
        return;
    }

    const auto& url = it->second;
    Json response_code = "error";
    bool healthy = false;

    auto client = UpstreamClient(url);
    if (client->is_valid()) {
        if (auto upstream = client->Get("/")) {
            response_code = upstream->status;
            healthy = upstream->status >= 200 && upstream->status < 300;
        } else {
            LogDebug(kComponent, "probe of " + service + " failed: " +
                                     httplib::to_string(upstream.error()));
        }
    }

    SendJson(res, 200, {
        {"service", service},
        {"url", url},
        {"status", healthy ? "healthy" : "unhealthy"},
        {"response_code", response_code},
        {"timestamp", Iso8601Now()},
    });
}

void HttpApi::Relay(const std::string& service, const std::string& path,
                    const httplib::Params& params, bool form_post, httplib::Response& res) {
    const auto state = gateway_.State();
    auto it = state->config.services.find(service);
    if (it == state->config.services.end()) {
        SendJson(res, 404, {{"error", "Service not configured: " + service}});
        return;
    }

    auto client = UpstreamClient(it->second);
    if (!client->is_valid()) {
        SendJson(res, 502, {{"error", "Unsupported " + service + " URL: " + it->second}});
        return;
    }

    auto upstream = form_post ? client->Post(path, params)
                              : client->Get(path, params, httplib::Headers{});
    if (!upstream) {
        SendJson(res, 502, {{"error", service + " unreachable: " +
                                          httplib::to_string(upstream.error())}});
        return;
    }

    auto body = Json::parse(upstream->body, nullptr, false);
    if (body.is_discarded()) {
        SendJson(res, 502, {{"error", "Invalid response from " + service},
                            {"upstream_status", upstream->status}});
        return;
    }
    if (upstream->status < 200 || upstream->status >= 300) {
        SendJson(res, 502, {{"error", service + " returned HTTP " +
                                          std::to_string(upstream->status)},
                            {"upstream_status", upstream->status},
                            {"body", body}});
        return;
    }
    SendJson(res, 200, body);
}

// ---------------------------------------------------------------------------
// System
// ---------------------------------------------------------------------------

void HttpApi::HandleReady(const httplib::Request&, httplib::Response& res) {
    const auto state = gateway_.State();
    auto probe = gateway_.Runner().Run(
        BaseCommand(state->settings, {"kubectl", "version", "--client"}));
    if (probe.succeeded) {
        SendJson(res, 200, {{"status", "ready"}});
        return;
    }
    SendJson(res, 503, {{"status", "not ready"}, {"error", probe.stderr_data}});
}

void HttpApi::HandleVersion(const httplib::Request&, httplib::Response& res) {
    const auto state = gateway_.State();
    auto& runner = gateway_.Runner();
    auto run = [&](std::vector<std::string> argv) {
        return runner.Run(BaseCommand(state->settings, std::move(argv)));
    };
    auto first_line = [](const std::string& text) {
        auto end = text.find('\n');
        return text.substr(0, end);
    };

    Json versions = Json::object();
    auto kubectl = run({"kubectl", "version", "--client", "-o", "json"});
    if (kubectl.succeeded) {
        auto parsed = Json::parse(kubectl.stdout_data, nullptr, false);
        versions["kubectl"] = parsed.is_discarded() ? Json(kubectl.stdout_data) : parsed;
    }
    auto flux = run({"flux", "version", "--client"});
    if (flux.succeeded) {
        versions["flux"] = first_line(flux.stdout_data);
    }
    auto git = run({"git", "--version"});
    if (git.succeeded) {
        versions["git"] = first_line(git.stdout_data);
    }
    for (const char* tool : {"curl", "jq", "yq", "tree"}) {
        if (!state->catalog->IsActive(tool)) {
            continue;
        }
        auto version = run({tool, "--version"});
        if (version.succeeded) {
            versions[tool] = first_line(version.stdout_data);
        }
    }

    SendJson(res, 200, {
        {"service", kServerName},
        {"version", kVersion},
        {"tools", versions},
        {"cli_tools_count", state->catalog->ActiveNames().size()},
        {"service_endpoints_count", state->config.services.size()},
        {"timestamp", Iso8601Now()},
    });
}

void HttpApi::HandleEnvironment(const httplib::Request&, httplib::Response& res) {
    const auto state = gateway_.State();
    Json variables = Json::object();
    for (const auto& [name, value] : state->config.environment) {
        if (!IsSensitiveName(name)) {
            variables[name] = value;
        }
    }
    SendJson(res, 200, {
        {"environment_variables", variables},
        {"service_endpoints", state->config.services},
        {"cli_tools", state->catalog->ActiveNames()},
        {"timestamp", Iso8601Now()},
    });
}

} // namespace sre_gateway
