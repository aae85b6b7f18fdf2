#pragma once

#include <sre_gateway/server/gateway.hpp>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <string>

namespace sre_gateway {

// ---------------------------------------------------------------------------
// HttpApi — HTTP routes of the gateway, mounted on a cpp-httplib server.
//
// MCP:        GET /health, POST /mcp/http, GET /mcp (426, use WebSocket)
// Commands:   POST /kubectl/{action}, /git/{action}, /flux/{action},
//             /cli/{tool}, /cli/chain; GET /cli/tools
// Config:     GET /config, POST /config/reload, GET /config/tools
// Services:   GET /services, GET /services/{name}
// Monitoring: GET /prometheus/query, /alertmanager/alerts,
//             /grafana/dashboards, /kuma/mesh, /jaeger/traces, /loki/query
// System:     GET /ready, /version, /env
//
// Handlers run on cpp-httplib's worker threads and read the gateway's
// current state snapshot once per request.
// ---------------------------------------------------------------------------
class HttpApi {
public:
    explicit HttpApi(Gateway& gateway);

    HttpApi(const HttpApi&) = delete;
    HttpApi& operator=(const HttpApi&) = delete;

    void Mount(httplib::Server& server);

private:
    // MCP
    void HandleHealth(const httplib::Request& req, httplib::Response& res);
    void HandleMcpHttp(const httplib::Request& req, httplib::Response& res);
    void HandleMcpUpgradeHint(const httplib::Request& req, httplib::Response& res);

    // Commands
    void HandleKubectl(const httplib::Request& req, httplib::Response& res);
    void HandleGit(const httplib::Request& req, httplib::Response& res);
    void HandleFlux(const httplib::Request& req, httplib::Response& res);
    void HandleCli(const httplib::Request& req, httplib::Response& res);
    void HandleCliChain(const httplib::Request& req, httplib::Response& res);
    void HandleCliTools(const httplib::Request& req, httplib::Response& res);

    // Config
    void HandleConfig(const httplib::Request& req, httplib::Response& res);
    void HandleConfigReload(const httplib::Request& req, httplib::Response& res);
    void HandleConfigTools(const httplib::Request& req, httplib::Response& res);

    // Services and monitoring
    void HandleServices(const httplib::Request& req, httplib::Response& res);
    void HandleServiceHealth(const httplib::Request& req, httplib::Response& res);
    void Relay(const std::string& service, const std::string& path,
               const httplib::Params& params, bool form_post, httplib::Response& res);

    // System
    void HandleReady(const httplib::Request& req, httplib::Response& res);
    void HandleVersion(const httplib::Request& req, httplib::Response& res);
    void HandleEnvironment(const httplib::Request& req, httplib::Response& res);

    Gateway& gateway_;
};

} // namespace sre_gateway
