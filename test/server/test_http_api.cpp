#include <catch2/catch_test_macros.hpp>

#include <sre_gateway/core/version.hpp>
#include <sre_gateway/server/gateway.hpp>
#include <sre_gateway/server/http_api.hpp>

#include "../mocks/mock_process_spawner.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <memory>
#include <string>
#include <thread>

using namespace sre_gateway;
using sre_gateway::testing::MockProcessSpawner;
using Argv = std::vector<std::string>;

// ===========================================================================
// Helpers: the gateway's HTTP API on a loopback port, with a scripted
// spawner behind it.
// ===========================================================================
namespace {

// Starts an httplib::Server on a background thread and stops it on
// destruction.
class LocalServer {
public:
    explicit LocalServer(httplib::Server& svr) : svr_(svr) {
        port_ = svr_.bind_to_any_port("127.0.0.1");
        thread_ = std::thread([this] { svr_.listen_after_bind(); });
        svr_.wait_until_ready();
    }

    ~LocalServer() {
        svr_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    [[nodiscard]] int Port() const noexcept { return port_; }

    LocalServer(const LocalServer&) = delete;
    LocalServer& operator=(const LocalServer&) = delete;

private:
    httplib::Server& svr_;
    int port_ = 0;
    std::thread thread_;
};

AppConfig TestConfig() {
    AppConfig config;
    config.server.ws_port = 9191;
    config.execution.workdir = "/work";
    config.git.repo_path = "/repo";
    config.environment = {{"PATH", "/usr/bin"}, {"API_TOKEN", "t0k3n"}, {"HOME", "/root"}};
    return config;
}

class ApiFixture {
public:
    explicit ApiFixture(AppConfig config = TestConfig(), Gateway::ConfigSource source = {}) {
        auto spawner = std::make_unique<MockProcessSpawner>();
        spy = spawner.get();
        gateway = std::make_unique<Gateway>(config, std::move(spawner), std::move(source));
        api = std::make_unique<HttpApi>(*gateway);
        api->Mount(server);
        local = std::make_unique<LocalServer>(server);
        client = std::make_unique<httplib::Client>("127.0.0.1", local->Port());
    }

    httplib::Result Post(const std::string& path, const nlohmann::json& body) {
        return client->Post(path, body.dump(), "application/json");
    }

    static nlohmann::json Body(const httplib::Result& res) {
        return nlohmann::json::parse(res->body);
    }

    MockProcessSpawner* spy = nullptr;
    std::unique_ptr<Gateway> gateway;
    std::unique_ptr<HttpApi> api;
    httplib::Server server;
    std::unique_ptr<LocalServer> local;
    std::unique_ptr<httplib::Client> client;
};

} // anonymous namespace

// ===========================================================================
// MCP over HTTP
// ===========================================================================

TEST_CASE("HttpApi: /health reports healthy", "[server][http]") {
    ApiFixture f;
    auto res = f.client->Get("/health");
    REQUIRE(res);
    CHECK(res->status == 200);
    auto body = ApiFixture::Body(res);
    CHECK(body["status"] == "healthy");
    CHECK(body["server_info"]["name"] == kServerName);
}

TEST_CASE("HttpApi: /mcp/http answers initialize", "[server][http][mcp]") {
    ApiFixture f;
    auto res = f.Post("/mcp/http", {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
                                    {"params", {{"clientInfo", {{"name", "curl"}}}}}});
    REQUIRE(res);
    CHECK(res->status == 200);
    auto body = ApiFixture::Body(res);
    CHECK(body["id"] == 1);
    CHECK(body["result"]["protocolVersion"] == "2024-11-05");
}

TEST_CASE("HttpApi: /mcp/http runs tools without a prior initialize", "[server][http][mcp]") {
    ApiFixture f;
    auto res = f.Post("/mcp/http", {{"jsonrpc", "2.0"}, {"id", "h1"}, {"method", "tools/call"},
                                    {"params", {{"name", "health_check"},
                                                {"arguments", nlohmann::json::object()}}}});
    REQUIRE(res);
    auto body = ApiFixture::Body(res);
    auto content = nlohmann::json::parse(
        body["result"]["content"][0]["text"].get<std::string>());
    CHECK(content["status"] == "healthy");
}

TEST_CASE("HttpApi: /mcp/http rejects malformed JSON with 400", "[server][http][mcp]") {
    ApiFixture f;
    auto res = f.client->Post("/mcp/http", "{not json", "application/json");
    REQUIRE(res);
    CHECK(res->status == 400);
    CHECK(ApiFixture::Body(res)["error"]["category"] == "validation");
}

TEST_CASE("HttpApi: /mcp/http acknowledges notifications", "[server][http][mcp]") {
    ApiFixture f;
    auto res = f.Post("/mcp/http", {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(ApiFixture::Body(res)["status"] == "notification_processed");
}

TEST_CASE("HttpApi: GET /mcp points to the WebSocket endpoint", "[server][http][mcp]") {
    ApiFixture f;
    auto res = f.client->Get("/mcp");
    REQUIRE(res);
    CHECK(res->status == 426);
    auto body = ApiFixture::Body(res);
    CHECK(body["websocket_url"] == "ws://127.0.0.1:9191/mcp");
    CHECK(body["http_endpoint"] == "/mcp/http");
}

// ===========================================================================
// Command endpoints
// ===========================================================================

TEST_CASE("HttpApi: POST /kubectl/{action} runs kubectl", "[server][http][commands]") {
    ApiFixture f;
    f.spy->Enqueue(MockProcessSpawner::Exit(0, R"({"kind": "PodList", "items": []})"));

    auto res = f.Post("/kubectl/get", {{"resource", "pods"}, {"namespace", "prod"},
                                       {"output", "json"}});
    REQUIRE(res);
    CHECK(res->status == 200);
    auto body = ApiFixture::Body(res);
    CHECK(body["command"] == "kubectl");
    CHECK(body["action"] == "get");
    CHECK(body["parameters"]["resource"] == "pods");
    CHECK(body["result"]["success"] == true);
    CHECK(body["result"]["data"]["kind"] == "PodList");
    CHECK(body.contains("timestamp"));

    REQUIRE(f.spy->CallCount() == 1);
    CHECK(f.spy->Argvs()[0] == Argv{"kubectl", "get", "pods", "-n", "prod", "-o", "json"});
}

TEST_CASE("HttpApi: command endpoints reject a non-object body", "[server][http][commands]") {
    ApiFixture f;
    auto res = f.client->Post("/flux/get", "[1, 2]", "application/json");
    REQUIRE(res);
    CHECK(res->status == 400);
    CHECK(f.spy->CallCount() == 0);
}

TEST_CASE("HttpApi: POST /git/{action} runs in the repository", "[server][http][commands]") {
    ApiFixture f;
    auto res = f.Post("/git/status", nlohmann::json::object());
    REQUIRE(res);
    CHECK(ApiFixture::Body(res)["result"]["success"] == true);
    REQUIRE(f.spy->CallCount() == 1);
    CHECK(f.spy->Calls()[0].command.working_directory == "/repo");
}

TEST_CASE("HttpApi: unknown git action fails without spawning", "[server][http][commands]") {
    ApiFixture f;
    auto res = f.Post("/git/rebase", nlohmann::json::object());
    REQUIRE(res);
    auto body = ApiFixture::Body(res);
    CHECK(body["result"]["success"] == false);
    CHECK(body["result"]["error"] == "Unknown git action: rebase");
    CHECK(f.spy->CallCount() == 0);
}

TEST_CASE("HttpApi: POST /cli/{tool} masks the AGE key in the echo", "[server][http][cli]") {
    ApiFixture f;
    auto res = f.Post("/cli/sops", {{"operation", "encrypt"}, {"file", "s.yaml"},
                                    {"age_key", "AGE-SECRET-KEY-1XYZ"}});
    REQUIRE(res);
    auto body = ApiFixture::Body(res);
    CHECK(body["tool"] == "sops");
    CHECK(body["parameters"]["age_key"] == "***");
    CHECK(res->body.find("AGE-SECRET-KEY-1XYZ") == std::string::npos);
}

TEST_CASE("HttpApi: POST /cli/chain runs a pipeline", "[server][http][cli]") {
    ApiFixture f;
    f.spy->Enqueue(MockProcessSpawner::Exit(0, "3\n1\n2\n"));
    f.spy->Enqueue(MockProcessSpawner::Exit(0, "1\n2\n3\n"));

    auto res = f.Post("/cli/chain", {{"commands", {{{"tool", "cat"}, {"args", {"n.txt"}}},
                                                   {{"tool", "sort"}}}}});
    REQUIRE(res);
    auto body = ApiFixture::Body(res);
    CHECK(body["command"] == "cli-chain");
    CHECK(body["result"]["success"] == true);
    CHECK(body["result"]["final_output"] == "1\n2\n3\n");
}

TEST_CASE("HttpApi: POST /cli/chain masks the AGE key in every step", "[server][http][cli]") {
    ApiFixture f;
    f.spy->Enqueue(MockProcessSpawner::Exit(0, "ENC[AES256_GCM,data:...]"));
    f.spy->Enqueue(MockProcessSpawner::Exit(0, "ENC[AES256_GCM,data:...]"));

    auto res = f.Post("/cli/chain",
                      {{"commands", {{{"tool", "sops"},
                                      {"operation", "encrypt"},
                                      {"data", "password: hunter2"},
                                      {"age_key", "AGE-SECRET-KEY-1CHAIN"}},
                                     {{"tool", "cat"}}}}});
    REQUIRE(res);
    auto body = ApiFixture::Body(res);
    CHECK(body["result"]["success"] == true);
    REQUIRE(body["commands"].size() == 2);
    CHECK(body["commands"][0]["age_key"] == "***");
    CHECK(body["commands"][0]["operation"] == "encrypt");
    CHECK_FALSE(body["commands"][1].contains("age_key"));
    CHECK(res->body.find("AGE-SECRET-KEY-1CHAIN") == std::string::npos);
}

TEST_CASE("HttpApi: /kubectl ignores a non-string output", "[server][http][kubectl]") {
    ApiFixture f;
    f.spy->Enqueue(MockProcessSpawner::Exit(0, "NAME READY\n"));

    auto res = f.Post("/kubectl/get", {{"resource", "pods"}, {"output", 42}});
    REQUIRE(res);
    CHECK(res->status == 200);
    auto body = ApiFixture::Body(res);
    CHECK(body["result"]["data"] == "NAME READY\n");
    REQUIRE(f.spy->CallCount() == 1);
    const auto argv = f.spy->Argvs()[0];
    CHECK(std::find(argv.begin(), argv.end(), "-o") == argv.end());
}

TEST_CASE("HttpApi: GET /cli/tools lists active tools", "[server][http][cli]") {
    AppConfig config = TestConfig();
    config.tools.enabled_categories = {"json"};
    ApiFixture f(config);

    auto res = f.client->Get("/cli/tools");
    REQUIRE(res);
    auto body = ApiFixture::Body(res);
    CHECK(body["active_tools"] == nlohmann::json::array({"jq"}));
    CHECK(body["active_count"] == 1);
    CHECK(body["available_tools"].contains("curl"));
}

// ===========================================================================
// Config
// ===========================================================================

TEST_CASE("HttpApi: /config never shows the AGE key", "[server][http][config]") {
    AppConfig config = TestConfig();
    config.secrets.age_key = "AGE-SECRET-KEY-1HIDDEN";
    ApiFixture f(config);

    auto res = f.client->Get("/config");
    REQUIRE(res);
    CHECK(res->body.find("AGE-SECRET-KEY-1HIDDEN") == std::string::npos);
    CHECK(ApiFixture::Body(res)["configuration"]["secrets"]["age_key_configured"] == true);
}

TEST_CASE("HttpApi: /config/reload swaps the active tool set", "[server][http][config]") {
    auto reloaded = TestConfig();
    reloaded.tools.enabled_categories = {"yaml"};
    ApiFixture f(TestConfig(), [reloaded] {
        return Result<AppConfig, Error>::Ok(reloaded);
    });

    auto res = f.client->Post("/config/reload", "", "application/json");
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(ApiFixture::Body(res)["status"] == "success");

    auto tools = f.client->Get("/config/tools");
    REQUIRE(tools);
    CHECK(ApiFixture::Body(tools)["active_tools"] == nlohmann::json::array({"yq"}));
}

TEST_CASE("HttpApi: failed reload keeps the old configuration", "[server][http][config]") {
    ApiFixture f(TestConfig(), [] {
        return Result<AppConfig, Error>::Err(
            Error{"LoadFromYaml", "bad indentation", std::nullopt, ErrorCategory::Config});
    });

    auto res = f.client->Post("/config/reload", "", "application/json");
    REQUIRE(res);
    CHECK(res->status == 500);
    CHECK(ApiFixture::Body(res)["status"] == "error");
    CHECK(f.gateway->State()->catalog->ActiveNames().size() == CliCatalog::Available().size());
}

// ===========================================================================
// Services and monitoring relays
// ===========================================================================

TEST_CASE("HttpApi: unknown service is 404", "[server][http][services]") {
    auto config = TestConfig();
    config.services = {{"grafana", "http://127.0.0.1:1"}};
    ApiFixture f(config);

    auto res = f.client->Get("/services/nosuch");
    REQUIRE(res);
    CHECK(res->status == 404);
    CHECK(ApiFixture::Body(res)["available_services"] == nlohmann::json::array({"grafana"}));
}

TEST_CASE("HttpApi: service probe reports healthy upstream", "[server][http][services]") {
    httplib::Server upstream;
    upstream.Get("/", [](const httplib::Request&, httplib::Response& res) {
        res.set_content("ok", "text/plain");
    });
    LocalServer upstream_server(upstream);

    auto config = TestConfig();
    config.services = {{"grafana", "http://127.0.0.1:" + std::to_string(upstream_server.Port())}};
    ApiFixture f(config);

    auto res = f.client->Get("/services/grafana");
    REQUIRE(res);
    auto body = ApiFixture::Body(res);
    CHECK(body["status"] == "healthy");
    CHECK(body["response_code"] == 200);
}

TEST_CASE("HttpApi: prometheus relay forwards the query", "[server][http][services]") {
    httplib::Server upstream;
    std::string received_query;
    upstream.Post("/api/v1/query", [&](const httplib::Request& req, httplib::Response& res) {
        received_query = req.get_param_value("query");
        res.set_content(R"({"status": "success", "data": {"result": []}})", "application/json");
    });
    LocalServer upstream_server(upstream);

    auto config = TestConfig();
    config.services = {{"prometheus", "http://127.0.0.1:" + std::to_string(upstream_server.Port())}};
    ApiFixture f(config);

    auto res = f.client->Get("/prometheus/query?query=up");
    REQUIRE(res);
    CHECK(res->status == 200);
    CHECK(ApiFixture::Body(res)["status"] == "success");
    CHECK(received_query == "up");
}

TEST_CASE("HttpApi: relay requires a query", "[server][http][services]") {
    ApiFixture f;
    auto res = f.client->Get("/loki/query");
    REQUIRE(res);
    CHECK(res->status == 400);
    CHECK(ApiFixture::Body(res)["error"] == "Query parameter required");
}

TEST_CASE("HttpApi: unreachable upstream is 502", "[server][http][services]") {
    auto config = TestConfig();
    config.services = {{"alertmanager", "http://127.0.0.1:1"}};
    ApiFixture f(config);

    auto res = f.client->Get("/alertmanager/alerts");
    REQUIRE(res);
    CHECK(res->status == 502);
}

// ===========================================================================
// System
// ===========================================================================

TEST_CASE("HttpApi: /ready follows the kubectl probe", "[server][http][system]") {
    ApiFixture f;
    auto ready = f.client->Get("/ready");
    REQUIRE(ready);
    CHECK(ready->status == 200);
    CHECK(f.spy->Argvs()[0] == Argv{"kubectl", "version", "--client"});

    f.spy->Enqueue(MockProcessSpawner::With(Termination::SpawnFailed, 0,
                                            "cannot execute 'kubectl'"));
    auto not_ready = f.client->Get("/ready");
    REQUIRE(not_ready);
    CHECK(not_ready->status == 503);
    CHECK(ApiFixture::Body(not_ready)["status"] == "not ready");
}

TEST_CASE("HttpApi: /env hides sensitive variables", "[server][http][system]") {
    ApiFixture f;
    auto res = f.client->Get("/env");
    REQUIRE(res);
    auto vars = ApiFixture::Body(res)["environment_variables"];
    CHECK(vars["PATH"] == "/usr/bin");
    CHECK(vars["HOME"] == "/root");
    CHECK_FALSE(vars.contains("API_TOKEN"));
}

TEST_CASE("HttpApi: /version reports the server version", "[server][http][system]") {
    ApiFixture f;
    f.spy->Enqueue(MockProcessSpawner::Exit(0, R"({"clientVersion": {"gitVersion": "v1.30.0"}})"));
    f.spy->Enqueue(MockProcessSpawner::Exit(0, "flux: v2.3.0\n"));
    f.spy->Enqueue(MockProcessSpawner::Exit(0, "git version 2.43.0\n"));

    auto res = f.client->Get("/version");
    REQUIRE(res);
    auto body = ApiFixture::Body(res);
    CHECK(body["service"] == kServerName);
    CHECK(body["version"] == kVersion);
    CHECK(body["tools"]["kubectl"]["clientVersion"]["gitVersion"] == "v1.30.0");
    CHECK(body["tools"]["flux"] == "flux: v2.3.0");
    CHECK(body["tools"]["git"] == "git version 2.43.0");
}
