#include <sre_gateway/server/ws_server.hpp>

#include <sre_gateway/core/log.hpp>

#include <boost/asio/post.hpp>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <vector>

namespace sre_gateway {

namespace {

constexpr const char* kComponent = "ws";
constexpr const char* kMcpPath = "/mcp";

} // anonymous namespace

WebSocketServer::WebSocketServer(Gateway& gateway, const WebSocketConfig& config)
    : gateway_(gateway), pool_(static_cast<size_t>(std::max(1, config.worker_threads))) {
    // Diagnostics go through our own logger.
    endpoint_.clear_access_channels(websocketpp::log::alevel::all);
    endpoint_.clear_error_channels(websocketpp::log::elevel::all);

    endpoint_.init_asio();
    endpoint_.set_reuse_addr(true);

    endpoint_.set_validate_handler([this](websocketpp::connection_hdl hdl) {
        return OnValidate(hdl);
    });
    endpoint_.set_open_handler([this](websocketpp::connection_hdl hdl) { OnOpen(hdl); });
    endpoint_.set_close_handler([this](websocketpp::connection_hdl hdl) { OnClose(hdl); });
    endpoint_.set_fail_handler([this](websocketpp::connection_hdl hdl) {
        websocketpp::lib::error_code ec;
        auto con = endpoint_.get_con_from_hdl(hdl, ec);
        if (!ec) {
            LogDebug(kComponent, "connection failed: " + con->get_ec().message());
        }
    });
    endpoint_.set_message_handler(
        [this](websocketpp::connection_hdl hdl, Endpoint::message_ptr msg) {
            OnMessage(hdl, msg);
        });
    endpoint_.set_http_handler([this](websocketpp::connection_hdl hdl) { OnHttp(hdl); });
}

WebSocketServer::~WebSocketServer() {
    Stop();
}

Result<void, Error> WebSocketServer::Start(const std::string& host, uint16_t port) {
    websocketpp::lib::error_code ec;
    endpoint_.listen(host, std::to_string(port), ec);
    if (ec) {
        return Result<void, Error>::Err(Error{
            "WebSocketServer", "cannot listen on " + host + ":" + std::to_string(port) +
                                   ": " + ec.message(),
            std::nullopt, ErrorCategory::Transport});
    }

    websocketpp::lib::asio::error_code local_ec;
    auto local = endpoint_.get_local_endpoint(local_ec);
    port_ = local_ec ? port : local.port();

    endpoint_.start_accept(ec);
    if (ec) {
        return Result<void, Error>::Err(Error{"WebSocketServer",
                                              "cannot accept: " + ec.message(),
                                              std::nullopt, ErrorCategory::Transport});
    }

    running_ = true;
    io_thread_ = std::thread([this] {
        try {
            endpoint_.run();
        } catch (const std::exception& e) {
            LogError(kComponent, std::string("I/O loop stopped: ") + e.what());
        }
    });
    LogInfo(kComponent, "listening on ws://" + host + ":" + std::to_string(port_) + kMcpPath);
    return Result<void, Error>::Ok();
}

void WebSocketServer::Stop() {
    if (!running_.exchange(false)) {
        return;
    }

    websocketpp::lib::error_code ec;
    endpoint_.stop_listening(ec);

    std::vector<websocketpp::connection_hdl> open;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        for (const auto& [hdl, connection] : connections_) {
            connection->session.Close();
            open.push_back(hdl);
        }
    }
    for (auto& hdl : open) {
        endpoint_.close(hdl, websocketpp::close::status::going_away, "server shutting down", ec);
    }

    endpoint_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    pool_.join();

    std::lock_guard<std::mutex> lock(connections_mutex_);
    connections_.clear();
}

size_t WebSocketServer::ConnectionCount() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

// ---------------------------------------------------------------------------
// Handlers (I/O thread)
// ---------------------------------------------------------------------------

bool WebSocketServer::OnValidate(websocketpp::connection_hdl hdl) {
    websocketpp::lib::error_code ec;
    auto con = endpoint_.get_con_from_hdl(hdl, ec);
    if (ec) {
        return false;
    }
    if (con->get_resource() != kMcpPath) {
        LogDebug(kComponent, "refused upgrade for " + con->get_resource());
        con->set_status(websocketpp::http::status_code::not_found);
        return false;
    }
    return true;
}

void WebSocketServer::OnOpen(websocketpp::connection_hdl hdl) {
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        connection = std::make_shared<Connection>("ws-" + std::to_string(++next_connection_),
                                                  pool_);
        connections_[hdl] = connection;
    }
    LogInfo(kComponent, "session " + connection->session.Id() + " opened");
}

void WebSocketServer::OnClose(websocketpp::connection_hdl hdl) {
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connections_.find(hdl);
        if (it == connections_.end()) {
            return;
        }
        connection = it->second;
        connections_.erase(it);
    }
    // Running calls are cancelled; calls still queued on the strand are
    // skipped.
    connection->session.Close();
    LogInfo(kComponent, "session " + connection->session.Id() + " closed");
}

void WebSocketServer::OnMessage(websocketpp::connection_hdl hdl, Endpoint::message_ptr msg) {
    auto connection = Find(hdl);
    if (!connection) {
        return;
    }

    if (msg->get_opcode() != websocketpp::frame::opcode::text) {
        LogWarn(kComponent, "session " + connection->session.Id() +
                                ": binary frame, closing");
        websocketpp::lib::error_code ec;
        endpoint_.close(hdl, websocketpp::close::status::unsupported_data, "unsupported data", ec);
        return;
    }

    std::string payload = msg->get_payload();

    // A cancel must not wait behind the call it cancels.
    auto peek = nlohmann::json::parse(payload, nullptr, false);
    if (!peek.is_discarded()) {
        McpDispatcher::ApplyCancellation(peek, connection->session);
    }

    boost::asio::post(connection->strand,
                      [this, hdl, connection, payload = std::move(payload)] {
        if (connection->session.Closed()) {
            return;
        }
        auto response = gateway_.Dispatcher().HandleText(payload, connection->session);
        if (response) {
            Send(hdl, response->dump());
        }
    });
}

void WebSocketServer::OnHttp(websocketpp::connection_hdl hdl) {
    websocketpp::lib::error_code ec;
    auto con = endpoint_.get_con_from_hdl(hdl, ec);
    if (ec) {
        return;
    }
    nlohmann::json body = {{"error", "WebSocket upgrade required"}, {"path", kMcpPath}};
    con->set_status(con->get_resource() == kMcpPath
                        ? websocketpp::http::status_code::upgrade_required
                        : websocketpp::http::status_code::not_found);
    con->set_body(body.dump());
    con->append_header("Content-Type", "application/json");
}

// ---------------------------------------------------------------------------

std::shared_ptr<WebSocketServer::Connection> WebSocketServer::Find(
    websocketpp::connection_hdl hdl) const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(hdl);
    return it != connections_.end() ? it->second : nullptr;
}

void WebSocketServer::Send(websocketpp::connection_hdl hdl, const std::string& payload) {
    websocketpp::lib::error_code ec;
    endpoint_.send(hdl, payload, websocketpp::frame::opcode::text, ec);
    if (ec) {
        LogDebug(kComponent, "send failed: " + ec.message());
    }
}

} // namespace sre_gateway
