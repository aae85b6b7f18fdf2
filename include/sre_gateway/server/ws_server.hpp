#pragma once

#include <sre_gateway/config/app_config.hpp>
#include <sre_gateway/core/result.hpp>
#include <sre_gateway/mcp/session.hpp>
#include <sre_gateway/server/gateway.hpp>

#include <boost/asio/strand.hpp>
#include <boost/asio/thread_pool.hpp>
#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace sre_gateway {

// ---------------------------------------------------------------------------
// WebSocketServer — MCP over WebSocket at ws://host:port/mcp.
//
// One Session per connection. Text frames are dispatched on the
// connection's strand of a worker pool: a connection is served strictly in
// order while other connections proceed in parallel. Binary frames close
// the connection with "unsupported data". Upgrades to any other path are
// refused with 404.
// ---------------------------------------------------------------------------
class WebSocketServer {
public:
    using Endpoint = websocketpp::server<websocketpp::config::asio>;

    WebSocketServer(Gateway& gateway, const WebSocketConfig& config);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    /// Binds and starts accepting; port 0 picks a free port.
    Result<void, Error> Start(const std::string& host, uint16_t port);
    void Stop();

    [[nodiscard]] uint16_t Port() const noexcept { return port_; }
    [[nodiscard]] size_t ConnectionCount() const;

private:
    struct Connection {
        Connection(std::string id, boost::asio::thread_pool& pool)
            : session(std::move(id)), strand(boost::asio::make_strand(pool)) {}

        Session session;
        boost::asio::strand<boost::asio::thread_pool::executor_type> strand;
    };

    bool OnValidate(websocketpp::connection_hdl hdl);
    void OnOpen(websocketpp::connection_hdl hdl);
    void OnClose(websocketpp::connection_hdl hdl);
    void OnMessage(websocketpp::connection_hdl hdl, Endpoint::message_ptr msg);
    void OnHttp(websocketpp::connection_hdl hdl);

    std::shared_ptr<Connection> Find(websocketpp::connection_hdl hdl) const;
    void Send(websocketpp::connection_hdl hdl, const std::string& payload);

    Gateway& gateway_;
    Endpoint endpoint_;
    boost::asio::thread_pool pool_;
    std::thread io_thread_;
    std::atomic<bool> running_{false};
    uint16_t port_ = 0;

    mutable std::mutex connections_mutex_;
    std::map<websocketpp::connection_hdl, std::shared_ptr<Connection>,
             std::owner_less<websocketpp::connection_hdl>> connections_;
    unsigned long next_connection_ = 0;
};

} // namespace sre_gateway
