#pragma once

#include <sre_gateway/exec/cancellation.hpp>

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace sre_gateway {

// ---------------------------------------------------------------------------
// Session — protocol state of one client connection.
//
// Created when a transport connection opens and destroyed when it closes.
// The initialize handshake and the in-flight call table are guarded by a
// mutex: calls run on the connection's strand while cancellations arrive
// on the I/O thread.
// ---------------------------------------------------------------------------
class Session {
public:
    explicit Session(std::string id);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /// Throwaway session for one HTTP POST; starts out initialized.
    static std::unique_ptr<Session> ForHttpRequest();

    [[nodiscard]] const std::string& Id() const noexcept { return id_; }

    [[nodiscard]] bool Initialized() const;
    void MarkInitialized(nlohmann::json client_info, nlohmann::json client_capabilities,
                         std::vector<std::string> negotiated);

    [[nodiscard]] nlohmann::json ClientInfo() const;
    [[nodiscard]] nlohmann::json ClientCapabilities() const;
    [[nodiscard]] std::vector<std::string> NegotiatedCapabilities() const;

    /// Registers a tools/call under its request id and returns its token.
    std::shared_ptr<CancellationToken> BeginCall(const nlohmann::json& request_id);
    void EndCall(const nlohmann::json& request_id);

    /// Cancels the in-flight call; false when no such call is running.
    bool Cancel(const nlohmann::json& request_id);

    /// Connection gone: cancels every in-flight call, and every later
    /// BeginCall hands out a token that is already cancelled.
    void Close();
    [[nodiscard]] bool Closed() const;

    [[nodiscard]] size_t InFlightCount() const;

private:
    std::string id_;

    mutable std::mutex mutex_;
    bool initialized_ = false;
    bool closed_ = false;
    nlohmann::json client_info_ = nlohmann::json::object();
    nlohmann::json client_capabilities_ = nlohmann::json::object();
    std::vector<std::string> negotiated_;
    std::map<std::string, std::shared_ptr<CancellationToken>> in_flight_;
};

} // namespace sre_gateway
