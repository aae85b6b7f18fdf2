#include <sre_gateway/mcp/session.hpp>

#include <atomic>

namespace sre_gateway {

namespace {

// "1" and 1 are different request ids.
std::string CallKey(const nlohmann::json& request_id) {
    return request_id.dump();
}

} // anonymous namespace

Session::Session(std::string id) : id_(std::move(id)) {}

std::unique_ptr<Session> Session::ForHttpRequest() {
    static std::atomic<unsigned long> counter{0};
    auto session = std::make_unique<Session>("http-" + std::to_string(++counter));
    session->initialized_ = true;
    return session;
}

bool Session::Initialized() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return initialized_;
}

void Session::MarkInitialized(nlohmann::json client_info,
                              nlohmann::json client_capabilities,
                              std::vector<std::string> negotiated) {
    std::lock_guard<std::mutex> lock(mutex_);
    initialized_ = true;
    client_info_ = std::move(client_info);
    client_capabilities_ = std::move(client_capabilities);
    negotiated_ = std::move(negotiated);
}

nlohmann::json Session::ClientInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_info_;
}

nlohmann::json Session::ClientCapabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return client_capabilities_;
}

std::vector<std::string> Session::NegotiatedCapabilities() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return negotiated_;
}

std::shared_ptr<CancellationToken> Session::BeginCall(const nlohmann::json& request_id) {
    auto token = std::make_shared<CancellationToken>();
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        token->Cancel();
    }
    in_flight_[CallKey(request_id)] = token;
    return token;
}

void Session::EndCall(const nlohmann::json& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(CallKey(request_id));
}

bool Session::Cancel(const nlohmann::json& request_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = in_flight_.find(CallKey(request_id));
    if (it == in_flight_.end()) {
        return false;
    }
    it->second->Cancel();
    return true;
}

void Session::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    for (auto& [key, token] : in_flight_) {
        token->Cancel();
    }
}

bool Session::Closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t Session::InFlightCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

} // namespace sre_gateway
