#include <sre_gateway/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace sre_gateway {

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Config:      return "config";
        case ErrorCategory::Validation:  return "validation";
        case ErrorCategory::NotFound:    return "not_found";
        case ErrorCategory::Unsupported: return "unsupported";
        case ErrorCategory::Spawn:       return "spawn";
        case ErrorCategory::Timeout:     return "timeout";
        case ErrorCategory::Transport:   return "transport";
        case ErrorCategory::Internal:    return "internal";
    }
    return "internal";
}

int Error::RpcCode() const {
    switch (category) {
        case ErrorCategory::Validation:
            return rpc_code::kInvalidParams;
        case ErrorCategory::Config:
        case ErrorCategory::NotFound:
        case ErrorCategory::Unsupported:
        case ErrorCategory::Spawn:
        case ErrorCategory::Timeout:
        case ErrorCategory::Transport:
        case ErrorCategory::Internal:
            return rpc_code::kInternalError;
    }
    return rpc_code::kInternalError;
}

int Error::HttpStatus() const {
    switch (category) {
        case ErrorCategory::Validation:  return 400;
        case ErrorCategory::NotFound:    return 404;
        case ErrorCategory::Unsupported: return 400;
        case ErrorCategory::Timeout:     return 504;
        case ErrorCategory::Transport:   return 502;
        case ErrorCategory::Config:
        case ErrorCategory::Spawn:
        case ErrorCategory::Internal:
            return 500;
    }
    return 500;
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (field.has_value()) {
        oss << " [" << *field << "]";
    }
    oss << ": " << message;
    return oss.str();
}

nlohmann::json Error::ToJson() const {
    nlohmann::json body = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
    };
    if (field.has_value()) {
        body["field"] = *field;
    }
    return nlohmann::json{{"error", body}};
}

} // namespace sre_gateway
