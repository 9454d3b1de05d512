#include <toolmux/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace toolmux {

int Error::ExitCode() const {
    switch (category) {
        case ErrorCategory::Launch:         return 1;
        case ErrorCategory::Handshake:      return 1;
        case ErrorCategory::Protocol:       return 2;
        case ErrorCategory::Timeout:        return 3;
        case ErrorCategory::ToolExecution:  return 4;
        case ErrorCategory::ToolNotFound:   return 5;
        case ErrorCategory::UnknownServer:  return 5;
        case ErrorCategory::NotConnected:   return 6;
        case ErrorCategory::ConcurrentCall: return 7;
        case ErrorCategory::NotInitialized: return 7;
        case ErrorCategory::Config:         return 8;
        case ErrorCategory::Internal:       return 99;
    }
    return 99;
}

std::string Error::CategoryName() const {
    switch (category) {
        case ErrorCategory::Launch:         return "launch";
        case ErrorCategory::Handshake:      return "handshake";
        case ErrorCategory::Protocol:       return "protocol";
        case ErrorCategory::Timeout:        return "timeout";
        case ErrorCategory::ToolExecution:  return "tool_execution";
        case ErrorCategory::ToolNotFound:   return "tool_not_found";
        case ErrorCategory::UnknownServer:  return "unknown_server";
        case ErrorCategory::NotConnected:   return "not_connected";
        case ErrorCategory::ConcurrentCall: return "concurrent_call";
        case ErrorCategory::NotInitialized: return "not_initialized";
        case ErrorCategory::Config:         return "config";
        case ErrorCategory::Internal:       return "internal";
    }
    return "internal";
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!server.empty()) {
        oss << " [server " << server << "]";
    }
    if (!tool.empty()) {
        oss << " [tool " << tool << "]";
    }
    oss << ": " << message;
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
        {"exit_code", ExitCode()},
    };
    if (!server.empty()) {
        body["server"] = server;
    }
    if (!tool.empty()) {
        body["tool"] = tool;
    }
    return nlohmann::json{{"error", body}}.dump();
}

} // namespace toolmux
