#include "error.hpp"
#include "utils.hpp"

const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:                      return "NONE";
        case ErrorCode::INVALID_COMMAND:           return "INVALID_COMMAND";
        case ErrorCode::INVALID_COMMAND_ID:        return "INVALID_COMMAND_ID";
        case ErrorCode::SESSION_TERMINATING:       return "SESSION_TERMINATING";
        case ErrorCode::QUEUE_FULL:                return "QUEUE_FULL";
        case ErrorCode::SESSION_NOT_FOUND:         return "SESSION_NOT_FOUND";
        case ErrorCode::SESSION_BUSY:              return "SESSION_BUSY";
        case ErrorCode::BROWSER_COMMANDS_EXECUTED: return "BROWSER_COMMANDS_EXECUTED";
        case ErrorCode::SESSION_DISCONNECTED:      return "SESSION_DISCONNECTED";
        case ErrorCode::TRANSPORT_ERROR:           return "TRANSPORT_ERROR";
        case ErrorCode::AUTH_FAILED:               return "AUTH_FAILED";
        case ErrorCode::HOST_UNREACHABLE:          return "HOST_UNREACHABLE";
        case ErrorCode::CONNECT_TIMEOUT:           return "CONNECT_TIMEOUT";
        case ErrorCode::DUPLICATE_SESSION:         return "DUPLICATE_SESSION";
        case ErrorCode::INVALID_SESSION_NAME:      return "INVALID_SESSION_NAME";
        case ErrorCode::REGISTRY_SHUT_DOWN:        return "REGISTRY_SHUT_DOWN";
        case ErrorCode::NO_ACTIVE_COMMAND:         return "NO_ACTIVE_COMMAND";
        case ErrorCode::INVALID_SIGNAL:            return "INVALID_SIGNAL";
        case ErrorCode::INVALID_DIMENSIONS:        return "INVALID_DIMENSIONS";
        case ErrorCode::CONFIG_ERROR:              return "CONFIG_ERROR";
        case ErrorCode::KEY_FILE_ERROR:            return "KEY_FILE_ERROR";
    }
    return "UNKNOWN";
}

bool is_retry_allowed(ErrorCode code) {
    return code == ErrorCode::SESSION_BUSY ||
           code == ErrorCode::BROWSER_COMMANDS_EXECUTED;
}

ErrorResponse make_error_response(ErrorCode code, const std::string& message,
                                  const std::string& command_id) {
    std::string name = error_code_name(code);
    std::string short_code = name;
    // "TRANSPORT_ERROR" -> "TRANSPORT"
    const std::string suffix = "_ERROR";
    if (short_code.size() > suffix.size() &&
        short_code.compare(short_code.size() - suffix.size(), suffix.size(), suffix) == 0) {
        short_code.erase(short_code.size() - suffix.size());
    }
    return ErrorResponse{name, message, now_ms(), short_code, command_id};
}
