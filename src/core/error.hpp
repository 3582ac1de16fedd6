#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

// Every failure the engine can report. The names double as wire codes for
// the control protocol (error_code_name()).
enum class ErrorCode {
    NONE,

    // Admission
    INVALID_COMMAND,
    INVALID_COMMAND_ID,
    SESSION_TERMINATING,
    QUEUE_FULL,
    SESSION_NOT_FOUND,

    // Gating
    SESSION_BUSY,
    BROWSER_COMMANDS_EXECUTED,

    // Execution
    SESSION_DISCONNECTED,
    TRANSPORT_ERROR,

    // Lifecycle
    AUTH_FAILED,
    HOST_UNREACHABLE,
    CONNECT_TIMEOUT,
    DUPLICATE_SESSION,
    INVALID_SESSION_NAME,
    REGISTRY_SHUT_DOWN,

    // Terminal control
    NO_ACTIVE_COMMAND,
    INVALID_SIGNAL,
    INVALID_DIMENSIONS,

    // Configuration / credentials
    CONFIG_ERROR,
    KEY_FILE_ERROR,
};

const char* error_code_name(ErrorCode code);

// Gating errors are the only ones a caller is expected to retry.
bool is_retry_allowed(ErrorCode code);

// Thrown through a command's future when execution fails after admission.
class CommandError : public std::runtime_error {
public:
    CommandError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// Structured error payload for transports that report failures as data.
struct ErrorResponse {
    std::string error;      // e.g. "SESSION_BUSY"
    std::string message;
    int64_t timestamp;      // ms since epoch
    std::string code;       // name without a trailing "_ERROR"
    std::string command_id; // empty when not tied to a command
};

ErrorResponse make_error_response(ErrorCode code, const std::string& message,
                                  const std::string& command_id = "");
