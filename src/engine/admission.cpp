#include "admission.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <atomic>
#include <cctype>
#include <regex>
#include <fmt/format.h>

bool is_session_terminating(const std::string& command) {
    static const std::regex terminating(R"(^(exit(\s+-?\d+)?|logout)$)");
    return std::regex_match(trimmed(command), terminating);
}

Result<void> validate_command_text(const std::string& command) {
    if (trimmed(command).empty()) {
        return Result<void>::Err(ErrorCode::INVALID_COMMAND, "Command cannot be empty");
    }
    if (is_session_terminating(command)) {
        return Result<void>::Err(ErrorCode::SESSION_TERMINATING,
            fmt::format("'{}' would terminate the shared session; use disconnect instead",
                        trimmed(command)));
    }
    return Result<void>::Ok();
}

Result<void> validate_command_id(const std::string& id) {
    if (id.empty()) {
        return Result<void>::Err(ErrorCode::INVALID_COMMAND_ID, "Command id cannot be empty");
    }
    if (id.size() > MAX_COMMAND_ID_LENGTH) {
        return Result<void>::Err(ErrorCode::INVALID_COMMAND_ID,
            fmt::format("Command id exceeds {} characters", MAX_COMMAND_ID_LENGTH));
    }
    for (char c : id) {
        unsigned char uc = static_cast<unsigned char>(c);
        if (!std::isalnum(uc) && c != '_' && c != '-' && c != '.') {
            return Result<void>::Err(ErrorCode::INVALID_COMMAND_ID,
                "Command id may only contain letters, digits, '_', '-' and '.'");
        }
    }
    return Result<void>::Ok();
}

Result<void> validate_session_name(const std::string& name) {
    if (name.empty()) {
        return Result<void>::Err(ErrorCode::INVALID_SESSION_NAME, "Session name cannot be empty");
    }
    for (char c : name) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            return Result<void>::Err(ErrorCode::INVALID_SESSION_NAME,
                                     "Session name cannot contain spaces");
        }
        if (c == '@') {
            return Result<void>::Err(ErrorCode::INVALID_SESSION_NAME,
                                     "Session name cannot contain '@'");
        }
    }
    return Result<void>::Ok();
}

std::string generate_command_id() {
    static std::atomic<uint64_t> counter{0};
    return fmt::format("cmd-{}-{}", now_ms(), ++counter);
}
