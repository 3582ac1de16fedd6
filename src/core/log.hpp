#pragma once

#include <string>
#include <fmt/format.h>

// Append-only debug log shared by every component. Lines look like
//   [14:02:11.317] INFO  session dev: admitted 'ls' (user, cmd-1)
// Threshold and file come from the `log:` config section.

enum class LogLevel { DEBUG, INFO, WARN, ERROR };

const char* level_name(LogLevel level);
bool parse_log_level(const std::string& name, LogLevel& out);

void set_log_path(const std::string& path);
std::string log_path();
void set_log_level(LogLevel level);

void sshgate_log(LogLevel level, const std::string& msg);

template <typename... Args>
void log_debug(fmt::format_string<Args...> f, Args&&... args) {
    sshgate_log(LogLevel::DEBUG, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_info(fmt::format_string<Args...> f, Args&&... args) {
    sshgate_log(LogLevel::INFO, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_warn(fmt::format_string<Args...> f, Args&&... args) {
    sshgate_log(LogLevel::WARN, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void log_error(fmt::format_string<Args...> f, Args&&... args) {
    sshgate_log(LogLevel::ERROR, fmt::format(f, std::forward<Args>(args)...));
}
