#pragma once

#include <string>
#include <fmt/format.h>
#include <core/types.hpp>

namespace theme {

namespace color {
    const std::string TEAL      = "\033[38;2;42;157;143m";
    const std::string AMBER     = "\033[38;2;233;168;52m";
    const std::string GRAY      = "\033[90m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string teal(const std::string& s)    { return color::TEAL + s + color::RESET; }
inline std::string amber(const std::string& s)   { return color::AMBER + s + color::RESET; }
inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string green(const std::string& s)   { return color::GREEN + s + color::RESET; }
inline std::string red(const std::string& s)     { return color::RED + s + color::RESET; }
inline std::string yellow(const std::string& s)  { return color::YELLOW + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string rule() {
    std::string line;
    for (int i = 0; i < 44; i++) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

inline std::string banner() {
    return "\n" + color::TEAL + color::BOLD + "  sshgate\n"
         + color::RESET + color::DIM + "  shared remote shells, one queue per session"
         + color::RESET + "\n\n" + rule();
}

// Blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::AMBER + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return color::YELLOW + "    ! " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::AMBER + "    > " + color::RESET + msg + "\n";
}

inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<12}", key) + color::RESET + value + "\n";
}

inline std::string status(ConnectionStatus s) {
    switch (s) {
        case ConnectionStatus::CONNECTED:    return green(status_name(s));
        case ConnectionStatus::RECONNECTING: return yellow(status_name(s));
        case ConnectionStatus::DISCONNECTED: return dim(status_name(s));
        case ConnectionStatus::ERROR:        return red(status_name(s));
    }
    return status_name(s);
}

inline std::string source(CommandSource s) {
    switch (s) {
        case CommandSource::USER:   return teal("user");
        case CommandSource::CLAUDE: return amber("claude");
        case CommandSource::SYSTEM: return dim("system");
    }
    return source_name(s);
}

} // namespace theme
