#include "transcript.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

std::string CrlfNormalizer::feed(const std::string& chunk) {
    std::string out;
    out.reserve(chunk.size() + 8);

    for (char c : chunk) {
        if (pending_cr_) {
            pending_cr_ = false;
            out += "\r\n";
            if (c == '\n') continue;
        }
        if (c == '\r') {
            pending_cr_ = true;
            continue;
        }
        if (c == '\n') {
            out += "\r\n";
            continue;
        }
        out += c;
    }

    if (!out.empty()) {
        wrote_any_ = true;
        at_line_start_ = out.size() >= 2 && out.compare(out.size() - 2, 2, "\r\n") == 0;
    } else if (pending_cr_) {
        wrote_any_ = true;
    }
    return out;
}

std::string CrlfNormalizer::finish() {
    if (pending_cr_) {
        pending_cr_ = false;
        at_line_start_ = true;
        return "\r\n";
    }
    if (wrote_any_ && !at_line_start_) {
        at_line_start_ = true;
        return "\r\n";
    }
    return "";
}

std::string default_home(const std::string& user) {
    return user == "root" ? "/root" : "/home/" + user;
}

std::string display_cwd(const std::string& cwd, const std::string& home) {
    if (cwd.empty()) return "~";
    std::string path = cwd;
    while (path.size() > 1 && path.back() == '/') path.pop_back();
    if (path == home) return "~";
    if (path == "/") return "/";

    auto slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

std::string echo_line(const std::string& user, const std::string& host,
                      const std::string& cwd, const std::string& home,
                      const std::string& command) {
    return fmt::format("[{}@{} {}]$ {}\r\n", user, host,
                       display_cwd(cwd, home.empty() ? default_home(user) : home), command);
}

std::string strip_trailing_prompt(const std::string& text) {
    auto nl = text.rfind('\n');
    size_t start = nl == std::string::npos ? 0 : nl + 1;
    std::string last = trimmed(strip_ansi(text.substr(start)));
    if (last.empty()) return text;

    char tail = last.back();
    if (tail != '$' && tail != '#' && tail != '>' && tail != '%') return text;
    return text.substr(0, start);
}
