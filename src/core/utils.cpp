#include "utils.hpp"
#include <chrono>
#include <cstdio>
#include <regex>

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string format_clock(int64_t ms) {
    std::time_t t = static_cast<std::time_t>(ms / 1000);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm_buf);
    return std::string(buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (...) {
        return fallback;
    }
}

std::string strip_ansi(const std::string& s) {
    // CSI sequences (ESC [ ... final), OSC title sequences (ESC ] ... BEL),
    // then any stray ESC or BEL.
    static const std::regex csi("\x1b\\[[0-9;?]*[ -/]*[@-~]");
    static const std::regex osc("\x1b\\][^\x07]*\x07");
    static const std::regex stray("[\x1b\x07]");

    std::string out = std::regex_replace(s, osc, "");
    out = std::regex_replace(out, csi, "");
    return std::regex_replace(out, stray, "");
}

std::string clean_terminal_output(const std::string& raw) {
    std::string clean = strip_ansi(raw);
    std::string out;
    out.reserve(clean.size());
    for (char c : clean) {
        if (c != '\r') out += c;
    }
    auto last_content = out.find_last_not_of(" \t\n");
    if (last_content == std::string::npos) return "";
    out.erase(last_content + 1);
    return out;
}

std::string base64_decode(const std::string& in) {
    static const std::string alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    int val = 0;
    int bits = -8;
    for (char c : in) {
        if (c == '=') break;
        if (c == '\n' || c == '\r' || c == ' ' || c == '\t') continue;
        auto pos = alphabet.find(c);
        if (pos == std::string::npos) return "";
        val = ((val << 6) | static_cast<int>(pos)) & 0xFFFFFF;
        bits += 6;
        if (bits >= 0) {
            out.push_back(static_cast<char>((val >> bits) & 0xFF));
            bits -= 8;
        }
    }
    return out;
}
