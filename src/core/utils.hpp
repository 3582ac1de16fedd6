#pragma once

#include <cstdint>
#include <ctime>
#include <string>

// Milliseconds since the Unix epoch (wall clock).
int64_t now_ms();

// Format a ms-since-epoch timestamp as local HH:MM:SS.
std::string format_clock(int64_t ms);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}

// Remove ANSI/VT100 escape sequences, bracketed-paste toggles and BEL.
std::string strip_ansi(const std::string& s);

// Turn raw terminal output into the plain text handed back to callers:
// escapes removed, CR dropped, trailing whitespace trimmed.
std::string clean_terminal_output(const std::string& raw);

// Decode standard base64, ignoring whitespace and stopping at padding.
// Returns "" for input that is not base64.
std::string base64_decode(const std::string& in);
