#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

// libssh2 forward declaration
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// True when the last line (or the one before it) of `output` ends like an
// interactive shell prompt: "$", "#", ">", "user@host...$" or
// "[user@host dir]$", optionally followed by whitespace.
bool looks_like_prompt(const std::string& output);

struct MatchResult {
    bool matched;
    std::string text;  // everything read while waiting
};

// Reads a freshly opened shell channel until the first prompt appears.
class ExpectMatcher {
public:
    ExpectMatcher(std::shared_ptr<std::mutex> io_mutex, int sock);

    MatchResult expect_prompt(LIBSSH2_CHANNEL* channel, std::chrono::seconds timeout);

private:
    std::shared_ptr<std::mutex> io_mutex_;
    int sock_;
    std::string buffer_;
};
