#include "expect.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <regex>
#include <vector>

namespace {

const std::vector<std::regex>& prompt_patterns() {
    static const std::vector<std::regex> patterns = {
        std::regex(R"(\$\s*$)"),
        std::regex(R"(#\s*$)"),
        std::regex(R"(>\s*$)"),
        std::regex(R"([a-zA-Z0-9_.-]+@[a-zA-Z0-9_.-]+.*[$#>]\s*$)"),
        std::regex(R"(\[[a-zA-Z0-9_.-]+@[a-zA-Z0-9_.-]+.*\][$#>]\s*$)"),
    };
    return patterns;
}

} // namespace

bool looks_like_prompt(const std::string& output) {
    std::string plain = strip_ansi(output);

    // Last two lines; a prompt may be followed by an empty line fragment
    std::string last = plain;
    std::string second_last;
    auto nl = plain.rfind('\n');
    if (nl != std::string::npos) {
        last = plain.substr(nl + 1);
        auto prev = (nl == 0) ? std::string::npos : plain.rfind('\n', nl - 1);
        size_t start = (prev == std::string::npos) ? 0 : prev + 1;
        second_last = plain.substr(start, nl - start);
    }

    for (auto* line : {&last, &second_last}) {
        if (!line->empty() && line->back() == '\r') line->pop_back();
        if (line->empty()) continue;
        for (const auto& re : prompt_patterns()) {
            if (std::regex_search(*line, re)) return true;
        }
    }
    return false;
}

ExpectMatcher::ExpectMatcher(std::shared_ptr<std::mutex> io_mutex, int sock)
    : io_mutex_(std::move(io_mutex)), sock_(sock) {}

MatchResult ExpectMatcher::expect_prompt(LIBSSH2_CHANNEL* channel,
                                         std::chrono::seconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    char buf[SSH_READ_BUF_SIZE];

    while (std::chrono::steady_clock::now() < deadline) {
        ssize_t n;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            n = libssh2_channel_read(channel, buf, sizeof(buf));
        }
        if (n > 0) {
            buffer_.append(buf, static_cast<size_t>(n));
            if (looks_like_prompt(buffer_)) {
                return MatchResult{true, buffer_};
            }
        } else if (n == LIBSSH2_ERROR_EAGAIN || n == 0) {
            platform::poll_socket(sock_, POLLIN, 50);
        } else {
            break;
        }
    }
    return MatchResult{false, buffer_};
}
