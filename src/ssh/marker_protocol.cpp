#include "marker_protocol.hpp"
#include <core/utils.hpp>
#include <algorithm>

std::string build_marker_command(const std::string& cmd) {
    // eval gets the text as one single-quoted word and parses it only when it
    // runs, so nothing in the text can swallow the DONE printf. A syntax error
    // just becomes status 2. Multi-line text stays inside the quotes, so the
    // PTY echoes all of it before BEGIN is printed.
    std::string quoted;
    quoted.reserve(cmd.size() + 8);
    for (char c : cmd) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    // BEG''IN / DO''NE keep the literal markers out of the PTY echo.
    return "echo __SSHGATE_BEG''IN__; eval '" + quoted + "'; "
           "printf '__SSHGATE_DO''NE__ %s\\037%s\\037%s\\n' \"$?\" \"$HOME\" \"$PWD\"\n";
}

size_t partial_marker_suffix(const std::string& s, const std::string& marker) {
    size_t max_len = std::min(s.size(), marker.size() - 1);
    for (size_t k = max_len; k > 0; k--) {
        if (s.compare(s.size() - k, k, marker, 0, k) == 0) return k;
    }
    return 0;
}

std::string MarkerStream::feed(const char* data, size_t len) {
    static const std::string begin_marker = SSHGATE_BEGIN_MARKER;
    static const std::string done_marker = SSHGATE_DONE_MARKER;

    buf_.append(data, len);
    std::string out;

    while (true) {
        if (state_ == State::SEEKING_BEGIN) {
            auto pos = buf_.find(begin_marker);
            if (pos == std::string::npos) {
                // Keep only what could still grow into the marker
                size_t keep = partial_marker_suffix(buf_, begin_marker);
                buf_.erase(0, buf_.size() - keep);
                break;
            }
            auto nl = buf_.find('\n', pos + begin_marker.size());
            if (nl == std::string::npos) {
                buf_.erase(0, pos);
                break;
            }
            buf_.erase(0, nl + 1);
            state_ = State::STREAMING;
            continue;
        }

        if (state_ == State::STREAMING) {
            auto pos = buf_.find(done_marker);
            if (pos != std::string::npos) {
                out.append(buf_, 0, pos);
                buf_.erase(0, pos + done_marker.size());
                state_ = State::READING_DONE_LINE;
                continue;
            }
            size_t hold = partial_marker_suffix(buf_, done_marker);
            out.append(buf_, 0, buf_.size() - hold);
            buf_.erase(0, buf_.size() - hold);
            break;
        }

        if (state_ == State::READING_DONE_LINE) {
            auto nl = buf_.find('\n');
            if (nl == std::string::npos) break;
            parse_done_line(buf_.substr(0, nl));
            buf_.clear();
            state_ = State::DONE;
        }

        break;  // DONE: anything further (the next prompt) is not ours
    }

    output_ += out;
    return out;
}

void MarkerStream::parse_done_line(const std::string& line) {
    // " <status>\x1f<home>\x1f<cwd>\r"
    std::string rest = line;
    trim(rest);

    auto first = rest.find(DONE_FIELD_SEPARATOR);
    if (first == std::string::npos) {
        // "<status> <cwd>" from shells that report no home directory
        auto space = rest.find(' ');
        exit_code_ = safe_stoi(rest.substr(0, space), -1);
        cwd_ = (space == std::string::npos) ? "" : rest.substr(space + 1);
        trim(cwd_);
        return;
    }

    exit_code_ = safe_stoi(rest.substr(0, first), -1);
    auto second = rest.find(DONE_FIELD_SEPARATOR, first + 1);
    if (second == std::string::npos) {
        cwd_ = rest.substr(first + 1);
        return;
    }
    home_ = rest.substr(first + 1, second - first - 1);
    cwd_ = rest.substr(second + 1);
}
