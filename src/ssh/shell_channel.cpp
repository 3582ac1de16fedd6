#include "shell_channel.hpp"
#include "expect.hpp"
#include "marker_protocol.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <chrono>

ShellChannel::ShellChannel(LIBSSH2_SESSION* session, LIBSSH2_CHANNEL* ch, int sock)
    : session_(session), ch_(ch), sock_(sock),
      io_mutex_(std::make_shared<std::mutex>()) {}

ShellChannel::~ShellChannel() {
    close();
}

Result<void> ShellChannel::start(int prompt_timeout_secs) {
    ExpectMatcher matcher(io_mutex_, sock_);
    auto match = matcher.expect_prompt(ch_, std::chrono::seconds(prompt_timeout_secs));
    if (!match.matched) {
        // Some servers print nothing until input arrives; the marker round trip
        // below is the real readiness check.
        log_warn("shell: no prompt within {}s, trying a marker command",
                 prompt_timeout_secs);
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        banner_ = match.text;
    }

    auto ready_result = run(":", nullptr);
    if (ready_result.transport_failed()) {
        return Result<void>::Err(ErrorCode::TRANSPORT_ERROR,
                                 "Shell not ready: " + ready_result.error);
    }
    return Result<void>::Ok();
}

void ShellChannel::drain() {
    char buf[SSH_DRAIN_BUF_SIZE];
    std::lock_guard<std::mutex> lock(*io_mutex_);
    if (!ch_) return;
    while (libssh2_channel_read(ch_, buf, sizeof(buf)) > 0) {}
}

bool ShellChannel::write_all(const std::string& data) {
    size_t total = data.size();
    size_t sent = 0;
    int write_retries = 0;
    while (sent < total) {
        if (closed_) return false;
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            if (!ch_) return false;
            w = libssh2_channel_write(ch_, data.c_str() + sent, total - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (++write_retries > 100) {
                return false;
            }
            platform::sleep_ms(10);
            continue;
        }
        if (w < 0) {
            return false;
        }
        write_retries = 0;
        sent += static_cast<size_t>(w);
    }
    return true;
}

ShellResult ShellChannel::run(const std::string& command, const ChunkCallback& on_chunk) {
    std::lock_guard<std::mutex> cmd_lock(cmd_mutex_);

    ShellResult result;
    if (closed_) {
        result.error = "Shell channel closed";
        return result;
    }

    // Leftover prompt from the previous command
    drain();

    if (!write_all(build_marker_command(command))) {
        result.error = closed_ ? "Shell channel closed"
                               : "Failed to send command (channel write error)";
        return result;
    }

    // No deadline: an admitted command runs until the remote reports its
    // exit status or the transport goes away.
    MarkerStream stream;
    char buf[SSH_READ_BUF_SIZE];

    while (!closed_) {
        ssize_t n;
        bool eof = false;
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            if (!ch_) break;
            n = libssh2_channel_read(ch_, buf, sizeof(buf));
            if (n == LIBSSH2_ERROR_EAGAIN || n == 0) {
                eof = libssh2_channel_eof(ch_) != 0;
            }
        }

        if (n > 0) {
            std::string chunk = stream.feed(buf, static_cast<size_t>(n));
            if (!chunk.empty() && on_chunk) on_chunk(chunk);
            if (stream.done()) {
                result.exit_code = stream.exit_code();
                result.output = stream.output();
                result.cwd = stream.cwd();
                result.home = stream.home();
                std::lock_guard<std::mutex> lock(state_mutex_);
                if (!result.cwd.empty()) cwd_ = result.cwd;
                if (!result.home.empty()) home_ = result.home;
                return result;
            }
        } else if (n == LIBSSH2_ERROR_EAGAIN || n == 0) {
            if (eof) {
                result.output = stream.output();
                result.error = "Remote shell exited";
                return result;
            }
            // Poll socket without holding io_mutex_
            platform::poll_socket(sock_, POLLIN, 10);
        } else {
            result.output = stream.output();
            result.error = "SSH channel read error";
            return result;
        }
    }

    result.output = stream.output();
    result.error = "Shell channel closed";
    return result;
}

bool ShellChannel::send_control(char c) {
    return write_all(std::string(1, c));
}

bool ShellChannel::resize(int cols, int rows) {
    int rc;
    do {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            if (!ch_) return false;
            rc = libssh2_channel_request_pty_size(ch_, cols, rows);
        }
        if (rc == LIBSSH2_ERROR_EAGAIN) platform::sleep_ms(10);
    } while (rc == LIBSSH2_ERROR_EAGAIN);
    return rc == 0;
}

ConnectionStatus ShellChannel::check_connectivity() {
    if (closed_) return ConnectionStatus::DISCONNECTED;

    bool alive = true;
    {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        if (!session_ || !ch_) return ConnectionStatus::DISCONNECTED;

        int seconds_to_next = 0;
        if (libssh2_keepalive_send(session_, &seconds_to_next) != 0) {
            alive = false;
        }
        if (libssh2_channel_eof(ch_)) {
            alive = false;
        }
    }

    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        alive = false;
    }

    if (alive) {
        failed_checks_ = 0;
        return ConnectionStatus::CONNECTED;
    }
    failed_checks_++;
    return failed_checks_ >= CHECK_FAILURES_FOR_ERROR ? ConnectionStatus::ERROR
                                                      : ConnectionStatus::RECONNECTING;
}

void ShellChannel::close() {
    // Mark closed first so a running command bails out at its next read
    if (closed_.exchange(true)) return;

    // Each libssh2 call gets its own brief lock; disconnect does network I/O.
    if (ch_) {
        std::lock_guard<std::mutex> lock(*io_mutex_);
        libssh2_channel_close(ch_);
        libssh2_channel_free(ch_);
        ch_ = nullptr;
    }

    if (session_) {
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_disconnect(session_, "Normal disconnection");
        }
        {
            std::lock_guard<std::mutex> lock(*io_mutex_);
            libssh2_session_free(session_);
            session_ = nullptr;
        }
    }

    int sock = sock_.exchange(SSHGATE_INVALID_SOCKET);
    if (sock >= 0) {
        platform::close_socket(sock);
    }
}

std::string ShellChannel::banner() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return banner_;
}

std::string ShellChannel::cwd() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return cwd_;
}

std::string ShellChannel::home() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return home_;
}
