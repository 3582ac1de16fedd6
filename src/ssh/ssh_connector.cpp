#include "ssh_connector.hpp"
#include "shell_channel.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <sys/socket.h>
#include <netdb.h>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <mutex>

namespace {

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password
void kbd_callback(const char* /*name*/, int /*name_len*/,
                  const char* /*instruction*/, int /*instruction_len*/,
                  int num_prompts,
                  const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                  LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                  void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

void init_libssh2_once() {
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (libssh2_init(0) != 0) {
            log_error("ssh: libssh2_init failed");
        }
    });
}

// Owns the half-built connection until it is handed to a ShellChannel
struct PendingConnection {
    int sock = SSHGATE_INVALID_SOCKET;
    LIBSSH2_SESSION* session = nullptr;
    LIBSSH2_CHANNEL* channel = nullptr;

    ~PendingConnection() {
        if (channel) {
            libssh2_channel_close(channel);
            libssh2_channel_free(channel);
        }
        if (session) {
            libssh2_session_disconnect(session, "Connection setup failed");
            libssh2_session_free(session);
        }
        if (sock >= 0) platform::close_socket(sock);
    }

    void release() {
        sock = SSHGATE_INVALID_SOCKET;
        session = nullptr;
        channel = nullptr;
    }
};

ShellConnection failure(ErrorCode code, const std::string& message) {
    log_warn("ssh: connect failed ({}): {}", error_code_name(code), message);
    return ShellConnection{code, message, nullptr};
}

// Retry a non-blocking libssh2 call until it stops returning EAGAIN or the
// deadline passes.
template <typename Fn>
int until_ready(Fn fn, std::chrono::steady_clock::time_point deadline) {
    int rc;
    while ((rc = fn()) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() >= deadline) return LIBSSH2_ERROR_TIMEOUT;
        platform::sleep_ms(20);
    }
    return rc;
}

ShellConnection open_socket(const ConnectionConfig& config, PendingConnection& pc) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port = std::to_string(config.port);
    int gai = getaddrinfo(config.host.c_str(), port.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        return failure(ErrorCode::HOST_UNREACHABLE,
                       "Failed to resolve host: " + config.host);
    }

    pc.sock = socket(res->ai_family, res->ai_socktype, res->ai_protocol);
    if (pc.sock < 0) {
        freeaddrinfo(res);
        return failure(ErrorCode::TRANSPORT_ERROR, "Failed to create socket");
    }

    // Non-blocking for libssh2
    platform::set_nonblocking(pc.sock);

    int ret = ::connect(pc.sock, res->ai_addr, res->ai_addrlen);
    int connect_errno = errno;
    freeaddrinfo(res);

    if (ret < 0 && connect_errno != EINPROGRESS) {
        return failure(ErrorCode::HOST_UNREACHABLE,
                       "Failed to connect: " + std::string(strerror(connect_errno)));
    }

    // Wait for non-blocking connect to complete
    if (ret < 0) {
        int revents = platform::poll_socket(pc.sock, POLLOUT, config.timeout * 1000);
        if (revents == 0) {
            return failure(ErrorCode::CONNECT_TIMEOUT,
                           "Connection timed out after " + std::to_string(config.timeout) +
                           "s: " + config.host);
        }
        int sock_err = platform::socket_error(pc.sock);
        if (sock_err != 0) {
            return failure(ErrorCode::HOST_UNREACHABLE,
                           "Connection failed: " + std::string(strerror(sock_err)));
        }
    }
    return ShellConnection{};
}

ShellConnection authenticate(const ConnectionConfig& config, LIBSSH2_SESSION* session,
                             std::chrono::steady_clock::time_point deadline,
                             const StatusCallback& callback) {
    const std::string& user = config.username;

    if (!config.private_key.empty()) {
        if (callback) callback("Using public key auth...");
        const char* passphrase = config.passphrase.empty() ? nullptr : config.passphrase.c_str();
        int rc = until_ready([&] {
            return libssh2_userauth_publickey_frommemory(
                session, user.c_str(), user.size(), nullptr, 0,
                config.private_key.c_str(), config.private_key.size(), passphrase);
        }, deadline);
        if (rc == 0) return ShellConnection{};
        if (rc == LIBSSH2_ERROR_TIMEOUT) {
            return failure(ErrorCode::CONNECT_TIMEOUT, "Authentication timed out");
        }
        return failure(ErrorCode::AUTH_FAILED, "Public key authentication failed");
    }

    // Check what auth methods the server supports
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session, user.c_str(),
                                              static_cast<unsigned int>(user.size()))) == nullptr) {
        if (libssh2_session_last_errno(session) != LIBSSH2_ERROR_EAGAIN) break;
        if (std::chrono::steady_clock::now() >= deadline) {
            return failure(ErrorCode::CONNECT_TIMEOUT, "Authentication timed out");
        }
        platform::sleep_ms(20);
    }
    std::string methods = auth_list ? auth_list : "";
    log_debug("ssh: {} offers auth methods '{}'", config.host, methods);

    if (methods.find("keyboard-interactive") != std::string::npos) {
        if (callback) callback("Using keyboard-interactive auth...");
        KbdAuthData kbd_data{config.password, 0};
        *libssh2_session_abstract(session) = &kbd_data;
        int rc = until_ready([&] {
            return libssh2_userauth_keyboard_interactive(session, user.c_str(), kbd_callback);
        }, deadline);
        *libssh2_session_abstract(session) = nullptr;
        if (rc == 0) return ShellConnection{};
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");
        int rc = until_ready([&] {
            return libssh2_userauth_password(session, user.c_str(), config.password.c_str());
        }, deadline);
        if (rc == 0) return ShellConnection{};
        if (rc == LIBSSH2_ERROR_TIMEOUT) {
            return failure(ErrorCode::CONNECT_TIMEOUT, "Authentication timed out");
        }
    }

    return failure(ErrorCode::AUTH_FAILED, "Authentication failed (check username/password)");
}

} // namespace

ShellConnection SshConnector::connect(const ConnectionConfig& config, StatusCallback callback) {
    init_libssh2_once();

    if (callback) callback("Connecting to " + config.host + "...");

    PendingConnection pc;
    auto sock_result = open_socket(config, pc);
    if (sock_result.code != ErrorCode::NONE) return sock_result;

    if (callback) callback("TCP connected, starting SSH handshake...");

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(config.timeout);

    pc.session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!pc.session) {
        return failure(ErrorCode::TRANSPORT_ERROR, "Failed to create SSH session");
    }
    libssh2_session_set_blocking(pc.session, 0);

    int rc = until_ready([&] { return libssh2_session_handshake(pc.session, pc.sock); }, deadline);
    if (rc == LIBSSH2_ERROR_TIMEOUT) {
        return failure(ErrorCode::CONNECT_TIMEOUT, "SSH handshake timed out");
    }
    if (rc != 0) {
        return failure(ErrorCode::TRANSPORT_ERROR, "SSH handshake failed");
    }

    platform::enable_tcp_keepalive(pc.sock, 60, 15, 4);
    libssh2_keepalive_config(pc.session, 1, SSH_KEEPALIVE_INTERVAL_SECS);

    if (callback) callback("SSH handshake complete, authenticating...");

    auto auth = authenticate(config, pc.session, deadline, callback);
    if (auth.code != ErrorCode::NONE) return auth;

    while ((pc.channel = libssh2_channel_open_session(pc.session)) == nullptr) {
        if (libssh2_session_last_errno(pc.session) != LIBSSH2_ERROR_EAGAIN ||
            std::chrono::steady_clock::now() >= deadline) {
            return failure(ErrorCode::TRANSPORT_ERROR, "Failed to open SSH channel");
        }
        platform::sleep_ms(20);
    }

    rc = until_ready([&] {
        return libssh2_channel_request_pty_ex(pc.channel, "xterm", 5, nullptr, 0,
                                              DEFAULT_TERM_COLS, DEFAULT_TERM_ROWS, 0, 0);
    }, deadline);
    if (rc != 0) {
        return failure(ErrorCode::TRANSPORT_ERROR, "Failed to request PTY");
    }

    rc = until_ready([&] { return libssh2_channel_shell(pc.channel); }, deadline);
    if (rc != 0) {
        return failure(ErrorCode::TRANSPORT_ERROR, "Failed to request shell");
    }

    if (callback) callback("Waiting for shell...");

    auto shell = std::make_unique<ShellChannel>(pc.session, pc.channel, pc.sock);
    pc.release();

    auto started = shell->start(SHELL_PROMPT_TIMEOUT_SECS);
    if (started.is_err()) {
        return failure(started.code, started.error);
    }

    log_info("ssh: shell ready on {}@{}:{} (cwd {})",
             config.username, config.host, config.port, shell->cwd());
    if (callback) callback("Connected to " + config.host);

    return ShellConnection{ErrorCode::NONE, "", std::move(shell)};
}
