#pragma once

#include <functional>
#include <memory>
#include <string>
#include <core/types.hpp>

// Outcome of one command in the persistent remote shell.
// `error` is set only for transport failures; exit_code is meaningful only
// when it is empty.
struct ShellResult {
    int exit_code = -1;
    std::string output;  // raw terminal bytes between the markers
    std::string cwd;     // shell working directory after the command
    std::string home;    // $HOME as the shell reports it
    std::string error;

    bool transport_failed() const { return !error.empty(); }
};

using ChunkCallback = std::function<void(const std::string& chunk)>;

// One persistent interactive shell on a remote host. Working directory,
// environment and background jobs survive from one run() to the next.
//
// run() is only ever called by a session's worker thread, one command at a
// time. interrupt(), send_control(), resize(), check_connectivity() and
// close() may be called from any thread while a run() is in progress.
class RemoteShell {
public:
    virtual ~RemoteShell() = default;

    // Execute `command`, streaming output chunks (raw, possibly split
    // anywhere) to `on_chunk` as they arrive. Blocks until the remote reports
    // an exit status or the transport fails.
    virtual ShellResult run(const std::string& command, const ChunkCallback& on_chunk) = 0;

    // Write a control character (Ctrl-C, Ctrl-D, Ctrl-Z) to the terminal.
    virtual bool send_control(char c) = 0;

    virtual bool resize(int cols, int rows) = 0;

    // Connectivity as seen by the transport (keepalive / socket state).
    virtual ConnectionStatus check_connectivity() = 0;

    // Tear down the channel. A run() in progress returns with a transport error.
    virtual void close() = 0;

    // Text printed by the shell before it became ready (motd + first prompt).
    virtual std::string banner() const = 0;

    // Working directory reported by the most recent command.
    virtual std::string cwd() const = 0;

    // Home directory reported by the most recent command ("" until known).
    virtual std::string home() const = 0;
};

struct ShellConnection {
    ErrorCode code = ErrorCode::NONE;
    std::string error;
    std::unique_ptr<RemoteShell> shell;

    bool ok() const { return code == ErrorCode::NONE && shell != nullptr; }
};

// Opens remote shells. Failures are classified as AUTH_FAILED,
// HOST_UNREACHABLE, CONNECT_TIMEOUT or TRANSPORT_ERROR.
class ShellConnector {
public:
    virtual ~ShellConnector() = default;

    virtual ShellConnection connect(const ConnectionConfig& config,
                                    StatusCallback callback = nullptr) = 0;
};
