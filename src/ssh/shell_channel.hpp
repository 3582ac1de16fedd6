#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <engine/remote_shell.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// RemoteShell over one libssh2 PTY shell channel.
// Owns the session, channel and socket; closes and frees them on destruction.
// All libssh2 calls are made under brief io_mutex_ holds so that
// check_connectivity(), send_control() and close() can interleave with a
// running command.
class ShellChannel : public RemoteShell {
public:
    ShellChannel(LIBSSH2_SESSION* session, LIBSSH2_CHANNEL* ch, int sock);
    ~ShellChannel() override;

    ShellChannel(const ShellChannel&) = delete;
    ShellChannel& operator=(const ShellChannel&) = delete;

    // Wait for the first prompt, then run a no-op marker command to learn the
    // starting directory. Must succeed before the shell is handed out.
    Result<void> start(int prompt_timeout_secs);

    ShellResult run(const std::string& command, const ChunkCallback& on_chunk) override;
    bool send_control(char c) override;
    bool resize(int cols, int rows) override;
    ConnectionStatus check_connectivity() override;
    void close() override;
    std::string banner() const override;
    std::string cwd() const override;
    std::string home() const override;

private:
    LIBSSH2_SESSION* session_;
    LIBSSH2_CHANNEL* ch_;
    std::atomic<int> sock_;
    std::shared_ptr<std::mutex> io_mutex_;
    std::mutex cmd_mutex_;
    std::atomic<bool> closed_{false};
    int failed_checks_ = 0;

    mutable std::mutex state_mutex_;
    std::string banner_;
    std::string cwd_;
    std::string home_;

    bool write_all(const std::string& data);
    void drain();
};
