#pragma once

#include <engine/remote_shell.hpp>

// Opens a persistent PTY shell over libssh2 for a session.
//
// Sequence: TCP connect (non-blocking, bounded by config.timeout), SSH
// handshake, user authentication (in-memory private key when one is given,
// otherwise keyboard-interactive then password), PTY + shell request, wait
// for the first prompt.
class SshConnector : public ShellConnector {
public:
    SshConnector() = default;

    ShellConnection connect(const ConnectionConfig& config,
                            StatusCallback callback = nullptr) override;
};
