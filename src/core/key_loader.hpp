#pragma once

#include <string>
#include "config.hpp"
#include "types.hpp"

// Read a private key for in-memory authentication.
//
// The path may start with `~`. Paths containing `..`, and paths that are or
// resolve (through symlinks) into /etc, /proc, /sys, /dev, /boot or /root
// are refused. An encrypted key without a passphrase is refused. Error
// messages never contain the path.
Result<std::string> load_private_key(const std::string& path, const std::string& passphrase);

// PEM `Proc-Type: 4,ENCRYPTED` / `DEK-Info:`, PKCS#8 `ENCRYPTED PRIVATE KEY`,
// or an OpenSSH key whose header names a cipher or bcrypt KDF.
bool is_key_encrypted(const std::string& key);

// Replace filesystem paths and the home directory in a message.
std::string sanitize_key_error(const std::string& message);

// SessionSpec (from the config file) -> ConnectionConfig (key in memory).
Result<ConnectionConfig> resolve_connection(const SessionSpec& spec);
