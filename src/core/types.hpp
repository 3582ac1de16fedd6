#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>
#include "error.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorCode code = ErrorCode::NONE;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorCode::NONE};
    }

    static Result<T> Err(ErrorCode code, const std::string& err) {
        return {false, T{}, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorCode code = ErrorCode::NONE;

    static Result<void> Ok() {
        return {true, "", ErrorCode::NONE};
    }

    static Result<void> Err(ErrorCode code, const std::string& err) {
        return {false, err, code};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// ── Provenance ──────────────────────────────────────────────

// Who issued a command. Controls echo and gate behaviour.
enum class CommandSource {
    USER,    // human typing into the streamed terminal
    CLAUDE,  // agent on the control protocol
    SYSTEM,  // internal housekeeping, never echoed
};

const char* source_name(CommandSource source);

// Parse the wire spelling ("user", "claude", "system").
std::optional<CommandSource> parse_source(const std::string& name);

enum class ConnectionStatus {
    CONNECTED,
    RECONNECTING,
    DISCONNECTED,
    ERROR,
};

const char* status_name(ConnectionStatus status);

// ── Commands ────────────────────────────────────────────────

struct CommandOptions {
    bool pty_requested = false;
    std::optional<int> timeout_ms;  // recorded only; the engine never expires a command
    CommandSource source = CommandSource::CLAUDE;
    std::string command_id;         // supplied by the streaming side; generated when empty
};

// Outcome of a command that ran to completion on the remote.
// A non-zero exit_code is a normal result, not an engine failure.
struct CommandResult {
    std::string stdout_data;
    std::string stderr_data;
    int exit_code = 0;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

enum class HistoryStatus { SUCCESS, FAILURE };

struct CommandHistoryEntry {
    std::string command;
    int64_t timestamp;     // start, ms since epoch
    int64_t duration_ms;
    int exit_code;
    HistoryStatus status;
    std::string session_name;
    CommandSource source;
};

// Human-side command pending acknowledgement by the agent side.
struct BrowserCommandEntry {
    std::string command;
    std::string command_id;
    int64_t timestamp;
    CommandSource source;
    CommandResult result{"", "", -1};  // exit_code -1 = still pending

    bool pending() const { return result.exit_code == -1; }
};

// One broadcast unit. Content is already CRLF-normalised.
struct TerminalOutputEntry {
    std::string session_name;
    std::string content;
    std::string command_id;
    CommandSource source;
    bool user_initiated;
};

// ── Sessions ────────────────────────────────────────────────

// Fully-resolved connection parameters. Key material is already in memory;
// the engine never touches the filesystem.
struct ConnectionConfig {
    std::string name;
    std::string host;
    int port = 22;
    std::string username;
    std::string password;
    std::string private_key;   // PEM / OpenSSH text
    std::string passphrase;
    int timeout = 10;          // seconds, connect + handshake
};

struct SessionInfo {
    std::string name;
    std::string host;
    std::string username;
    ConnectionStatus status;
    int64_t last_activity;
    std::optional<std::string> error_detail;
    std::optional<int64_t> error_timestamp;
};

struct EngineSettings {
    size_t max_queue_size = 100;
    size_t history_limit = 100;
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
