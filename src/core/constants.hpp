#pragma once

#include <cstddef>

// ── Admission ───────────────────────────────────────────────
constexpr size_t MAX_QUEUE_SIZE          = 100;   // admitted-but-not-started commands per session
constexpr size_t HISTORY_LIMIT           = 100;   // finished commands kept per session
constexpr size_t MAX_COMMAND_ID_LENGTH   = 128;

// ── Timeouts ────────────────────────────────────────────────
constexpr int CONNECT_TIMEOUT_SECS       = 10;    // TCP connect + SSH handshake
constexpr int SHELL_PROMPT_TIMEOUT_SECS  = 15;    // wait for first prompt after shell request

// ── Keepalive ───────────────────────────────────────────────
constexpr int SSH_KEEPALIVE_INTERVAL_SECS = 30;
constexpr int CHECK_FAILURES_FOR_ERROR    = 2;    // consecutive failed checks before ERROR

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr int SSH_DRAIN_BUF_SIZE         = 4096;

// ── Terminal ────────────────────────────────────────────────
constexpr int DEFAULT_TERM_COLS          = 120;
constexpr int DEFAULT_TERM_ROWS          = 40;
constexpr int MAX_TERM_DIMENSION         = 1000;

// ── Paths ───────────────────────────────────────────────────
constexpr const char* DEFAULT_LOG_FILE   = "sshgate.log";
constexpr const char* CONFIG_DIR_NAME    = ".sshgate";
constexpr const char* CONFIG_FILE_NAME   = "config.yaml";
