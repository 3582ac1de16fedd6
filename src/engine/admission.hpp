#pragma once

#include <string>
#include <core/types.hpp>

// Checks applied to a submission before it can touch a session's queue.
// All of them are pure and cheap; the session calls them under its lock.

// Non-empty after trimming, and not a command that would end the shared shell.
Result<void> validate_command_text(const std::string& command);

// `exit`, `exit <n>` and `logout` (surrounding whitespace ignored).
bool is_session_terminating(const std::string& command);

// Streaming-side ids: non-empty, at most MAX_COMMAND_ID_LENGTH characters,
// letters, digits, '_', '-' and '.' only.
Result<void> validate_command_id(const std::string& id);

// Registry keys: non-empty, no whitespace, no '@'.
Result<void> validate_session_name(const std::string& name);

// cmd-<ms>-<counter>, unique within the process.
std::string generate_command_id();
