#pragma once

#include <string>

// Converts a stream of terminal output, split into arbitrary chunks, to CRLF
// line endings. Bare LF and bare CR both become CRLF; an existing CRLF is
// left alone even when the CR and LF arrive in different chunks.
class CrlfNormalizer {
public:
    std::string feed(const std::string& chunk);

    // Flush a held-back CR and, when anything was written, make sure the
    // transcript ends on a line boundary.
    std::string finish();

    bool empty() const { return !wrote_any_; }

private:
    bool pending_cr_ = false;
    bool at_line_start_ = true;
    bool wrote_any_ = false;
};

// `[user@host cwd]$ <command>\r\n`
std::string echo_line(const std::string& user, const std::string& host,
                      const std::string& cwd, const std::string& home,
                      const std::string& command);

// Directory as bash's default prompt (\W) shows it: `~` for the home
// directory, otherwise the last path component.
std::string display_cwd(const std::string& cwd, const std::string& home);

// Drop an unterminated final line that ends like a shell prompt ($ # > %),
// so a login banner does not show a prompt ahead of the first echo line.
std::string strip_trailing_prompt(const std::string& text);

// Conventional home directory for `user`, used until the shell reports $HOME.
std::string default_home(const std::string& user);
