#pragma once

#include <string>

// BEGIN/DONE marker protocol for running commands in a persistent PTY shell.
//
// The command is typed as
//   echo __SSHGATE_BEG''IN__; eval '<cmd>'; printf '__SSHGATE_DO''NE__ ...' "$?" "$HOME" "$PWD"
// The quote split keeps the literal markers out of the PTY echo, so the first
// literal BEGIN in the stream is the real start of output and the first
// literal DONE is the real end. The DONE line carries the exit status, the
// shell's home directory and its working directory after the command,
// separated by 0x1f.

inline constexpr const char* SSHGATE_BEGIN_MARKER = "__SSHGATE_BEGIN__";
inline constexpr const char* SSHGATE_DONE_MARKER  = "__SSHGATE_DONE__";
inline constexpr char DONE_FIELD_SEPARATOR = '\x1f';

// Build the marker-wrapped line for `cmd`. Any text, including one that is
// not valid shell, produces exactly one BEGIN and one DONE line.
std::string build_marker_command(const std::string& cmd);

// Incremental parser for one marker-wrapped command.
//
// feed() consumes raw channel bytes and returns the part that is command
// output and safe to forward now. Everything before the BEGIN line (PTY echo,
// prompts, escape noise) is discarded. A tail that could be the start of the
// DONE marker is held back until the next feed() disambiguates it.
class MarkerStream {
public:
    std::string feed(const char* data, size_t len);
    std::string feed(const std::string& data) { return feed(data.data(), data.size()); }

    bool started() const { return state_ != State::SEEKING_BEGIN; }
    bool done() const { return state_ == State::DONE; }

    // Valid once done().
    int exit_code() const { return exit_code_; }
    const std::string& cwd() const { return cwd_; }
    const std::string& home() const { return home_; }

    // Everything returned by feed() so far.
    const std::string& output() const { return output_; }

private:
    enum class State { SEEKING_BEGIN, STREAMING, READING_DONE_LINE, DONE };

    State state_ = State::SEEKING_BEGIN;
    std::string buf_;
    std::string output_;
    int exit_code_ = -1;
    std::string cwd_;
    std::string home_;

    void parse_done_line(const std::string& line);
};

// Length of the longest suffix of `s` that is a proper prefix of `marker`.
size_t partial_marker_suffix(const std::string& s, const std::string& marker);
