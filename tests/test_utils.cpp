#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <core/error.hpp>
#include <core/types.hpp>

TEST(UtilsTest, StripAnsi) {
    EXPECT_EQ(strip_ansi("\x1b[01;32mgreen\x1b[0m"), "green");
    EXPECT_EQ(strip_ansi("\x1b]0;title\x07prompt"), "prompt");
    EXPECT_EQ(strip_ansi("\x1b[?2004hls\x1b[?2004l"), "ls");
    EXPECT_EQ(strip_ansi("plain"), "plain");
}

TEST(UtilsTest, CleanTerminalOutput) {
    EXPECT_EQ(clean_terminal_output("a\r\nb\r\n\r\n"), "a\nb");
    EXPECT_EQ(clean_terminal_output("\x1b[1mbold\x1b[0m  \r\n"), "bold");
    EXPECT_EQ(clean_terminal_output("  \r\n"), "");
    EXPECT_EQ(clean_terminal_output("  indented"), "  indented");
}

TEST(UtilsTest, Trim) {
    EXPECT_EQ(trimmed("  x y \r\n"), "x y");
    EXPECT_EQ(trimmed(" \t "), "");
}

TEST(UtilsTest, SafeStoi) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("nope", -1), -1);
}

TEST(UtilsTest, Base64Decode) {
    EXPECT_EQ(base64_decode("aGVsbG8="), "hello");
    EXPECT_EQ(base64_decode("aGVs\nbG8gd29y\r\nbGQ="), "hello world");
    EXPECT_EQ(base64_decode("not*base64"), "");
}

TEST(ErrorTest, NamesAndRetryPolicy) {
    EXPECT_STREQ(error_code_name(ErrorCode::SESSION_BUSY), "SESSION_BUSY");
    EXPECT_STREQ(error_code_name(ErrorCode::BROWSER_COMMANDS_EXECUTED), "BROWSER_COMMANDS_EXECUTED");
    EXPECT_STREQ(error_code_name(ErrorCode::QUEUE_FULL), "QUEUE_FULL");

    EXPECT_TRUE(is_retry_allowed(ErrorCode::SESSION_BUSY));
    EXPECT_TRUE(is_retry_allowed(ErrorCode::BROWSER_COMMANDS_EXECUTED));
    EXPECT_FALSE(is_retry_allowed(ErrorCode::QUEUE_FULL));
    EXPECT_FALSE(is_retry_allowed(ErrorCode::SESSION_DISCONNECTED));
}

TEST(ErrorTest, ErrorResponse) {
    auto r = make_error_response(ErrorCode::TRANSPORT_ERROR, "link down", "cmd-1");
    EXPECT_EQ(r.error, "TRANSPORT_ERROR");
    EXPECT_EQ(r.code, "TRANSPORT");
    EXPECT_EQ(r.message, "link down");
    EXPECT_EQ(r.command_id, "cmd-1");
    EXPECT_GT(r.timestamp, 0);

    auto busy = make_error_response(ErrorCode::SESSION_BUSY, "busy");
    EXPECT_EQ(busy.code, "SESSION_BUSY");
    EXPECT_EQ(busy.command_id, "");
}

TEST(TypesTest, SourceNames) {
    EXPECT_STREQ(source_name(CommandSource::USER), "user");
    EXPECT_STREQ(source_name(CommandSource::CLAUDE), "claude");
    EXPECT_EQ(parse_source("system"), CommandSource::SYSTEM);
    EXPECT_FALSE(parse_source("browser").has_value());
    EXPECT_STREQ(status_name(ConnectionStatus::RECONNECTING), "reconnecting");
}
