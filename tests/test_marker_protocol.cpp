#include <gtest/gtest.h>
#include <ssh/marker_protocol.hpp>
#include <ssh/expect.hpp>
#include <algorithm>

TEST(MarkerProtocolTest, CommandKeepsMarkersOutOfEcho) {
    std::string cmd = build_marker_command("ls");
    EXPECT_EQ(cmd.find(SSHGATE_BEGIN_MARKER), std::string::npos);
    EXPECT_EQ(cmd.find(SSHGATE_DONE_MARKER), std::string::npos);
    EXPECT_NE(cmd.find("; eval 'ls'; printf "), std::string::npos);
    EXPECT_NE(cmd.find("\"$?\" \"$HOME\" \"$PWD\""), std::string::npos);
    EXPECT_EQ(cmd.back(), '\n');
}

// Text that would break a plain `BEGIN; <cmd>; DONE` line stays inside the
// eval word, so the DONE printf is always a separate, complete command.
TEST(MarkerProtocolTest, ShellSyntaxInCommandCannotSwallowDone) {
    for (const std::string text : {"sleep 1 &", "echo hi # note", "ls &&"}) {
        std::string cmd = build_marker_command(text);
        EXPECT_NE(cmd.find("; eval '" + text + "'; printf '__SSHGATE_DO''NE__ "),
                  std::string::npos) << text;
        EXPECT_EQ(std::count(cmd.begin(), cmd.end(), '\n'), 1) << text;
    }
}

TEST(MarkerProtocolTest, SingleQuotesAreEscaped) {
    std::string cmd = build_marker_command("echo 'a b'");
    EXPECT_NE(cmd.find(R"(eval 'echo '\''a b'\'''; )"), std::string::npos);
}

TEST(MarkerProtocolTest, MultiLineCommandStaysInsideEval) {
    std::string cmd = build_marker_command("cat <<EOF\nhi\nEOF");
    EXPECT_NE(cmd.find("eval 'cat <<EOF\nhi\nEOF'; printf '__SSHGATE_DO''NE__ "),
              std::string::npos);
}

TEST(MarkerStreamTest, DoneLineReportsHomeAndDirectory) {
    MarkerStream s;
    s.feed("__SSHGATE_BEGIN__\r\n"
           "__SSHGATE_DONE__ 0\x1f/srv/users/alice\x1f/srv/users/alice/my dir\r\n");
    ASSERT_TRUE(s.done());
    EXPECT_EQ(s.exit_code(), 0);
    EXPECT_EQ(s.home(), "/srv/users/alice");
    EXPECT_EQ(s.cwd(), "/srv/users/alice/my dir");
}

TEST(MarkerStreamTest, DiscardsEchoAndParsesDoneLine) {
    MarkerStream s;
    std::string out = s.feed(
        "echo __SSHGATE_BEG''IN__; eval 'pwd'; printf '__SSHGATE_DO''NE__ %s' \"$?\"\r\n"
        "__SSHGATE_BEGIN__\r\n"
        "/home/alice\r\n"
        "__SSHGATE_DONE__ 0 /home/alice\r\n"
        "[alice@box ~]$ ");
    EXPECT_EQ(out, "/home/alice\r\n");
    EXPECT_TRUE(s.done());
    EXPECT_EQ(s.exit_code(), 0);
    EXPECT_EQ(s.cwd(), "/home/alice");
}

TEST(MarkerStreamTest, MarkersSplitAcrossChunks) {
    MarkerStream s;
    std::string out;
    for (const char* chunk : {"noise __SSHGATE_BE", "GIN__\r\nhel", "lo\r\n__SSHGATE_DO",
                              "NE__ 2 /tmp/my dir", "\r\n"}) {
        out += s.feed(chunk);
    }
    EXPECT_EQ(out, "hello\r\n");
    EXPECT_TRUE(s.done());
    EXPECT_EQ(s.exit_code(), 2);
    EXPECT_EQ(s.cwd(), "/tmp/my dir");
    EXPECT_EQ(s.output(), "hello\r\n");
}

TEST(MarkerStreamTest, HoldsBackOnlyAPossibleMarkerPrefix) {
    MarkerStream s;
    s.feed("__SSHGATE_BEGIN__\n");
    EXPECT_TRUE(s.started());
    EXPECT_EQ(s.feed("price is __"), "price is ");
    EXPECT_EQ(s.feed("5"), "__5");
    EXPECT_FALSE(s.done());
}

TEST(MarkerStreamTest, NothingBeforeBegin) {
    MarkerStream s;
    EXPECT_EQ(s.feed("Last login: today\r\n$ "), "");
    EXPECT_FALSE(s.started());
}

TEST(PartialMarkerTest, Suffixes) {
    EXPECT_EQ(partial_marker_suffix("abc__SSH", "__SSHGATE_DONE__"), 5u);
    EXPECT_EQ(partial_marker_suffix("abc", "__SSHGATE_DONE__"), 0u);
    EXPECT_EQ(partial_marker_suffix("x_", "__SSHGATE_DONE__"), 1u);
}

TEST(PromptTest, RecognisesCommonPrompts) {
    EXPECT_TRUE(looks_like_prompt("Last login: x\r\nalice@box:~$ "));
    EXPECT_TRUE(looks_like_prompt("[alice@box ~]$ "));
    EXPECT_TRUE(looks_like_prompt("root@box:/# "));
    EXPECT_TRUE(looks_like_prompt("\x1b[01;32malice@box\x1b[00m:~$ "));
    EXPECT_TRUE(looks_like_prompt("box> "));
}

TEST(PromptTest, RejectsOrdinaryOutput) {
    EXPECT_FALSE(looks_like_prompt(""));
    EXPECT_FALSE(looks_like_prompt("Welcome to Ubuntu\r\n"));
    EXPECT_FALSE(looks_like_prompt("Password: "));
}
