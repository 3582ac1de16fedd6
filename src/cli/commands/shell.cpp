#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <sstream>
#include <fmt/format.h>
#include <core/utils.hpp>

static void print_browser_commands(const std::vector<BrowserCommandEntry>& entries) {
    for (const auto& e : entries) {
        std::string state = e.pending()
            ? theme::yellow("pending")
            : (e.result.exit_code == 0 ? theme::green("exit 0")
                                       : theme::red(fmt::format("exit {}", e.result.exit_code)));
        std::cout << fmt::format("    {} {:<18} ", format_clock(e.timestamp), e.command_id)
                  << state << "  " << e.command << "\n";
    }
}

// Human side: submit and return immediately, output arrives via the listener
static void do_type(BaseCLI& cli, const std::string& arg) {
    auto session = cli.require_session();
    if (!session) return;

    CommandOptions options;
    options.source = CommandSource::USER;
    auto sub = session->enqueue(arg, options);
    if (!sub.accepted()) {
        std::cout << theme::fail(fmt::format("{}: {}", error_code_name(sub.code), sub.error));
    }
}

// Agent side: goes through the gate, waits for the result
static void do_exec(BaseCLI& cli, const std::string& arg) {
    auto session = cli.require_session();
    if (!session) return;

    CommandOptions options;
    options.source = CommandSource::CLAUDE;
    auto sub = session->enqueue(arg, options);

    if (sub.code == ErrorCode::BROWSER_COMMANDS_EXECUTED) {
        std::cout << theme::warn("Commands were run in the terminal since the last exec:");
        print_browser_commands(sub.browser_commands);
        std::cout << theme::step("Review them, then run exec again.");
        return;
    }
    if (!sub.accepted()) {
        std::cout << theme::fail(fmt::format("{}: {}", error_code_name(sub.code), sub.error));
        if (sub.retry_allowed()) std::cout << theme::step("Retry shortly.");
        return;
    }

    try {
        CommandResult result = sub.result.get();
        std::lock_guard<std::mutex> lock(cli.output_mutex());
        if (result.success()) {
            std::cout << theme::dim("    exit 0") << "\n";
        } else {
            std::cout << theme::red(fmt::format("    exit {}", result.exit_code)) << "\n";
        }
    } catch (const CommandError& e) {
        std::cout << theme::fail(fmt::format("{}: {}", error_code_name(e.code()), e.what()));
    }
}

static void do_cancel(BaseCLI& cli, const std::string& arg) {
    auto session = cli.require_session();
    if (!session) return;

    std::string which = trimmed(arg);
    auto source = parse_source(which.empty() ? "user" : which);
    if (!source) {
        std::cout << theme::fail("Usage: cancel [user|claude|system]");
        return;
    }
    auto result = session->interrupt(*source);
    if (result.is_err()) std::cout << theme::fail(result.error);
}

static void do_signal(BaseCLI& cli, const std::string& arg) {
    auto session = cli.require_session();
    if (!session) return;

    auto result = session->send_signal(trimmed(arg));
    if (result.is_err()) std::cout << theme::fail(result.error);
}

static void do_resize(BaseCLI& cli, const std::string& arg) {
    auto session = cli.require_session();
    if (!session) return;

    std::istringstream iss(arg);
    int cols = 0, rows = 0;
    if (!(iss >> cols >> rows)) {
        std::cout << theme::fail("Usage: resize <cols> <rows>");
        return;
    }
    auto result = session->resize(cols, rows);
    if (result.is_err()) std::cout << theme::fail(result.error);
}

static void do_buffer(BaseCLI& cli, const std::string& arg) {
    auto session = cli.require_session();
    if (!session) return;

    if (trimmed(arg) == "clear") {
        session->clear_browser_buffer();
        std::cout << theme::ok("Browser buffer cleared.");
        return;
    }
    auto entries = session->browser_buffer();
    std::cout << theme::section("Browser buffer");
    if (entries.empty()) {
        std::cout << theme::dim("    Empty.") << "\n\n";
        return;
    }
    print_browser_commands(entries);
    std::cout << "\n";
}

static void do_history(BaseCLI& cli, const std::string&) {
    auto session = cli.require_session();
    if (!session) return;

    auto entries = session->history();
    std::cout << theme::section(fmt::format("History ({})", entries.size()));
    for (const auto& e : entries) {
        std::string exit = e.status == HistoryStatus::SUCCESS
            ? theme::green(fmt::format("{:>3}", e.exit_code))
            : theme::red(fmt::format("{:>3}", e.exit_code));
        std::cout << fmt::format("    {} {:>6}ms ", format_clock(e.timestamp), e.duration_ms)
                  << exit << "  " << theme::source(e.source) << "  " << e.command << "\n";
    }
    std::cout << "\n";
}

void register_shell_commands(BaseCLI& cli) {
    cli.add_command("type", do_type, "<cmd>  run as the terminal user");
    cli.add_command("exec", do_exec, "<cmd>  run as the agent, wait for result");
    cli.add_command("cancel", do_cancel, "[source]  Ctrl-C that source's command");
    cli.add_command("signal", do_signal, "<SIG>  SIGINT, SIGTERM, SIGQUIT, SIGTSTP");
    cli.add_command("resize", do_resize, "<cols> <rows>  resize the remote PTY");
    cli.add_command("buffer", do_buffer, "[clear]  browser commands not yet seen");
    cli.add_command("history", do_history, "finished commands on this session");
}
