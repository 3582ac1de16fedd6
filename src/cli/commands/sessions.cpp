#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/key_loader.hpp>
#include <core/utils.hpp>

static void do_connect(BaseCLI& cli, const std::string& arg) {
    std::string name = trimmed(arg);
    if (name.empty()) {
        std::cout << theme::fail("Usage: connect <name>");
        return;
    }
    const SessionSpec* spec = cli.config ? cli.config->find_session(name) : nullptr;
    if (!spec) {
        std::cout << theme::fail("No session named '" + name + "' in the config.");
        return;
    }

    auto resolved = resolve_connection(*spec);
    if (resolved.is_err()) {
        std::cout << theme::fail(resolved.error);
        return;
    }

    auto callback = [](const std::string& msg) {
        std::cout << theme::dim("    " + msg) << "\n";
    };

    auto result = cli.registry->connect(resolved.value, callback);
    if (result.is_err()) {
        std::cout << theme::fail(fmt::format("{} ({})", result.error, error_code_name(result.code)));
        return;
    }
    cli.attach_output(result.value);
    cli.current_session = name;
    std::cout << theme::ok(fmt::format("Connected to {}@{}", spec->user, spec->host));
}

static void do_sessions(BaseCLI& cli, const std::string&) {
    cli.registry->poll_connectivity();
    auto infos = cli.registry->list_sessions();

    std::cout << theme::section("Sessions");
    if (infos.empty()) {
        std::cout << theme::dim("    No active sessions.") << "\n";
    }
    for (const auto& info : infos) {
        std::string marker = info.name == cli.current_session ? "*" : " ";
        std::cout << fmt::format("  {} {:<14} {:<28} ", marker, info.name,
                                 info.username + "@" + info.host)
                  << theme::status(info.status)
                  << theme::dim("  last activity " + format_clock(info.last_activity)) << "\n";
        if (info.error_detail) {
            std::cout << theme::dim("      " + *info.error_detail) << "\n";
        }
    }

    if (cli.config) {
        bool header = false;
        for (const auto& spec : cli.config->sessions()) {
            if (cli.registry->has_session(spec.name)) continue;
            if (!header) {
                std::cout << "\n" << theme::dim("    Configured, not connected:") << "\n";
                header = true;
            }
            std::cout << fmt::format("      {:<14} {}@{}:{}\n",
                                     spec.name, spec.user, spec.host, spec.port);
        }
    }
    std::cout << "\n";
}

static void do_use(BaseCLI& cli, const std::string& arg) {
    std::string name = trimmed(arg);
    if (!cli.registry->has_session(name)) {
        std::cout << theme::fail("Not connected: '" + name + "'");
        return;
    }
    cli.current_session = name;
}

static void do_disconnect(BaseCLI& cli, const std::string& arg) {
    std::string name = trimmed(arg);
    if (name.empty()) name = cli.current_session;
    if (name.empty()) {
        std::cout << theme::fail("Usage: disconnect [name]");
        return;
    }
    auto result = cli.registry->disconnect(name);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return;
    }
    if (name == cli.current_session) cli.current_session.clear();
    std::cout << theme::ok("Disconnected " + name);
}

void register_session_commands(BaseCLI& cli) {
    cli.add_command("connect", do_connect, "<name>  open a configured session");
    cli.add_command("sessions", do_sessions, "list sessions and their status");
    cli.add_command("use", do_use, "<name>  switch the current session");
    cli.add_command("disconnect", do_disconnect, "[name]  close a session");
}
