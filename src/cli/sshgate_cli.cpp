#include "sshgate_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <iostream>
#include <sstream>
#include <cstdlib>
#include <readline/readline.h>
#include <readline/history.h>

SshGateCLI::SshGateCLI(std::unique_ptr<ShellConnector> connector)
    : BaseCLI(std::move(connector)) {
    register_all_commands();
}

void SshGateCLI::register_all_commands() {
    add_command("help", [this](BaseCLI&, const std::string&) {
        this->print_help();
    }, "show this help message");

    add_command("quit", [](BaseCLI& cli, const std::string&) {
        cli.quit_requested = true;
    }, "disconnect everything and exit");

    register_session_commands(*this);
    register_shell_commands(*this);
}

bool SshGateCLI::load_config(const std::filesystem::path& path, bool explicit_path) {
    if (!config_exists(path)) {
        if (explicit_path) {
            std::cout << theme::fail("Config not found: " + path.string());
            return false;
        }
        auto created = create_default_config(path);
        if (created.is_err()) {
            std::cout << theme::warn(created.error);
        } else {
            std::cout << theme::step("Wrote a starter config to " + path.string());
        }
    }

    auto result = config_exists(path) ? Config::load(path) : Result<Config>::Ok(Config{});
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return false;
    }
    config = result.value;

    if (!config->log().path.empty()) set_log_path(config->log().path);
    LogLevel level;
    if (parse_log_level(config->log().level, level)) set_log_level(level);

    init_registry();
    log_info("cli: started with {} configured session(s)", config->sessions().size());
    return true;
}

void SshGateCLI::run_repl() {
    std::cout << theme::banner();
    std::cout << theme::kv("Log", log_path());
    if (config) {
        std::cout << theme::kv("Sessions", std::to_string(config->sessions().size()) + " configured");
    }
    std::cout << theme::dim("    Type 'help' for commands, 'quit' to exit.") << "\n\n";

    std::string line;
    while (!quit_requested) {
        std::string prompt = get_prompt_string();
        char* raw = readline(prompt.c_str());
        if (!raw) {
            break;  // EOF / Ctrl-D
        }

        line = raw;
        free(raw);

        if (line.empty()) {
            continue;
        }

        add_history(line.c_str());

        std::istringstream iss(line);
        std::string command;
        iss >> command;

        std::string args;
        std::getline(iss, args);
        if (!args.empty() && args[0] == ' ') {
            args = args.substr(1);
        }

        execute_command(command, args);
    }

    std::cout << theme::dim("    Disconnecting...") << "\n";
    registry->shutdown();
}
