#include "base_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <iostream>
#include <vector>
#include <fmt/format.h>

BaseCLI::BaseCLI(std::unique_ptr<ShellConnector> connector)
    : connector(std::move(connector)) {}

BaseCLI::~BaseCLI() {
    if (registry) registry->shutdown();
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

void BaseCLI::init_registry() {
    EngineSettings settings = config ? config->engine() : EngineSettings{};
    registry = std::make_unique<SessionRegistry>(*connector, settings);
}

std::shared_ptr<Session> BaseCLI::require_session() {
    if (current_session.empty()) {
        std::cout << theme::fail("No session selected.");
        std::cout << theme::step("Run 'connect <name>' or 'use <name>' first.");
        return nullptr;
    }
    auto result = registry->get(current_session);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        current_session.clear();
        return nullptr;
    }
    return result.value;
}

void BaseCLI::attach_output(const std::shared_ptr<Session>& session) {
    session->add_output_listener([this](const TerminalOutputEntry& entry) {
        std::lock_guard<std::mutex> lock(output_mutex_);
        std::cout << entry.content << std::flush;
    });
}

void BaseCLI::execute_command(const std::string& command, const std::string& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Type 'help' for available commands.");
        return;
    }

    try {
        it->second.first(*this, args);
    } catch (const std::exception& e) {
        log_error("cli: '{}' failed: {}", command, e.what());
        std::cout << theme::fail(std::string(e.what()));
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Sessions", {"connect", "sessions", "use", "disconnect"}},
        {"Commands", {"type", "exec", "cancel", "signal", "resize"}},
        {"Review",   {"buffer", "history"}},
        {"General",  {"help", "quit"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::AMBER << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::TEAL
                          << fmt::format("    {:<22}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

std::string BaseCLI::get_prompt_string() const {
    // Readline needs \001 / \002 around non-printing chars to size the prompt
    auto rl_esc = [](const std::string& code) {
        return std::string("\001") + code + std::string("\002");
    };

    if (current_session.empty()) {
        return rl_esc(theme::color::TEAL) + "sshgate"
             + rl_esc(theme::color::RESET) + "> ";
    }
    return rl_esc(theme::color::TEAL) + "sshgate"
         + rl_esc(theme::color::RESET) + ":"
         + rl_esc(theme::color::AMBER) + current_session
         + rl_esc(theme::color::RESET) + "> ";
}
