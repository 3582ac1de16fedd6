#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <mutex>
#include <optional>
#include <core/config.hpp>
#include <engine/session_registry.hpp>

class BaseCLI {
public:
    explicit BaseCLI(std::unique_ptr<ShellConnector> connector);
    virtual ~BaseCLI();

    using CommandHandler = std::function<void(BaseCLI&, const std::string&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    // Build the registry from the loaded config (engine limits, logging)
    void init_registry();

    // Current session, printing why not when there is none
    std::shared_ptr<Session> require_session();

    // Mirror a session's broadcast output to this terminal
    void attach_output(const std::shared_ptr<Session>& session);

    void execute_command(const std::string& command, const std::string& args = "");
    void print_help() const;

    // Serializes writes from listener threads and the REPL thread
    std::mutex& output_mutex() { return output_mutex_; }

    // Public state
    std::optional<Config> config;
    std::unique_ptr<ShellConnector> connector;
    std::unique_ptr<SessionRegistry> registry;
    std::string current_session;
    bool quit_requested = false;

    std::string get_prompt_string() const;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
    std::mutex output_mutex_;
};
