#pragma once

#include "base_cli.hpp"
#include <filesystem>
#include <string>

void register_session_commands(BaseCLI& cli);
void register_shell_commands(BaseCLI& cli);

class SshGateCLI : public BaseCLI {
public:
    explicit SshGateCLI(std::unique_ptr<ShellConnector> connector);

    // Load config, configure logging and the registry. False on a bad config.
    bool load_config(const std::filesystem::path& path, bool explicit_path);

    void run_repl();

private:
    void register_all_commands();
};
