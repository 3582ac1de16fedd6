#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

struct LogSettings {
    std::string path;            // empty = <tmp>/sshgate.log
    std::string level = "info";
};

// One entry of the `sessions:` list. Credentials are still on disk here;
// resolve_connection() (key_loader.hpp) turns this into a ConnectionConfig.
struct SessionSpec {
    std::string name;
    std::string host;
    int port = 22;
    std::string user;
    std::string password;
    std::string key_file;
    std::string passphrase;
    int timeout = 10;
};

class Config {
public:
    // Load ~/.sshgate/config.yaml, or the given file
    static Result<Config> load(const fs::path& path = get_config_path());

    // Parse YAML text directly
    static Result<Config> parse(const std::string& yaml_text);

    const LogSettings& log() const { return log_; }
    const EngineSettings& engine() const { return engine_; }
    const std::vector<SessionSpec>& sessions() const { return sessions_; }

    // nullptr when no session has that name
    const SessionSpec* find_session(const std::string& name) const;

    static fs::path get_config_path();

public:
    Config() = default;

private:
    LogSettings log_;
    EngineSettings engine_;
    std::vector<SessionSpec> sessions_;

    friend class ConfigBuilder;
};

bool config_exists(const fs::path& path = Config::get_config_path());
fs::path get_config_dir();

// Write a commented starter config; leaves an existing file alone
Result<void> create_default_config(const fs::path& path = Config::get_config_path());
