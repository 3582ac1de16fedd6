#include "config.hpp"
#include "constants.hpp"
#include "log.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <set>

namespace fs = std::filesystem;

// Populates a Config from a parsed YAML document
class ConfigBuilder {
public:
    static Result<Config> build(const YAML::Node& root);

private:
    static Result<LogSettings> parse_log(const YAML::Node& node);
    static Result<EngineSettings> parse_engine(const YAML::Node& node);
    static Result<SessionSpec> parse_session(const YAML::Node& node, size_t index);
};

Result<LogSettings> ConfigBuilder::parse_log(const YAML::Node& node) {
    LogSettings log;
    if (!node) return Result<LogSettings>::Ok(log);

    log.path = node["path"].as<std::string>("");
    log.level = node["level"].as<std::string>("info");

    LogLevel level;
    if (!parse_log_level(log.level, level)) {
        return Result<LogSettings>::Err(ErrorCode::CONFIG_ERROR,
            fmt::format("log.level must be debug, info, warn or error (got '{}')", log.level));
    }
    return Result<LogSettings>::Ok(log);
}

Result<EngineSettings> ConfigBuilder::parse_engine(const YAML::Node& node) {
    EngineSettings engine;
    if (!node) return Result<EngineSettings>::Ok(engine);

    int queue = node["max_queue_size"].as<int>(static_cast<int>(MAX_QUEUE_SIZE));
    int history = node["history_limit"].as<int>(static_cast<int>(HISTORY_LIMIT));
    if (queue < 1) {
        return Result<EngineSettings>::Err(ErrorCode::CONFIG_ERROR,
            "engine.max_queue_size must be at least 1");
    }
    if (history < 1) {
        return Result<EngineSettings>::Err(ErrorCode::CONFIG_ERROR,
            "engine.history_limit must be at least 1");
    }
    engine.max_queue_size = static_cast<size_t>(queue);
    engine.history_limit = static_cast<size_t>(history);
    return Result<EngineSettings>::Ok(engine);
}

Result<SessionSpec> ConfigBuilder::parse_session(const YAML::Node& node, size_t index) {
    if (!node.IsMap()) {
        return Result<SessionSpec>::Err(ErrorCode::CONFIG_ERROR,
            fmt::format("sessions[{}] must be a mapping", index));
    }

    SessionSpec s;
    s.name = node["name"].as<std::string>("");
    s.host = node["host"].as<std::string>("");
    s.port = node["port"].as<int>(22);
    s.user = node["user"].as<std::string>("");
    s.password = node["password"].as<std::string>("");
    s.key_file = node["key_file"].as<std::string>("");
    s.passphrase = node["passphrase"].as<std::string>("");
    s.timeout = node["timeout"].as<int>(CONNECT_TIMEOUT_SECS);

    std::string label = s.name.empty() ? fmt::format("sessions[{}]", index) : s.name;
    if (s.name.empty()) {
        return Result<SessionSpec>::Err(ErrorCode::CONFIG_ERROR, label + ": name is required");
    }
    if (s.host.empty()) {
        return Result<SessionSpec>::Err(ErrorCode::CONFIG_ERROR, label + ": host is required");
    }
    if (s.user.empty()) {
        return Result<SessionSpec>::Err(ErrorCode::CONFIG_ERROR, label + ": user is required");
    }
    if (s.port < 1 || s.port > 65535) {
        return Result<SessionSpec>::Err(ErrorCode::CONFIG_ERROR,
            fmt::format("{}: port {} out of range", label, s.port));
    }
    if (s.timeout < 1) {
        return Result<SessionSpec>::Err(ErrorCode::CONFIG_ERROR,
            label + ": timeout must be at least 1 second");
    }
    return Result<SessionSpec>::Ok(s);
}

Result<Config> ConfigBuilder::build(const YAML::Node& root) {
    Config config;
    if (!root || root.IsNull()) return Result<Config>::Ok(config);
    if (!root.IsMap()) {
        return Result<Config>::Err(ErrorCode::CONFIG_ERROR, "Config root must be a mapping");
    }

    auto log = parse_log(root["log"]);
    if (log.is_err()) return Result<Config>::Err(log.code, log.error);
    config.log_ = log.value;

    auto engine = parse_engine(root["engine"]);
    if (engine.is_err()) return Result<Config>::Err(engine.code, engine.error);
    config.engine_ = engine.value;

    const YAML::Node sessions = root["sessions"];
    if (sessions) {
        if (!sessions.IsSequence()) {
            return Result<Config>::Err(ErrorCode::CONFIG_ERROR, "sessions must be a list");
        }
        std::set<std::string> seen;
        for (size_t i = 0; i < sessions.size(); i++) {
            auto spec = parse_session(sessions[i], i);
            if (spec.is_err()) return Result<Config>::Err(spec.code, spec.error);
            if (!seen.insert(spec.value.name).second) {
                return Result<Config>::Err(ErrorCode::CONFIG_ERROR,
                    fmt::format("Duplicate session name '{}'", spec.value.name));
            }
            config.sessions_.push_back(spec.value);
        }
    }
    return Result<Config>::Ok(config);
}

// ── Paths ──────────────────────────────────────────────────────

fs::path get_config_dir() {
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path Config::get_config_path() {
    return get_config_dir() / CONFIG_FILE_NAME;
}

bool config_exists(const fs::path& path) {
    return fs::exists(path);
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# sshgate configuration

log:
  # path: /tmp/sshgate.log
  level: info

engine:
  max_queue_size: 100
  history_limit: 100

sessions: []
#  - name: dev
#    host: example.org
#    port: 22
#    user: alice
#    key_file: ~/.ssh/id_ed25519
#    # passphrase: ...
#    # password: ...
#    timeout: 10
)";

    try {
        fs::create_directories(path.parent_path());
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err(ErrorCode::CONFIG_ERROR,
                                     "Failed to create config file at " + path.string());
        }
        out << default_config;
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(ErrorCode::CONFIG_ERROR,
                                 std::string("Failed to write config file: ") + e.what());
    }
}

// ── Loading ────────────────────────────────────────────────────

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        return ConfigBuilder::build(YAML::Load(yaml_text));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorCode::CONFIG_ERROR,
                                   std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!config_exists(path)) {
        return Result<Config>::Err(ErrorCode::CONFIG_ERROR,
                                   "Config not found at " + path.string());
    }

    try {
        auto result = ConfigBuilder::build(YAML::LoadFile(path.string()));
        if (result.is_ok()) {
            log_debug("config: loaded {} session(s) from {}",
                      result.value.sessions().size(), path.string());
        }
        return result;
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorCode::CONFIG_ERROR,
                                   std::string("Failed to parse config: ") + e.what());
    }
}

const SessionSpec* Config::find_session(const std::string& name) const {
    for (const auto& s : sessions_) {
        if (s.name == name) return &s;
    }
    return nullptr;
}
