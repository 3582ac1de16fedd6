#include "types.hpp"

const char* source_name(CommandSource source) {
    switch (source) {
        case CommandSource::USER:   return "user";
        case CommandSource::CLAUDE: return "claude";
        case CommandSource::SYSTEM: return "system";
    }
    return "system";
}

std::optional<CommandSource> parse_source(const std::string& name) {
    if (name == "user") return CommandSource::USER;
    if (name == "claude") return CommandSource::CLAUDE;
    if (name == "system") return CommandSource::SYSTEM;
    return std::nullopt;
}

const char* status_name(ConnectionStatus status) {
    switch (status) {
        case ConnectionStatus::CONNECTED:    return "connected";
        case ConnectionStatus::RECONNECTING: return "reconnecting";
        case ConnectionStatus::DISCONNECTED: return "disconnected";
        case ConnectionStatus::ERROR:        return "error";
    }
    return "error";
}
