#include "command_history.hpp"

void CommandHistory::append(CommandHistoryEntry entry) {
    entries_.push_back(std::move(entry));
    while (entries_.size() > limit_) {
        entries_.pop_front();
    }
}

std::vector<CommandHistoryEntry> CommandHistory::entries() const {
    return std::vector<CommandHistoryEntry>(entries_.begin(), entries_.end());
}

uint64_t CommandHistory::add_listener(HistoryListener listener) {
    uint64_t id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

bool CommandHistory::remove_listener(uint64_t id) {
    return listeners_.erase(id) > 0;
}

std::vector<HistoryListener> CommandHistory::listeners() const {
    std::vector<HistoryListener> out;
    out.reserve(listeners_.size());
    for (const auto& [id, listener] : listeners_) out.push_back(listener);
    return out;
}
