#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <unordered_map>
#include <vector>
#include <core/types.hpp>

using HistoryListener = std::function<void(const CommandHistoryEntry&)>;

// Ring of finished commands, oldest first. Not synchronized; the owning
// Session serializes access. Listeners are invoked by the session after it
// releases its lock (see listeners()).
class CommandHistory {
public:
    explicit CommandHistory(size_t limit) : limit_(limit) {}

    void append(CommandHistoryEntry entry);
    std::vector<CommandHistoryEntry> entries() const;
    size_t size() const { return entries_.size(); }
    size_t limit() const { return limit_; }

    uint64_t add_listener(HistoryListener listener);
    bool remove_listener(uint64_t id);
    std::vector<HistoryListener> listeners() const;

private:
    size_t limit_;
    std::deque<CommandHistoryEntry> entries_;
    std::unordered_map<uint64_t, HistoryListener> listeners_;
    uint64_t next_listener_id_ = 1;
};
