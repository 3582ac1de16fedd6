#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <unordered_map>
#include <core/types.hpp>

using OutputListener = std::function<void(const TerminalOutputEntry&)>;
using ListenerId = uint64_t;

// Fans terminal output out to every registered listener, synchronously, on
// the broadcasting thread. Listeners must not block and must not call back
// into the session that is broadcasting.
class OutputBroadcaster {
public:
    ListenerId add_listener(OutputListener listener);
    bool remove_listener(ListenerId id);
    size_t listener_count() const;

    void broadcast(const TerminalOutputEntry& entry) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<ListenerId, OutputListener> listeners_;
    ListenerId next_id_ = 1;
};
