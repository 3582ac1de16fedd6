#include "broadcaster.hpp"
#include <core/log.hpp>
#include <exception>
#include <vector>

ListenerId OutputBroadcaster::add_listener(OutputListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    ListenerId id = next_id_++;
    listeners_.emplace(id, std::move(listener));
    return id;
}

bool OutputBroadcaster::remove_listener(ListenerId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.erase(id) > 0;
}

size_t OutputBroadcaster::listener_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listeners_.size();
}

void OutputBroadcaster::broadcast(const TerminalOutputEntry& entry) const {
    if (entry.content.empty()) return;

    // Snapshot so listeners can add/remove listeners from inside the callback
    std::vector<std::pair<ListenerId, OutputListener>> snapshot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot.assign(listeners_.begin(), listeners_.end());
    }

    for (const auto& [id, listener] : snapshot) {
        try {
            listener(entry);
        } catch (const std::exception& e) {
            log_warn("broadcast: listener {} on session {} threw: {}",
                     id, entry.session_name, e.what());
        }
    }
}
