#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

// Human-side commands the agent side has not been shown yet.
// Not synchronized: owned by a Session and only touched under its mutex.
class BrowserCommandBuffer {
public:
    void append(BrowserCommandEntry entry);

    // Fill in the result slot of the entry with this id, if it is still
    // buffered (it may already have been drained).
    bool update_result(const std::string& command_id, const CommandResult& result);

    // Return every entry and clear the buffer.
    std::vector<BrowserCommandEntry> drain();

    std::vector<BrowserCommandEntry> snapshot() const { return entries_; }
    void clear() { entries_.clear(); }
    bool empty() const { return entries_.empty(); }
    size_t size() const { return entries_.size(); }

private:
    std::vector<BrowserCommandEntry> entries_;
};
