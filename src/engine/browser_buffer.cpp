#include "browser_buffer.hpp"

void BrowserCommandBuffer::append(BrowserCommandEntry entry) {
    entries_.push_back(std::move(entry));
}

bool BrowserCommandBuffer::update_result(const std::string& command_id,
                                         const CommandResult& result) {
    for (auto& entry : entries_) {
        if (entry.command_id == command_id) {
            entry.result = result;
            return true;
        }
    }
    return false;
}

std::vector<BrowserCommandEntry> BrowserCommandBuffer::drain() {
    std::vector<BrowserCommandEntry> drained;
    drained.swap(entries_);
    return drained;
}
