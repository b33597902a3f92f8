#include "session_store.hpp"

namespace runbus {

std::optional<SessionEntry> InMemorySessionStore::find(const std::string& session_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(session_key);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

void InMemorySessionStore::set_verbose_level(const std::string& session_key,
                                             const std::string& level) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& entry = entries_[session_key];
    entry.session_key = session_key;
    entry.verbose_level = level;
}

void InMemorySessionStore::remove(const std::string& session_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(session_key);
}

} // namespace runbus
