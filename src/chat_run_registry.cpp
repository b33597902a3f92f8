#include "chat_run_registry.hpp"
#include <algorithm>

namespace runbus {

void ChatRunRegistry::add(const std::string& session_id, ChatRunEntry entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    queues_[session_id].push_back(std::move(entry));
}

std::optional<ChatRunEntry> ChatRunRegistry::peek(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(session_id);
    if (it == queues_.end() || it->second.empty()) return std::nullopt;
    return it->second.front();
}

std::optional<ChatRunEntry> ChatRunRegistry::shift(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(session_id);
    if (it == queues_.end() || it->second.empty()) return std::nullopt;

    ChatRunEntry entry = std::move(it->second.front());
    it->second.pop_front();
    if (it->second.empty()) queues_.erase(it);
    return entry;
}

std::optional<ChatRunEntry> ChatRunRegistry::remove(const std::string& session_id,
                                                    const std::string& client_run_id,
                                                    const std::string& session_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(session_id);
    if (it == queues_.end() || it->second.empty()) return std::nullopt;

    auto& queue = it->second;
    auto match = std::find_if(queue.begin(), queue.end(), [&](const ChatRunEntry& e) {
        return e.client_run_id == client_run_id &&
               (session_key.empty() || e.session_key == session_key);
    });
    if (match == queue.end()) return std::nullopt;

    ChatRunEntry entry = std::move(*match);
    queue.erase(match);
    if (queue.empty()) queues_.erase(it);
    return entry;
}

void ChatRunRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    queues_.clear();
}

size_t ChatRunRegistry::queue_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queues_.size();
}

size_t ChatRunRegistry::pending(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = queues_.find(session_id);
    if (it == queues_.end()) return 0;
    return it->second.size();
}

} // namespace runbus
