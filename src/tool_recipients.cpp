#include "tool_recipients.hpp"

namespace runbus {

ToolEventRecipientRegistry::ToolEventRecipientRegistry(NowFn now, uint64_t ttl_ms,
                                                       uint64_t final_grace_ms)
    : now_(std::move(now)), ttl_ms_(ttl_ms), final_grace_ms_(final_grace_ms)
{}

void ToolEventRecipientRegistry::add(const std::string& run_id, const std::string& conn_id) {
    if (run_id.empty() || conn_id.empty()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t now = now_();
    auto& entry = entries_[run_id];
    entry.conn_ids.insert(conn_id);
    entry.updated_at = now;
    prune(now);
}

std::optional<ConnIdSet> ToolEventRecipientRegistry::get(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.find(run_id) == entries_.end()) return std::nullopt;

    // Sweep before refreshing so an already-expired entry is not revived.
    uint64_t now = now_();
    prune(now);

    auto it = entries_.find(run_id);
    if (it == entries_.end()) return std::nullopt;
    it->second.updated_at = now;
    return it->second.conn_ids;
}

void ToolEventRecipientRegistry::mark_final(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(run_id);
    if (it == entries_.end()) return;

    uint64_t now = now_();
    it->second.finalized_at = now;
    prune(now);
}

size_t ToolEventRecipientRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void ToolEventRecipientRegistry::prune(uint64_t now) {
    for (auto it = entries_.begin(); it != entries_.end(); ) {
        const auto& entry = it->second;
        uint64_t cutoff = entry.finalized_at
            ? *entry.finalized_at + final_grace_ms_
            : entry.updated_at + ttl_ms_;
        if (now >= cutoff) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

} // namespace runbus
