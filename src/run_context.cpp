#include "run_context.hpp"

namespace runbus {

static bool has_text(const std::optional<std::string>& v) {
    return v.has_value() && !v->empty();
}

void RunContextRegistry::register_run(const std::string& run_id, const RunContext& context) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contexts_.find(run_id);
    if (it == contexts_.end()) {
        contexts_.emplace(run_id, context);
        return;
    }

    auto& existing = it->second;
    if (!has_text(existing.session_key) && has_text(context.session_key))
        existing.session_key = context.session_key;
    if (!has_text(existing.verbose_level) && has_text(context.verbose_level))
        existing.verbose_level = context.verbose_level;
    if (!existing.is_heartbeat.has_value() && context.is_heartbeat.has_value())
        existing.is_heartbeat = context.is_heartbeat;
}

std::optional<RunContext> RunContextRegistry::get(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contexts_.find(run_id);
    if (it == contexts_.end()) return std::nullopt;
    return it->second;
}

std::string RunContextRegistry::session_key_for(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = contexts_.find(run_id);
    if (it == contexts_.end()) return {};
    return it->second.session_key.value_or("");
}

void RunContextRegistry::clear(const std::string& run_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    contexts_.erase(run_id);
}

void RunContextRegistry::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    contexts_.clear();
}

size_t RunContextRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contexts_.size();
}

} // namespace runbus
