#pragma once
#include <string>
#include <unordered_map>
#include <mutex>
#include <optional>

namespace runbus {

// Cached metadata about an in-flight run.
struct RunContext {
    std::optional<std::string> session_key;
    std::optional<std::string> verbose_level; // raw, normalized at use
    std::optional<bool> is_heartbeat;
};

// Process-wide table runId -> RunContext. All methods are thread-safe.
class RunContextRegistry {
public:
    // Store a copy if absent; otherwise only fill in fields that are still
    // unset. An existing non-empty field is never overwritten.
    void register_run(const std::string& run_id, const RunContext& context);

    std::optional<RunContext> get(const std::string& run_id) const;

    // Convenience: cached session key, empty if none.
    std::string session_key_for(const std::string& run_id) const;

    // Called once per run on its terminal lifecycle phase.
    void clear(const std::string& run_id);

    // Drop all entries.
    void reset();

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RunContext> contexts_;
};

} // namespace runbus
