#pragma once
#include "util.hpp"
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <mutex>
#include <cstdint>
#include <optional>

namespace runbus {

constexpr uint64_t kToolRecipientTtlMs = 10 * 60 * 1000;   // 10 minutes
constexpr uint64_t kToolRecipientFinalGraceMs = 30 * 1000; // 30 seconds

using ConnIdSet = std::unordered_set<std::string>;

// Per-run set of connections entitled to verbose tool telemetry.
//
// Entries expire ttl_ms after their last add/get, or final_grace_ms after
// mark_final. Expired entries are swept on every add/get/mark_final for
// any run. All methods are thread-safe.
class ToolEventRecipientRegistry {
public:
    explicit ToolEventRecipientRegistry(NowFn now = epoch_millis,
                                        uint64_t ttl_ms = kToolRecipientTtlMs,
                                        uint64_t final_grace_ms = kToolRecipientFinalGraceMs);

    // No-op if either argument is empty.
    void add(const std::string& run_id, const std::string& conn_id);

    // Live connection set (a read counts as activity), or nullopt.
    std::optional<ConnIdSet> get(const std::string& run_id);

    // Start the grace countdown for run_id.
    void mark_final(const std::string& run_id);

    // Entries currently held (expired ones included until the next sweep).
    size_t size() const;

private:
    struct Entry {
        ConnIdSet conn_ids;
        uint64_t updated_at = 0;
        std::optional<uint64_t> finalized_at;
    };

    // Caller holds mutex_.
    void prune(uint64_t now);

    NowFn now_;
    uint64_t ttl_ms_;
    uint64_t final_grace_ms_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

} // namespace runbus
