#pragma once
#include "run_event.hpp"
#include "util.hpp"
#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include <mutex>
#include <cstdint>

namespace runbus {

class RunContextRegistry;

using RunEventHandler = std::function<void(const RunEvent&)>;

// Sequences producer events per run and fans them out to subscribers.
//
// emit() assigns seq 1, 2, 3... per runId, drops an assistant event whose
// text repeats the previous one for the same run, resolves the session key
// from the RunContextRegistry when the producer did not supply one and
// stamps a timestamp. The seq counter of a run keeps counting after its
// terminal phase; only the duplicate-text memory is dropped. Subscribers run inline on the caller's thread in
// registration order; one that throws is logged and skipped.
class EventBus {
public:
    explicit EventBus(const RunContextRegistry& contexts, NowFn now = epoch_millis);

    // Subscribe to every emitted event. Returns a subscription ID.
    uint64_t subscribe(RunEventHandler handler);

    // Unsubscribe by ID. Returns true if found and removed.
    bool unsubscribe(uint64_t id);

    // Returns false if the event was suppressed as a duplicate.
    bool emit(const AgentEventInput& input);

    // Remove all subscriptions.
    void clear();

    size_t subscriber_count() const;

    // Sequence number of the last accepted event for run_id (0 if none).
    uint64_t last_seq(const std::string& run_id) const;

private:
    struct Subscription {
        uint64_t id;
        RunEventHandler handler;
    };

    const RunContextRegistry& contexts_;
    NowFn now_;

    mutable std::mutex mutex_;
    std::vector<Subscription> subscriptions_;
    uint64_t next_id_ = 1;

    std::unordered_map<std::string, uint64_t> seq_by_run_;
    std::unordered_map<std::string, std::string> last_assistant_text_;
};

} // namespace runbus
