#pragma once
#include "chat_run_registry.hpp"
#include "config.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <deque>
#include <unordered_map>
#include <mutex>
#include <cstdint>
#include <optional>
#include <functional>

namespace runbus {

class Transport;

// Lifecycle of one client-visible chat run.
enum class ChatLinkState {
    Pending,   // request registered, no text yet
    Streaming, // at least one delta buffered
    Finalized, // final or error emitted
    Aborted    // cancelled; cleaned up without a projection
};

// Terminal link states remembered for inspection.
constexpr size_t kSettledChatLinkHistory = 256;

// Projects assistant text into the client "chat" protocol:
//   delta  {runId, sessionKey, seq, state:"delta", message}
//   final  {runId, sessionKey, seq, state:"final", message?}
//   error  {runId, sessionKey, seq, state:"error", errorMessage?}
// runId on the wire is the client's run id. Text is cumulative, so each
// delta replaces the buffer; deltas closer together than the throttle
// interval are buffered but not sent.
class ChatStreamProjector {
public:
    ChatStreamProjector(Transport& transport, const ChatConfig& config,
                        NowFn now = epoch_millis);

    ChatRunRegistry& registry() { return registry_; }
    const ChatRunRegistry& registry() const { return registry_; }

    // Queue a chat request for the internal run_id.
    void begin(const std::string& run_id, const ChatRunEntry& entry);

    // Returns true if a delta was sent (false when throttled).
    bool emit_delta(const std::string& session_key, const std::string& client_run_id,
                    uint64_t seq, const std::string& text, bool broadcast_global);

    void emit_final(const std::string& session_key, const std::string& client_run_id,
                    uint64_t seq, bool broadcast_global);

    // Always delivered globally and to the session.
    void emit_error(const std::string& session_key, const std::string& client_run_id,
                    uint64_t seq, const nlohmann::json& error);

    // Record that a run (by internal or client run id) was cancelled.
    void mark_aborted(const std::string& id);
    bool is_aborted(const std::string& run_id, const std::string& client_run_id) const;

    // Terminal cleanup for an aborted run: drops markers, buffer, throttle
    // stamp and the chat link. Emits nothing.
    void finish_aborted(const std::string& run_id, const std::string& client_run_id,
                        const std::string& session_key, bool has_link);

    std::optional<std::string> buffered_text(const std::string& client_run_id) const;
    bool has_throttle_stamp(const std::string& client_run_id) const;
    std::optional<ChatLinkState> link_state(const std::string& client_run_id) const;
    size_t aborted_count() const;

    void clear();

private:
    // Caller holds mutex_.
    void set_state(const std::string& client_run_id, ChatLinkState state);
    void discard(const std::string& client_run_id);
    // Transport failures are logged; the other copy is still attempted.
    void send(const std::string& client_run_id, const char* state,
              const std::function<void()>& deliver);
    nlohmann::json assistant_message(const std::string& text, uint64_t now) const;

    Transport& transport_;
    ChatConfig config_;
    NowFn now_;
    ChatRunRegistry registry_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> buffers_;
    std::unordered_map<std::string, uint64_t> delta_sent_at_;
    std::unordered_map<std::string, uint64_t> aborted_runs_; // id -> marked at
    std::unordered_map<std::string, ChatLinkState> link_states_;
    std::deque<std::string> settled_links_;
};

} // namespace runbus
