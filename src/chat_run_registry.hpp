#pragma once
#include <string>
#include <deque>
#include <unordered_map>
#include <mutex>
#include <optional>

namespace runbus {

// A pending "simple chat" request.
struct ChatRunEntry {
    std::string session_key;
    std::string client_run_id;

    bool operator==(const ChatRunEntry& other) const {
        return session_key == other.session_key && client_run_id == other.client_run_id;
    }
};

// FIFO of pending chat requests per queue key. The router keys queues by
// the internal run id the agent emits under, so the next terminal event of
// that run completes the oldest request. All methods are thread-safe.
class ChatRunRegistry {
public:
    void add(const std::string& session_id, ChatRunEntry entry);

    // Front entry without removing it.
    std::optional<ChatRunEntry> peek(const std::string& session_id) const;

    // Pop the front entry; the queue is deleted once empty.
    std::optional<ChatRunEntry> shift(const std::string& session_id);

    // Remove the first entry matching client_run_id (and session_key when
    // non-empty) wherever it sits in the queue.
    std::optional<ChatRunEntry> remove(const std::string& session_id,
                                       const std::string& client_run_id,
                                       const std::string& session_key = "");

    void clear();

    // Number of non-empty queues.
    size_t queue_count() const;

    // Pending entries for one queue (0 if absent).
    size_t pending(const std::string& session_id) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<ChatRunEntry>> queues_;
};

} // namespace runbus
