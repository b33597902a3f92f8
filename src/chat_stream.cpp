#include "chat_stream.hpp"
#include "transport.hpp"
#include <iostream>
#include <exception>

namespace runbus {

ChatStreamProjector::ChatStreamProjector(Transport& transport, const ChatConfig& config,
                                         NowFn now)
    : transport_(transport), config_(config), now_(std::move(now))
{}

void ChatStreamProjector::begin(const std::string& run_id, const ChatRunEntry& entry) {
    registry_.add(run_id, entry);
    std::lock_guard<std::mutex> lock(mutex_);
    set_state(entry.client_run_id, ChatLinkState::Pending);
}

nlohmann::json ChatStreamProjector::assistant_message(const std::string& text,
                                                      uint64_t now) const {
    return {
        {"role", "assistant"},
        {"content", nlohmann::json::array({{{"type", "text"}, {"text", text}}})},
        {"timestamp", now}
    };
}

bool ChatStreamProjector::emit_delta(const std::string& session_key,
                                     const std::string& client_run_id,
                                     uint64_t seq, const std::string& text,
                                     bool broadcast_global) {
    nlohmann::json payload;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        buffers_[client_run_id] = text;
        set_state(client_run_id, ChatLinkState::Streaming);

        uint64_t now = now_();
        auto it = delta_sent_at_.find(client_run_id);
        if (it != delta_sent_at_.end() && now - it->second < config_.delta_throttle_ms) {
            return false;
        }
        delta_sent_at_[client_run_id] = now;

        payload = {
            {"runId", client_run_id},
            {"sessionKey", session_key},
            {"seq", seq},
            {"state", "delta"},
            {"message", assistant_message(text, now)}
        };
    }

    if (broadcast_global) {
        send(client_run_id, "delta", [&] {
            transport_.broadcast("chat", payload, BroadcastOptions{true});
        });
    }
    send(client_run_id, "delta", [&] {
        transport_.send_to_session(session_key, "chat", payload);
    });
    return true;
}

void ChatStreamProjector::emit_final(const std::string& session_key,
                                     const std::string& client_run_id,
                                     uint64_t seq, bool broadcast_global) {
    nlohmann::json payload = {
        {"runId", client_run_id},
        {"sessionKey", session_key},
        {"seq", seq},
        {"state", "final"}
    };
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = buffers_.find(client_run_id);
        std::string text = it != buffers_.end() ? trim(it->second) : "";
        discard(client_run_id);
        set_state(client_run_id, ChatLinkState::Finalized);
        if (!text.empty()) {
            payload["message"] = assistant_message(text, now_());
        }
    }

    if (broadcast_global) {
        send(client_run_id, "final", [&] {
            transport_.broadcast("chat", payload, BroadcastOptions{true});
        });
    }
    send(client_run_id, "final", [&] {
        transport_.send_to_session(session_key, "chat", payload);
    });
}

void ChatStreamProjector::emit_error(const std::string& session_key,
                                     const std::string& client_run_id,
                                     uint64_t seq, const nlohmann::json& error) {
    nlohmann::json payload = {
        {"runId", client_run_id},
        {"sessionKey", session_key},
        {"seq", seq},
        {"state", "error"}
    };
    std::string message = format_for_log(error);
    if (!message.empty()) payload["errorMessage"] = message;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        discard(client_run_id);
        set_state(client_run_id, ChatLinkState::Finalized);
    }

    send(client_run_id, "error", [&] {
        transport_.broadcast("chat", payload, BroadcastOptions{});
    });
    send(client_run_id, "error", [&] {
        transport_.send_to_session(session_key, "chat", payload);
    });
}

void ChatStreamProjector::send(const std::string& client_run_id, const char* state,
                               const std::function<void()>& deliver) {
    try {
        deliver();
    } catch (const std::exception& e) {
        std::cerr << "[chat] Failed to deliver " << state << " for " << client_run_id
                  << ": " << e.what() << "\n";
    } catch (...) {
        std::cerr << "[chat] Failed to deliver " << state << " for " << client_run_id
                  << ": unknown exception\n";
    }
}

void ChatStreamProjector::mark_aborted(const std::string& id) {
    if (id.empty()) return;
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t now = now_();

    // Markers for runs that never reached a terminal phase
    for (auto it = aborted_runs_.begin(); it != aborted_runs_.end(); ) {
        if (now - it->second >= config_.aborted_run_ttl_ms) {
            it = aborted_runs_.erase(it);
        } else {
            ++it;
        }
    }
    aborted_runs_[id] = now;
}

bool ChatStreamProjector::is_aborted(const std::string& run_id,
                                     const std::string& client_run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aborted_runs_.count(client_run_id) > 0 || aborted_runs_.count(run_id) > 0;
}

void ChatStreamProjector::finish_aborted(const std::string& run_id,
                                         const std::string& client_run_id,
                                         const std::string& session_key,
                                         bool has_link) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        aborted_runs_.erase(client_run_id);
        aborted_runs_.erase(run_id);
        discard(client_run_id);
        set_state(client_run_id, ChatLinkState::Aborted);
    }
    if (has_link) {
        registry_.remove(run_id, client_run_id, session_key);
    }
}

std::optional<std::string> ChatStreamProjector::buffered_text(
    const std::string& client_run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buffers_.find(client_run_id);
    if (it == buffers_.end()) return std::nullopt;
    return it->second;
}

bool ChatStreamProjector::has_throttle_stamp(const std::string& client_run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return delta_sent_at_.count(client_run_id) > 0;
}

std::optional<ChatLinkState> ChatStreamProjector::link_state(
    const std::string& client_run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = link_states_.find(client_run_id);
    if (it == link_states_.end()) return std::nullopt;
    return it->second;
}

size_t ChatStreamProjector::aborted_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return aborted_runs_.size();
}

void ChatStreamProjector::clear() {
    registry_.clear();
    std::lock_guard<std::mutex> lock(mutex_);
    buffers_.clear();
    delta_sent_at_.clear();
    aborted_runs_.clear();
    link_states_.clear();
    settled_links_.clear();
}

void ChatStreamProjector::set_state(const std::string& client_run_id, ChatLinkState state) {
    link_states_[client_run_id] = state;
    if (state != ChatLinkState::Finalized && state != ChatLinkState::Aborted) return;

    settled_links_.push_back(client_run_id);
    while (settled_links_.size() > kSettledChatLinkHistory) {
        auto oldest = settled_links_.front();
        settled_links_.pop_front();
        auto it = link_states_.find(oldest);
        if (it != link_states_.end() &&
            (it->second == ChatLinkState::Finalized || it->second == ChatLinkState::Aborted)) {
            link_states_.erase(it);
        }
    }
}

void ChatStreamProjector::discard(const std::string& client_run_id) {
    buffers_.erase(client_run_id);
    delta_sent_at_.erase(client_run_id);
}

} // namespace runbus
