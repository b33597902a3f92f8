#include "broadcast_router.hpp"
#include "chat_stream.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include "run_context.hpp"
#include "tool_recipients.hpp"
#include "transport.hpp"
#include "verbose.hpp"
#include <iostream>
#include <exception>

namespace runbus {

BroadcastRouter::BroadcastRouter(Transport& transport,
                                 ChatStreamProjector& chat,
                                 RunContextRegistry& contexts,
                                 ToolEventRecipientRegistry& tool_recipients,
                                 const Config& config,
                                 const SessionStore* sessions,
                                 NowFn now)
    : transport_(transport), chat_(chat), contexts_(contexts),
      tool_recipients_(tool_recipients), config_(config), sessions_(sessions),
      now_(std::move(now))
{}

uint64_t BroadcastRouter::subscribe_events(EventBus& bus) {
    return bus.subscribe([this](const RunEvent& ev) { handle(ev); });
}

void BroadcastRouter::handle(const RunEvent& event) {
    try {
        route(event);
    } catch (const std::exception& e) {
        std::cerr << "[router] Dropped " << event.stream << " event for run "
                  << event.run_id << ": " << e.what() << "\n";
    } catch (...) {
        std::cerr << "[router] Dropped " << event.stream << " event for run "
                  << event.run_id << ": unknown exception\n";
    }

    // Runs even when routing failed part-way
    if (!event.is_terminal()) return;
    try {
        finish_run(event.run_id);
    } catch (const std::exception& e) {
        std::cerr << "[router] Terminal cleanup failed for run " << event.run_id
                  << ": " << e.what() << "\n";
    }
}

void BroadcastRouter::deliver(const RunEvent& event, const char* what,
                              const std::function<void()>& send) {
    try {
        send();
    } catch (const std::exception& e) {
        std::cerr << "[router] " << what << " failed for run " << event.run_id
                  << " seq " << event.seq << ": " << e.what() << "\n";
    } catch (...) {
        std::cerr << "[router] " << what << " failed for run " << event.run_id
                  << " seq " << event.seq << ": unknown exception\n";
    }
}

void BroadcastRouter::finish_run(const std::string& run_id) {
    tool_recipients_.mark_final(run_id);
    contexts_.clear(run_id);
}

uint64_t BroadcastRouter::last_seq(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = last_seq_.find(run_id);
    if (it == last_seq_.end()) return 0;
    return it->second;
}

void BroadcastRouter::check_sequence(const RunEvent& event, const std::string& session_key) {
    uint64_t last = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = last_seq_.find(event.run_id);
        if (it != last_seq_.end()) last = it->second;
        last_seq_[event.run_id] = event.seq;
    }
    if (event.seq == last + 1) return;

    nlohmann::json gap = {
        {"runId", event.run_id},
        {"stream", streams::Error},
        {"ts", now_()},
        {"data", {
            {"reason", "seq gap"},
            {"expected", last + 1},
            {"received", event.seq}
        }}
    };
    if (!session_key.empty()) gap["sessionKey"] = session_key;
    deliver(event, "Gap report", [&] {
        transport_.broadcast("agent", gap, BroadcastOptions{});
    });
}

bool BroadcastRouter::suppress_heartbeat_broadcast(const std::string& run_id) const {
    auto ctx = contexts_.get(run_id);
    if (!ctx || !ctx->is_heartbeat.value_or(false)) return false;
    return !config_.heartbeat_for("webchat").show_ok;
}

void BroadcastRouter::route(const RunEvent& event) {
    // ── Routing key ─────────────────────────────────────────────
    auto link = chat_.registry().peek(event.run_id);
    std::string session_key = event.session_key.value_or("");
    if (session_key.empty() && link) session_key = link->session_key;
    if (session_key.empty()) session_key = contexts_.session_key_for(event.run_id);
    std::string client_run_id = link ? link->client_run_id : event.run_id;

    check_sequence(event, session_key);

    nlohmann::json payload = event.to_json();
    if (!session_key.empty()) payload["sessionKey"] = session_key;

    // ── Delivery ────────────────────────────────────────────────
    if (event.stream == streams::Tool) {
        auto level = resolve_tool_verbose_level(contexts_.get(event.run_id), session_key,
                                                sessions_, config_);
        if (level == VerboseLevel::Off) return;
        if (level != VerboseLevel::Full && payload["data"].is_object()) {
            payload["data"].erase("result");
            payload["data"].erase("partialResult");
        }
        auto recipients = tool_recipients_.get(event.run_id);
        if (recipients && !recipients->empty()) {
            deliver(event, "Tool delivery", [&] {
                transport_.broadcast_to_connections("agent", payload, *recipients,
                                                    BroadcastOptions{});
            });
        }
        return;
    }

    deliver(event, "Global broadcast", [&] {
        transport_.broadcast("agent", payload, BroadcastOptions{});
    });
    if (!session_key.empty()) {
        deliver(event, "Session delivery", [&] {
            transport_.send_to_session(session_key, "agent", payload);
        });
    }

    // ── Chat projection ─────────────────────────────────────────
    bool terminal = event.is_terminal();
    bool aborted = chat_.is_aborted(event.run_id, client_run_id);

    if (aborted) {
        if (terminal) chat_.finish_aborted(event.run_id, client_run_id, session_key,
                                           link.has_value());
    } else if (!session_key.empty()) {
        bool global = !suppress_heartbeat_broadcast(event.run_id);
        if (event.stream == streams::Assistant) {
            auto text = json_string_field(event.data, "text");
            if (!text.empty()) {
                chat_.emit_delta(session_key, client_run_id, event.seq, text, global);
            }
        } else if (terminal) {
            std::string target_session = session_key;
            std::string target_client = event.run_id;
            bool have_target = true;
            if (link) {
                auto finished = chat_.registry().shift(event.run_id);
                have_target = finished.has_value();
                if (finished) {
                    target_session = finished->session_key;
                    target_client = finished->client_run_id;
                }
            }
            if (have_target) {
                if (event.lifecycle_phase() == phases::Error) {
                    auto it = event.data.find("error");
                    chat_.emit_error(target_session, target_client, event.seq,
                                     it != event.data.end() ? *it : nlohmann::json());
                } else {
                    chat_.emit_final(target_session, target_client, event.seq, global);
                }
            }
        }
    }
}

} // namespace runbus
