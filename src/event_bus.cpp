#include "event_bus.hpp"
#include "run_context.hpp"
#include <algorithm>
#include <iostream>
#include <exception>

namespace runbus {

EventBus::EventBus(const RunContextRegistry& contexts, NowFn now)
    : contexts_(contexts), now_(std::move(now))
{}

uint64_t EventBus::subscribe(RunEventHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_id_++;
    subscriptions_.push_back(Subscription{id, std::move(handler)});
    return id;
}

bool EventBus::unsubscribe(uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(subscriptions_.begin(), subscriptions_.end(),
                           [id](const Subscription& s) { return s.id == id; });
    if (it == subscriptions_.end()) return false;
    subscriptions_.erase(it);
    return true;
}

bool EventBus::emit(const AgentEventInput& input) {
    RunEvent event;
    event.run_id = input.run_id;
    event.stream = input.stream;
    event.data = input.data.is_object() ? input.data : nlohmann::json::object();

    bool terminal = false;
    if (input.stream == streams::Lifecycle) {
        auto phase = json_string_field(event.data, "phase");
        terminal = phase == phases::End || phase == phases::Error;
    }

    // Sequence and dedup under lock, then call handlers without it held.
    std::vector<RunEventHandler> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (input.stream == streams::Assistant) {
            auto text = json_string_field(event.data, "text");
            if (!text.empty()) {
                auto it = last_assistant_text_.find(input.run_id);
                if (it != last_assistant_text_.end() && it->second == text) {
                    return false;
                }
                last_assistant_text_[input.run_id] = text;
            }
        }

        event.seq = ++seq_by_run_[input.run_id];

        if (terminal) last_assistant_text_.erase(input.run_id);

        to_call.reserve(subscriptions_.size());
        for (const auto& sub : subscriptions_) {
            to_call.push_back(sub.handler);
        }
    }

    if (input.session_key && !input.session_key->empty()) {
        event.session_key = input.session_key;
    } else {
        auto cached = contexts_.session_key_for(input.run_id);
        if (!cached.empty()) event.session_key = cached;
    }
    event.ts = now_();

    for (const auto& handler : to_call) {
        try {
            handler(event);
        } catch (const std::exception& e) {
            std::cerr << "[event_bus] Listener failed for run " << event.run_id
                      << " seq " << event.seq << ": " << e.what() << "\n";
        } catch (...) {
            std::cerr << "[event_bus] Listener failed for run " << event.run_id
                      << " seq " << event.seq << ": unknown exception\n";
        }
    }
    return true;
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    subscriptions_.clear();
}

size_t EventBus::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

uint64_t EventBus::last_seq(const std::string& run_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = seq_by_run_.find(run_id);
    if (it == seq_by_run_.end()) return 0;
    return it->second;
}

} // namespace runbus
