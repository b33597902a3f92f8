#pragma once
#include "run_event.hpp"
#include "util.hpp"
#include <string>
#include <unordered_map>
#include <functional>
#include <mutex>
#include <cstdint>

namespace runbus {

struct Config;
class ChatStreamProjector;
class EventBus;
class RunContextRegistry;
class SessionStore;
class ToolEventRecipientRegistry;
class Transport;

// Consumes sequenced run events and decides who sees what.
//
// Per event: detect sequence gaps (reported as a synthetic error-stream
// "agent" broadcast, never fatal), gate and redact tool events by the
// run's tool verbosity, deliver non-tool events globally and to the
// owning session, deliver tool events only to the run's registered
// recipients, project assistant text and terminal phases into the chat
// protocol, and on end/error finalize the recipient entry and drop the
// run's cached context. A failing transport call only loses that one
// delivery; terminal cleanup always runs.
class BroadcastRouter {
public:
    BroadcastRouter(Transport& transport,
                    ChatStreamProjector& chat,
                    RunContextRegistry& contexts,
                    ToolEventRecipientRegistry& tool_recipients,
                    const Config& config,
                    const SessionStore* sessions = nullptr,
                    NowFn now = epoch_millis);

    // Never throws.
    void handle(const RunEvent& event);

    // Subscribe handle() on the bus. Returns the subscription ID.
    uint64_t subscribe_events(EventBus& bus);

    // Last sequence number observed for run_id (0 if none).
    uint64_t last_seq(const std::string& run_id) const;

private:
    void route(const RunEvent& event);

    // Calls send, logging instead of propagating a transport failure.
    void deliver(const RunEvent& event, const char* what,
                 const std::function<void()>& send);

    // Terminal bookkeeping: start the recipient grace window, drop context.
    void finish_run(const std::string& run_id);

    // Records seq; broadcasts a diagnostic if it is not last + 1.
    void check_sequence(const RunEvent& event, const std::string& session_key);

    // Heartbeat run whose quiet results are hidden from webchat.
    bool suppress_heartbeat_broadcast(const std::string& run_id) const;

    Transport& transport_;
    ChatStreamProjector& chat_;
    RunContextRegistry& contexts_;
    ToolEventRecipientRegistry& tool_recipients_;
    const Config& config_;
    const SessionStore* sessions_;
    NowFn now_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, uint64_t> last_seq_;
};

} // namespace runbus
