#pragma once
#include "broadcast_router.hpp"
#include "chat_stream.hpp"
#include "config.hpp"
#include "event_bus.hpp"
#include "run_context.hpp"
#include "tool_recipients.hpp"
#include <string>
#include <cstdint>

namespace runbus {

class SessionStore;
class Transport;

// One per process: owns every relay table and wires the router onto the
// bus. Components are reachable for callers that need finer control.
class RunRelay {
public:
    RunRelay(Transport& transport, const Config& config,
             const SessionStore* sessions = nullptr, NowFn now = epoch_millis);
    ~RunRelay();

    RunRelay(const RunRelay&) = delete;
    RunRelay& operator=(const RunRelay&) = delete;

    // Producer entry point. Returns false if suppressed as a duplicate.
    bool emit(const AgentEventInput& input);

    void register_run(const std::string& run_id, const RunContext& context);

    // A client sent a chat request that will execute as run_id.
    void start_chat(const std::string& run_id, const std::string& session_key,
                    const std::string& client_run_id);

    // The caller cancelled the run; chat projection stops until its
    // terminal lifecycle event cleans up.
    void abort_chat(const std::string& run_id, const std::string& client_run_id = "");

    void add_tool_recipient(const std::string& run_id, const std::string& conn_id);

    EventBus& bus() { return bus_; }
    RunContextRegistry& run_contexts() { return contexts_; }
    ToolEventRecipientRegistry& tool_recipients() { return tool_recipients_; }
    ChatStreamProjector& chat() { return chat_; }
    BroadcastRouter& router() { return router_; }
    const Config& config() const { return config_; }

private:
    Config config_;
    RunContextRegistry contexts_;
    EventBus bus_;
    ToolEventRecipientRegistry tool_recipients_;
    ChatStreamProjector chat_;
    BroadcastRouter router_;
    uint64_t router_subscription_ = 0;
};

} // namespace runbus
