#include "run_relay.hpp"

namespace runbus {

RunRelay::RunRelay(Transport& transport, const Config& config,
                   const SessionStore* sessions, NowFn now)
    : config_(config),
      bus_(contexts_, now),
      tool_recipients_(now, config_.tool_events.recipient_ttl_ms,
                       config_.tool_events.final_grace_ms),
      chat_(transport, config_.chat, now),
      router_(transport, chat_, contexts_, tool_recipients_, config_, sessions, now)
{
    router_subscription_ = router_.subscribe_events(bus_);
}

RunRelay::~RunRelay() {
    bus_.unsubscribe(router_subscription_);
}

bool RunRelay::emit(const AgentEventInput& input) {
    return bus_.emit(input);
}

void RunRelay::register_run(const std::string& run_id, const RunContext& context) {
    contexts_.register_run(run_id, context);
}

void RunRelay::start_chat(const std::string& run_id, const std::string& session_key,
                          const std::string& client_run_id) {
    chat_.begin(run_id, ChatRunEntry{session_key,
                                     client_run_id.empty() ? run_id : client_run_id});
    RunContext ctx;
    ctx.session_key = session_key;
    contexts_.register_run(run_id, ctx);
}

void RunRelay::abort_chat(const std::string& run_id, const std::string& client_run_id) {
    chat_.mark_aborted(run_id);
    if (!client_run_id.empty() && client_run_id != run_id) {
        chat_.mark_aborted(client_run_id);
    }
}

void RunRelay::add_tool_recipient(const std::string& run_id, const std::string& conn_id) {
    tool_recipients_.add(run_id, conn_id);
}

} // namespace runbus
