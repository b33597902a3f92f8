#pragma once
#include "tool_recipients.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace runbus {

struct BroadcastOptions {
    // Let the transport skip slow consumers instead of queueing.
    bool drop_if_slow = false;
};

// Delivery primitives the relay drives. Implementations own the actual
// connections; delivery is best-effort and never retried by the relay.
class Transport {
public:
    virtual ~Transport() = default;

    // Every connected observer.
    virtual void broadcast(const std::string& event,
                           const nlohmann::json& payload,
                           const BroadcastOptions& opts) = 0;

    // Only the listed connections.
    virtual void broadcast_to_connections(const std::string& event,
                                          const nlohmann::json& payload,
                                          const ConnIdSet& conn_ids,
                                          const BroadcastOptions& opts) = 0;

    // The node subscribed to one session.
    virtual void send_to_session(const std::string& session_key,
                                 const std::string& event,
                                 const nlohmann::json& payload) = 0;
};

} // namespace runbus
