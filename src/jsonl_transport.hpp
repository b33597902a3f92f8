#pragma once
#include "transport.hpp"
#include <ostream>
#include <mutex>

namespace runbus {

// Writes every delivery as one JSON line:
//   {"target":"global","event","payload","dropIfSlow"}
//   {"target":"conns","connIds":[...],"event","payload","dropIfSlow"}
//   {"target":"session","sessionKey","event","payload"}
class JsonLinesTransport : public Transport {
public:
    explicit JsonLinesTransport(std::ostream& out) : out_(out) {}

    void broadcast(const std::string& event, const nlohmann::json& payload,
                   const BroadcastOptions& opts) override;
    void broadcast_to_connections(const std::string& event, const nlohmann::json& payload,
                                  const ConnIdSet& conn_ids,
                                  const BroadcastOptions& opts) override;
    void send_to_session(const std::string& session_key, const std::string& event,
                         const nlohmann::json& payload) override;

private:
    void write(const nlohmann::json& line);

    std::ostream& out_;
    std::mutex mutex_;
};

} // namespace runbus
