#include "jsonl_transport.hpp"
#include <algorithm>
#include <vector>

namespace runbus {

void JsonLinesTransport::broadcast(const std::string& event, const nlohmann::json& payload,
                                   const BroadcastOptions& opts) {
    write({
        {"target", "global"},
        {"event", event},
        {"payload", payload},
        {"dropIfSlow", opts.drop_if_slow}
    });
}

void JsonLinesTransport::broadcast_to_connections(const std::string& event,
                                                  const nlohmann::json& payload,
                                                  const ConnIdSet& conn_ids,
                                                  const BroadcastOptions& opts) {
    // Sorted so output is stable across runs
    std::vector<std::string> ids(conn_ids.begin(), conn_ids.end());
    std::sort(ids.begin(), ids.end());
    write({
        {"target", "conns"},
        {"connIds", ids},
        {"event", event},
        {"payload", payload},
        {"dropIfSlow", opts.drop_if_slow}
    });
}

void JsonLinesTransport::send_to_session(const std::string& session_key,
                                         const std::string& event,
                                         const nlohmann::json& payload) {
    write({
        {"target", "session"},
        {"sessionKey", session_key},
        {"event", event},
        {"payload", payload}
    });
}

void JsonLinesTransport::write(const nlohmann::json& line) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line.dump() << '\n' << std::flush;
}

} // namespace runbus
