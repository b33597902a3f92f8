#include "run_event.hpp"
#include "util.hpp"

namespace runbus {

std::string RunEvent::lifecycle_phase() const {
    if (stream != streams::Lifecycle) return {};
    return json_string_field(data, "phase");
}

bool RunEvent::is_terminal() const {
    auto phase = lifecycle_phase();
    return phase == phases::End || phase == phases::Error;
}

nlohmann::json RunEvent::to_json() const {
    nlohmann::json j = {
        {"runId", run_id},
        {"seq", seq},
        {"stream", stream},
        {"ts", ts},
        {"data", data}
    };
    if (session_key && !session_key->empty()) {
        j["sessionKey"] = *session_key;
    }
    return j;
}

} // namespace runbus
