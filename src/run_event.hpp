#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <cstdint>
#include <optional>

namespace runbus {

// ── Stream names ────────────────────────────────────────────────
// Streams are open-ended strings; these are the ones the relay interprets.

namespace streams {
    constexpr const char* Lifecycle = "lifecycle";
    constexpr const char* Tool      = "tool";
    constexpr const char* Assistant = "assistant";
    constexpr const char* Error     = "error";
} // namespace streams

namespace phases {
    constexpr const char* Start = "start";
    constexpr const char* End   = "end";
    constexpr const char* Error = "error";
} // namespace phases

// ── Events ──────────────────────────────────────────────────────

// What a producer hands to EventBus::emit (no seq, no timestamp yet).
struct AgentEventInput {
    std::string run_id;
    std::string stream;
    nlohmann::json data = nlohmann::json::object();
    std::optional<std::string> session_key;
};

// A fully-formed event as delivered to subscribers. Immutable once emitted.
struct RunEvent {
    std::string run_id;
    uint64_t seq = 0;
    std::string stream;
    uint64_t ts = 0; // epoch ms
    nlohmann::json data = nlohmann::json::object();
    std::optional<std::string> session_key;

    // Lifecycle phase ("start", "end", "error", ...) or empty if this is
    // not a lifecycle event or the phase is not a string.
    std::string lifecycle_phase() const;

    // True for lifecycle end / error.
    bool is_terminal() const;

    // Wire form: {runId, seq, stream, ts, data, sessionKey?}
    nlohmann::json to_json() const;
};

} // namespace runbus
