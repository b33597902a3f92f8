#pragma once
#include <string>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace runbus {

struct HeartbeatVisibility {
    bool show_ok = false; // broadcast heartbeat runs that end quietly
};

// Per-channel partial override of HeartbeatVisibility.
struct HeartbeatOverride {
    std::optional<bool> show_ok;
};

struct ChatConfig {
    uint32_t delta_throttle_ms = 150;
    uint64_t aborted_run_ttl_ms = 60 * 60 * 1000; // 1 hour
};

struct ToolEventsConfig {
    uint64_t recipient_ttl_ms = 10 * 60 * 1000;
    uint64_t final_grace_ms = 30 * 1000;
};

struct Config {
    std::string verbose_default = "off"; // agents.defaults.verbose_default
    HeartbeatVisibility heartbeat;
    std::unordered_map<std::string, HeartbeatOverride> channel_heartbeat;
    ChatConfig chat;
    ToolEventsConfig tool_events;

    // Load from ~/.runbus/config.json + env vars
    static Config load();

    // Load from an explicit path + env vars. Missing or malformed files
    // fall back to defaults.
    static Config load_from(const std::string& path);

    // Parse an already-decoded document (no env overrides).
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Defaults with the channel's overrides applied.
    HeartbeatVisibility heartbeat_for(const std::string& channel) const;
};

} // namespace runbus
