#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace runbus {

nlohmann::json Config::defaults_json() {
    return {
        {"agents", {
            {"defaults", {{"verbose_default", "off"}}}
        }},
        {"heartbeat", {
            {"show_ok", false}
        }},
        {"channels", nlohmann::json::object()},
        {"chat", {
            {"delta_throttle_ms", 150},
            {"aborted_run_ttl_ms", 3600000}
        }},
        {"tool_events", {
            {"recipient_ttl_ms", 600000},
            {"final_grace_ms", 30000}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_bool(const nlohmann::json& obj, const char* key, bool& out) {
    if (obj.contains(key) && obj[key].is_boolean())
        out = obj[key].get<bool>();
}

static void read_bool(const nlohmann::json& obj, const char* key, std::optional<bool>& out) {
    if (obj.contains(key) && obj[key].is_boolean())
        out = obj[key].get<bool>();
}

static std::optional<bool> parse_env_bool(const char* v) {
    std::string s = to_lower(trim(v));
    if (s == "1" || s == "true" || s == "yes") return true;
    if (s == "0" || s == "false" || s == "no") return false;
    return std::nullopt;
}

Config Config::from_json(const nlohmann::json& input) {
    Config cfg;
    nlohmann::json j = merge_defaults(input.is_object() ? input : nlohmann::json::object(),
                                      defaults_json());

    if (j["agents"].is_object() && j["agents"].contains("defaults") &&
        j["agents"]["defaults"].is_object()) {
        auto& d = j["agents"]["defaults"];
        if (d.contains("verbose_default") && d["verbose_default"].is_string())
            cfg.verbose_default = d["verbose_default"].get<std::string>();
    }

    if (j["heartbeat"].is_object()) {
        auto& h = j["heartbeat"];
        read_bool(h, "show_ok", cfg.heartbeat.show_ok);
    }

    // Per-channel heartbeat overrides
    if (j["channels"].is_object()) {
        for (auto& [name, obj] : j["channels"].items()) {
            if (!obj.is_object() || !obj.contains("heartbeat") || !obj["heartbeat"].is_object())
                continue;
            auto& h = obj["heartbeat"];
            HeartbeatOverride ov;
            read_bool(h, "show_ok", ov.show_ok);
            cfg.channel_heartbeat[name] = ov;
        }
    }

    if (j["chat"].is_object()) {
        auto& c = j["chat"];
        if (c.contains("delta_throttle_ms") && c["delta_throttle_ms"].is_number_unsigned())
            cfg.chat.delta_throttle_ms = c["delta_throttle_ms"].get<uint32_t>();
        if (c.contains("aborted_run_ttl_ms") && c["aborted_run_ttl_ms"].is_number_unsigned())
            cfg.chat.aborted_run_ttl_ms = c["aborted_run_ttl_ms"].get<uint64_t>();
    }

    if (j["tool_events"].is_object()) {
        auto& t = j["tool_events"];
        if (t.contains("recipient_ttl_ms") && t["recipient_ttl_ms"].is_number_unsigned())
            cfg.tool_events.recipient_ttl_ms = t["recipient_ttl_ms"].get<uint64_t>();
        if (t.contains("final_grace_ms") && t["final_grace_ms"].is_number_unsigned())
            cfg.tool_events.final_grace_ms = t["final_grace_ms"].get<uint64_t>();
    }

    return cfg;
}

Config Config::load() {
    return load_from(expand_home("~/.runbus/config.json"));
}

Config Config::load_from(const std::string& path) {
    nlohmann::json j = nlohmann::json::object();

    std::ifstream file(path);
    if (file.is_open()) {
        try {
            j = nlohmann::json::parse(file);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed config " << path
                      << ": " << e.what() << "\n";
            j = nlohmann::json::object();
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("RUNBUS_VERBOSE_DEFAULT"))
        cfg.verbose_default = v;
    if (const char* v = std::getenv("RUNBUS_HEARTBEAT_SHOW_OK")) {
        if (auto b = parse_env_bool(v)) cfg.heartbeat.show_ok = *b;
    }

    return cfg;
}

HeartbeatVisibility Config::heartbeat_for(const std::string& channel) const {
    HeartbeatVisibility vis = heartbeat;
    auto it = channel_heartbeat.find(channel);
    if (it == channel_heartbeat.end()) return vis;
    if (it->second.show_ok) vis.show_ok = *it->second.show_ok;
    return vis;
}

} // namespace runbus
