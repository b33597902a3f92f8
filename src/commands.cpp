#include "commands.hpp"
#include "run_relay.hpp"
#include "session_store.hpp"
#include "util.hpp"

namespace runbus {

static std::string require_field(const nlohmann::json& cmd, const char* key,
                                 std::string& out) {
    out = json_string_field(cmd, key);
    if (out.empty()) return std::string("Missing ") + key;
    return {};
}

std::string cmd_emit(const nlohmann::json& cmd, RunRelay& relay) {
    AgentEventInput input;
    if (auto err = require_field(cmd, "runId", input.run_id); !err.empty()) return err;
    if (auto err = require_field(cmd, "stream", input.stream); !err.empty()) return err;
    if (cmd.contains("data") && cmd["data"].is_object()) input.data = cmd["data"];
    auto session_key = json_string_field(cmd, "sessionKey");
    if (!session_key.empty()) input.session_key = session_key;
    relay.emit(input);
    return {};
}

std::string cmd_register(const nlohmann::json& cmd, RunRelay& relay) {
    std::string run_id;
    if (auto err = require_field(cmd, "runId", run_id); !err.empty()) return err;

    RunContext ctx;
    auto session_key = json_string_field(cmd, "sessionKey");
    if (!session_key.empty()) ctx.session_key = session_key;
    auto verbose = json_string_field(cmd, "verboseLevel");
    if (!verbose.empty()) ctx.verbose_level = verbose;
    if (cmd.contains("isHeartbeat") && cmd["isHeartbeat"].is_boolean())
        ctx.is_heartbeat = cmd["isHeartbeat"].get<bool>();
    relay.register_run(run_id, ctx);
    return {};
}

std::string cmd_chat(const nlohmann::json& cmd, RunRelay& relay) {
    std::string run_id;
    std::string session_key;
    if (auto err = require_field(cmd, "runId", run_id); !err.empty()) return err;
    if (auto err = require_field(cmd, "sessionKey", session_key); !err.empty()) return err;
    relay.start_chat(run_id, session_key, json_string_field(cmd, "clientRunId"));
    return {};
}

std::string cmd_abort(const nlohmann::json& cmd, RunRelay& relay) {
    std::string run_id;
    if (auto err = require_field(cmd, "runId", run_id); !err.empty()) return err;
    relay.abort_chat(run_id, json_string_field(cmd, "clientRunId"));
    return {};
}

std::string cmd_tools(const nlohmann::json& cmd, RunRelay& relay) {
    std::string run_id;
    std::string conn_id;
    if (auto err = require_field(cmd, "runId", run_id); !err.empty()) return err;
    if (auto err = require_field(cmd, "connId", conn_id); !err.empty()) return err;
    relay.add_tool_recipient(run_id, conn_id);
    return {};
}

std::string cmd_session(const nlohmann::json& cmd, InMemorySessionStore& sessions) {
    std::string session_key;
    std::string level;
    if (auto err = require_field(cmd, "sessionKey", session_key); !err.empty()) return err;
    if (auto err = require_field(cmd, "verboseLevel", level); !err.empty()) return err;
    sessions.set_verbose_level(session_key, level);
    return {};
}

std::string apply_command(const nlohmann::json& cmd, RunRelay& relay,
                          InMemorySessionStore& sessions) {
    if (!cmd.is_object()) return "Command must be a JSON object";
    std::string op = json_string_field(cmd, "op");
    if (op == "emit") return cmd_emit(cmd, relay);
    if (op == "register") return cmd_register(cmd, relay);
    if (op == "chat") return cmd_chat(cmd, relay);
    if (op == "abort") return cmd_abort(cmd, relay);
    if (op == "tools") return cmd_tools(cmd, relay);
    if (op == "session") return cmd_session(cmd, sessions);
    if (op.empty()) return "Missing op";
    return "Unknown op: " + op;
}

} // namespace runbus
