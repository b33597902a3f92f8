#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace runbus {

class RunRelay;
class InMemorySessionStore;

// Command handlers for the line-oriented CLI (main.cpp). Each takes one
// decoded command object and returns an error string, empty on success.
//
//   {"op":"emit", "runId", "stream", "data"?, "sessionKey"?}
//   {"op":"register", "runId", "sessionKey"?, "verboseLevel"?, "isHeartbeat"?}
//   {"op":"chat", "runId", "sessionKey", "clientRunId"?}
//   {"op":"abort", "runId", "clientRunId"?}
//   {"op":"tools", "runId", "connId"}
//   {"op":"session", "sessionKey", "verboseLevel"}

std::string cmd_emit(const nlohmann::json& cmd, RunRelay& relay);
std::string cmd_register(const nlohmann::json& cmd, RunRelay& relay);
std::string cmd_chat(const nlohmann::json& cmd, RunRelay& relay);
std::string cmd_abort(const nlohmann::json& cmd, RunRelay& relay);
std::string cmd_tools(const nlohmann::json& cmd, RunRelay& relay);
std::string cmd_session(const nlohmann::json& cmd, InMemorySessionStore& sessions);

// Dispatch on "op".
std::string apply_command(const nlohmann::json& cmd, RunRelay& relay,
                          InMemorySessionStore& sessions);

} // namespace runbus
