#pragma once
#include <string>
#include <optional>

namespace runbus {

struct Config;
struct RunContext;
class SessionStore;

// How much tool-call detail an audience sees.
enum class VerboseLevel {
    Off,     // tool events are not delivered
    Partial, // call metadata only, result / partialResult stripped
    Full
};

// Accepts off/on/partial/full and common aliases, case-insensitive.
// Unrecognized or empty input yields nullopt.
std::optional<VerboseLevel> normalize_verbose_level(const std::string& raw);

const char* verbose_level_name(VerboseLevel level);

// Run override -> session setting -> agent default -> Off.
// A session store that throws degrades to Off.
VerboseLevel resolve_tool_verbose_level(const std::optional<RunContext>& run,
                                        const std::string& session_key,
                                        const SessionStore* store,
                                        const Config& config);

} // namespace runbus
