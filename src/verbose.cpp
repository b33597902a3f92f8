#include "verbose.hpp"
#include "config.hpp"
#include "run_context.hpp"
#include "session_store.hpp"
#include "util.hpp"
#include <iostream>
#include <exception>

namespace runbus {

std::optional<VerboseLevel> normalize_verbose_level(const std::string& raw) {
    std::string v = to_lower(trim(raw));
    if (v.empty()) return std::nullopt;
    if (v == "off" || v == "false" || v == "no" || v == "0") return VerboseLevel::Off;
    if (v == "on" || v == "partial" || v == "minimal" || v == "true" ||
        v == "yes" || v == "1")
        return VerboseLevel::Partial;
    if (v == "full" || v == "all" || v == "everything") return VerboseLevel::Full;
    return std::nullopt;
}

const char* verbose_level_name(VerboseLevel level) {
    switch (level) {
        case VerboseLevel::Off:     return "off";
        case VerboseLevel::Partial: return "partial";
        case VerboseLevel::Full:    return "full";
    }
    return "off";
}

VerboseLevel resolve_tool_verbose_level(const std::optional<RunContext>& run,
                                        const std::string& session_key,
                                        const SessionStore* store,
                                        const Config& config) {
    if (run && run->verbose_level) {
        if (auto level = normalize_verbose_level(*run->verbose_level)) return *level;
    }
    if (session_key.empty()) return VerboseLevel::Off;

    if (store) {
        try {
            auto entry = store->find(session_key);
            if (entry && entry->verbose_level) {
                if (auto level = normalize_verbose_level(*entry->verbose_level)) return *level;
            }
        } catch (const std::exception& e) {
            std::cerr << "[verbose] Session lookup failed for " << session_key
                      << ": " << e.what() << "\n";
            return VerboseLevel::Off;
        }
    }

    return normalize_verbose_level(config.verbose_default).value_or(VerboseLevel::Off);
}

} // namespace runbus
