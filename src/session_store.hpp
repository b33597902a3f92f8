#pragma once
#include <string>
#include <unordered_map>
#include <mutex>
#include <optional>

namespace runbus {

// Persisted per-session settings the relay consults.
struct SessionEntry {
    std::string session_key;
    std::optional<std::string> verbose_level;
};

// Lookup of session settings. Implementations may throw on backend
// failure; callers degrade to defaults.
class SessionStore {
public:
    virtual ~SessionStore() = default;

    virtual std::optional<SessionEntry> find(const std::string& session_key) const = 0;
};

class InMemorySessionStore : public SessionStore {
public:
    std::optional<SessionEntry> find(const std::string& session_key) const override;

    void set_verbose_level(const std::string& session_key, const std::string& level);
    void remove(const std::string& session_key);

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, SessionEntry> entries_;
};

} // namespace runbus
