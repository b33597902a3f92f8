#include <catch2/catch.hpp>
#include "verbose.hpp"
#include "config.hpp"
#include "run_context.hpp"
#include "session_store.hpp"
#include <stdexcept>

using namespace runbus;

namespace {

class FailingSessionStore : public SessionStore {
public:
    std::optional<SessionEntry> find(const std::string&) const override {
        throw std::runtime_error("store offline");
    }
};

RunContext with_level(const std::string& level) {
    RunContext c;
    c.verbose_level = level;
    return c;
}

} // namespace

// ── normalize_verbose_level ─────────────────────────────────────

TEST_CASE("normalize_verbose_level: canonical names", "[verbose]") {
    REQUIRE(normalize_verbose_level("off") == VerboseLevel::Off);
    REQUIRE(normalize_verbose_level("partial") == VerboseLevel::Partial);
    REQUIRE(normalize_verbose_level("on") == VerboseLevel::Partial);
    REQUIRE(normalize_verbose_level("full") == VerboseLevel::Full);
}

TEST_CASE("normalize_verbose_level: aliases and case", "[verbose]") {
    REQUIRE(normalize_verbose_level(" FULL ") == VerboseLevel::Full);
    REQUIRE(normalize_verbose_level("all") == VerboseLevel::Full);
    REQUIRE(normalize_verbose_level("true") == VerboseLevel::Partial);
    REQUIRE(normalize_verbose_level("Minimal") == VerboseLevel::Partial);
    REQUIRE(normalize_verbose_level("no") == VerboseLevel::Off);
    REQUIRE(normalize_verbose_level("0") == VerboseLevel::Off);
}

TEST_CASE("normalize_verbose_level: unknown and empty", "[verbose]") {
    REQUIRE_FALSE(normalize_verbose_level("").has_value());
    REQUIRE_FALSE(normalize_verbose_level("   ").has_value());
    REQUIRE_FALSE(normalize_verbose_level("loud").has_value());
}

TEST_CASE("verbose_level_name: round trips canonical names", "[verbose]") {
    REQUIRE(std::string(verbose_level_name(VerboseLevel::Off)) == "off");
    REQUIRE(std::string(verbose_level_name(VerboseLevel::Partial)) == "partial");
    REQUIRE(std::string(verbose_level_name(VerboseLevel::Full)) == "full");
}

// ── resolve_tool_verbose_level ──────────────────────────────────

TEST_CASE("resolve_tool_verbose_level: run override wins", "[verbose]") {
    InMemorySessionStore store;
    store.set_verbose_level("main", "off");
    Config cfg;
    cfg.verbose_default = "off";

    REQUIRE(resolve_tool_verbose_level(with_level("full"), "main", &store, cfg)
            == VerboseLevel::Full);
}

TEST_CASE("resolve_tool_verbose_level: run override applies without session", "[verbose]") {
    Config cfg;
    REQUIRE(resolve_tool_verbose_level(with_level("on"), "", nullptr, cfg)
            == VerboseLevel::Partial);
}

TEST_CASE("resolve_tool_verbose_level: no session key is off", "[verbose]") {
    Config cfg;
    cfg.verbose_default = "full";
    REQUIRE(resolve_tool_verbose_level(std::nullopt, "", nullptr, cfg) == VerboseLevel::Off);
}

TEST_CASE("resolve_tool_verbose_level: session setting beats agent default", "[verbose]") {
    InMemorySessionStore store;
    store.set_verbose_level("main", "partial");
    Config cfg;
    cfg.verbose_default = "full";

    REQUIRE(resolve_tool_verbose_level(std::nullopt, "main", &store, cfg)
            == VerboseLevel::Partial);
}

TEST_CASE("resolve_tool_verbose_level: unrecognized values fall through", "[verbose]") {
    InMemorySessionStore store;
    store.set_verbose_level("main", "loud");
    Config cfg;
    cfg.verbose_default = "full";

    REQUIRE(resolve_tool_verbose_level(with_level("???"), "main", &store, cfg)
            == VerboseLevel::Full);
}

TEST_CASE("resolve_tool_verbose_level: agent default when session has no setting", "[verbose]") {
    InMemorySessionStore store;
    Config cfg;
    cfg.verbose_default = "on";
    REQUIRE(resolve_tool_verbose_level(std::nullopt, "main", &store, cfg)
            == VerboseLevel::Partial);

    cfg.verbose_default = "bogus";
    REQUIRE(resolve_tool_verbose_level(std::nullopt, "main", &store, cfg)
            == VerboseLevel::Off);
}

TEST_CASE("resolve_tool_verbose_level: failing store degrades to off", "[verbose]") {
    FailingSessionStore store;
    Config cfg;
    cfg.verbose_default = "full";
    REQUIRE(resolve_tool_verbose_level(std::nullopt, "main", &store, cfg)
            == VerboseLevel::Off);
}

// ── InMemorySessionStore ────────────────────────────────────────

TEST_CASE("InMemorySessionStore: set, update and remove", "[verbose]") {
    InMemorySessionStore store;
    REQUIRE_FALSE(store.find("main").has_value());

    store.set_verbose_level("main", "partial");
    REQUIRE(store.find("main")->session_key == "main");
    REQUIRE(*store.find("main")->verbose_level == "partial");

    store.set_verbose_level("main", "full");
    REQUIRE(*store.find("main")->verbose_level == "full");

    store.remove("main");
    REQUIRE_FALSE(store.find("main").has_value());
}
