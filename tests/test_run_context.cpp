#include <catch2/catch.hpp>
#include "run_context.hpp"

using namespace runbus;

static RunContext ctx(std::optional<std::string> session,
                      std::optional<std::string> verbose = std::nullopt,
                      std::optional<bool> heartbeat = std::nullopt) {
    RunContext c;
    c.session_key = std::move(session);
    c.verbose_level = std::move(verbose);
    c.is_heartbeat = heartbeat;
    return c;
}

TEST_CASE("RunContextRegistry: get on unknown run is empty", "[run_context]") {
    RunContextRegistry reg;
    REQUIRE_FALSE(reg.get("r1").has_value());
    REQUIRE(reg.session_key_for("r1").empty());
}

TEST_CASE("RunContextRegistry: register stores a copy", "[run_context]") {
    RunContextRegistry reg;
    reg.register_run("r1", ctx("s1", "full", true));
    auto got = reg.get("r1");
    REQUIRE(got.has_value());
    REQUIRE(*got->session_key == "s1");
    REQUIRE(*got->verbose_level == "full");
    REQUIRE(*got->is_heartbeat);
    REQUIRE(reg.session_key_for("r1") == "s1");
}

TEST_CASE("RunContextRegistry: later registration fills absent fields only", "[run_context]") {
    RunContextRegistry reg;
    reg.register_run("r1", ctx(std::nullopt, "partial"));
    reg.register_run("r1", ctx("s1", "full", false));

    auto got = reg.get("r1");
    REQUIRE(*got->session_key == "s1");
    REQUIRE(*got->verbose_level == "partial"); // not overwritten
    REQUIRE(got->is_heartbeat == false);
}

TEST_CASE("RunContextRegistry: session key never reverts to empty", "[run_context]") {
    RunContextRegistry reg;
    reg.register_run("r1", ctx("s1"));
    reg.register_run("r1", ctx(std::string()));
    reg.register_run("r1", ctx(std::nullopt));
    REQUIRE(reg.session_key_for("r1") == "s1");
}

TEST_CASE("RunContextRegistry: empty string counts as unset", "[run_context]") {
    RunContextRegistry reg;
    reg.register_run("r1", ctx(std::string()));
    reg.register_run("r1", ctx("s2"));
    REQUIRE(reg.session_key_for("r1") == "s2");
}

TEST_CASE("RunContextRegistry: clear removes only that run", "[run_context]") {
    RunContextRegistry reg;
    reg.register_run("r1", ctx("s1"));
    reg.register_run("r2", ctx("s2"));
    reg.clear("r1");
    REQUIRE_FALSE(reg.get("r1").has_value());
    REQUIRE(reg.get("r2").has_value());
    REQUIRE(reg.size() == 1);
}

TEST_CASE("RunContextRegistry: clear on unknown run is a no-op", "[run_context]") {
    RunContextRegistry reg;
    reg.clear("nope");
    REQUIRE(reg.size() == 0);
}

TEST_CASE("RunContextRegistry: reset drops everything", "[run_context]") {
    RunContextRegistry reg;
    reg.register_run("r1", ctx("s1"));
    reg.register_run("r2", ctx("s2"));
    reg.reset();
    REQUIRE(reg.size() == 0);
}
