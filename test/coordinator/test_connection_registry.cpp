#include <catch2/catch_test_macros.hpp>

#include <toolmux/coordinator/connection_registry.hpp>

using namespace toolmux;

TEST_CASE("ConnectionRegistry: new entries are unconnected", "[coordinator][registry]") {
    ConnectionRegistry registry;
    CHECK(registry.Empty());

    auto previous = registry.Upsert({"math", "toolmux-worker", {"--toolset", "math"}, {}});
    CHECK_FALSE(previous.has_value());
    REQUIRE(registry.Contains("math"));

    const auto* conn = registry.Find("math");
    REQUIRE(conn != nullptr);
    CHECK_FALSE(conn->IsConnected());
    CHECK(conn->tools.empty());
    CHECK_FALSE(conn->scope_token.has_value());
    CHECK(conn->config.args == std::vector<std::string>{"--toolset", "math"});
}

TEST_CASE("ConnectionRegistry: Find on unknown name", "[coordinator][registry]") {
    ConnectionRegistry registry;
    CHECK(registry.Find("nope") == nullptr);
    const ConnectionRegistry& cref = registry;
    CHECK(cref.Find("nope") == nullptr);
}

TEST_CASE("ConnectionRegistry: names keep registration order", "[coordinator][registry]") {
    ConnectionRegistry registry;
    registry.Upsert({"zeta", "a", {}, {}});
    registry.Upsert({"alpha", "b", {}, {}});
    registry.Upsert({"mid", "c", {}, {}});
    CHECK(registry.Names() == std::vector<std::string>{"zeta", "alpha", "mid"});
}

TEST_CASE("ConnectionRegistry: re-register replaces in place", "[coordinator][registry]") {
    ConnectionRegistry registry;
    registry.Upsert({"first", "a", {}, {}});
    registry.Upsert({"x", "old", {}, {}});
    registry.Upsert({"last", "b", {}, {}});
    registry.Find("x")->tools = {{"t", "", {}}};
    registry.Find("x")->scope_token = 7;

    auto previous = registry.Upsert({"x", "new", {"--flag"}, {{"K", "V"}}});
    REQUIRE(previous.has_value());
    CHECK(previous->config.command == "old");
    CHECK(previous->tools.size() == 1);
    CHECK(previous->scope_token == ResourceScope::Token{7});

    CHECK(registry.Size() == 3);
    CHECK(registry.Names() == std::vector<std::string>{"first", "x", "last"});
    const auto* conn = registry.Find("x");
    CHECK(conn->config.command == "new");
    CHECK(conn->config.env.at("K") == "V");
    CHECK(conn->tools.empty());
    CHECK_FALSE(conn->scope_token.has_value());
}
