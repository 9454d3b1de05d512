#include <catch2/catch_test_macros.hpp>

#include <toolmux/mcp/builtin_tools.hpp>

#include <cstdint>
#include <limits>
#include <string>

using namespace toolmux;

namespace {

std::string Text(const ToolResult& r) {
    return r.content.at(0).at("text").get<std::string>();
}

ToolRegistry Math() {
    ToolRegistry registry;
    RegisterMathTools(registry);
    return registry;
}

ToolRegistry Strings() {
    ToolRegistry registry;
    RegisterTextTools(registry);
    return registry;
}

} // anonymous namespace

// ===========================================================================
// Math toolset
// ===========================================================================

TEST_CASE("Math tools: catalog is add then multiply", "[mcp][builtin]") {
    auto registry = Math();
    REQUIRE(registry.Tools().size() == 2);
    CHECK(registry.Tools()[0].name == "add");
    CHECK(registry.Tools()[1].name == "multiply");
    const auto& schema = registry.Tools()[0].input_schema;
    CHECK(schema["properties"]["a"]["type"] == "integer");
    CHECK(schema["required"] == nlohmann::json::array({"a", "b"}));
}

TEST_CASE("Math tools: add", "[mcp][builtin]") {
    auto registry = Math();
    CHECK(Text(registry.Execute("add", {{"a", 5}, {"b", 3}})) == "8");
    CHECK(Text(registry.Execute("add", {{"a", -10}, {"b", 5}})) == "-5");
    CHECK(Text(registry.Execute("add", {{"a", 0}, {"b", 0}})) == "0");
}

TEST_CASE("Math tools: multiply", "[mcp][builtin]") {
    auto registry = Math();
    CHECK(Text(registry.Execute("multiply", {{"a", 7}, {"b", 6}})) == "42");
    CHECK(Text(registry.Execute("multiply", {{"a", -3}, {"b", 4}})) == "-12");
    CHECK(Text(registry.Execute("multiply", {{"a", 100}, {"b", 0}})) == "0");
}

TEST_CASE("Math tools: missing or mistyped arguments are errors", "[mcp][builtin]") {
    auto registry = Math();

    auto missing = registry.Execute("add", {{"a", 1}});
    CHECK(missing.is_error);
    CHECK(Text(missing) == "Missing required argument 'b'");

    auto text = registry.Execute("add", {{"a", "1"}, {"b", 2}});
    CHECK(text.is_error);
    CHECK(Text(text) == "Argument 'a' must be an integer");

    auto fractional = registry.Execute("multiply", {{"a", 1.5}, {"b", 2}});
    CHECK(fractional.is_error);
}

TEST_CASE("Math tools: overflow is reported, not wrapped", "[mcp][builtin]") {
    auto registry = Math();
    const auto max = std::numeric_limits<std::int64_t>::max();
    auto r = registry.Execute("add", {{"a", max}, {"b", 1}});
    CHECK(r.is_error);
    CHECK(Text(r).find("overflow") != std::string::npos);
}

TEST_CASE("Math tools: unsigned values beyond int64 are rejected", "[mcp][builtin]") {
    auto registry = Math();

    auto r = registry.Execute("add", {{"a", 18446744073709551615ULL}, {"b", 1}});
    CHECK(r.is_error);
    CHECK(Text(r) == "Argument 'a' is out of range");

    auto parsed = nlohmann::json::parse(R"({"a": 2, "b": 9223372036854775808})");
    auto m = registry.Execute("multiply", parsed);
    CHECK(m.is_error);
    CHECK(Text(m) == "Argument 'b' is out of range");

    // Unsigned values that fit are accepted.
    auto ok = registry.Execute("add", {{"a", std::uint64_t{40}}, {"b", 2}});
    CHECK_FALSE(ok.is_error);
    CHECK(Text(ok) == "42");
}

// ===========================================================================
// Text toolset
// ===========================================================================

TEST_CASE("Text tools: uppercase", "[mcp][builtin]") {
    auto registry = Strings();
    CHECK(Text(registry.Execute("uppercase", {{"text", "HeLLo WoRLd"}})) == "HELLO WORLD");
    CHECK(Text(registry.Execute("uppercase", {{"text", ""}})) == "");
    CHECK(Text(registry.Execute("uppercase", {{"text", "abc 123!"}})) == "ABC 123!");
}

TEST_CASE("Text tools: uppercase leaves non-ASCII bytes alone", "[mcp][builtin]") {
    auto registry = Strings();
    // "café ß" in UTF-8: only the ASCII letters change.
    CHECK(Text(registry.Execute("uppercase", {{"text", "caf\xc3\xa9 \xc3\x9f"}})) ==
          "CAF\xc3\xa9 \xc3\x9f");
    CHECK(Text(registry.Execute("uppercase", {{"text", "\xc3\xa9t\xc3\xa9"}})) ==
          "\xc3\xa9T\xc3\xa9");
}

TEST_CASE("Text tools: concat", "[mcp][builtin]") {
    auto registry = Strings();
    CHECK(Text(registry.Execute("concat",
        {{"a", "Hello"}, {"b", "World"}, {"separator", ", "}})) == "Hello, World");
    CHECK(Text(registry.Execute("concat", {{"a", "Hello"}, {"b", "World"}})) ==
          "Hello World");
    CHECK(Text(registry.Execute("concat",
        {{"a", ""}, {"b", ""}, {"separator", "-"}})) == "-");
    CHECK(Text(registry.Execute("concat",
        {{"a", "x"}, {"b", "y"}, {"separator", ""}})) == "xy");
}

TEST_CASE("Text tools: concat separator defaults to a space in the schema", "[mcp][builtin]") {
    auto registry = Strings();
    REQUIRE(registry.Tools().size() == 2);
    const auto& concat = registry.Tools()[1];
    CHECK(concat.name == "concat");
    CHECK(concat.input_schema["properties"]["separator"]["default"] == " ");
}

TEST_CASE("Text tools: mistyped arguments are errors", "[mcp][builtin]") {
    auto registry = Strings();
    CHECK(registry.Execute("uppercase", {{"text", 42}}).is_error);
    CHECK(registry.Execute("uppercase", nlohmann::json::object()).is_error);
    CHECK(registry.Execute("concat", {{"a", "x"}, {"b", "y"}, {"separator", 1}}).is_error);
}

// ===========================================================================
// Toolset lookup
// ===========================================================================

TEST_CASE("MakeToolset: known and unknown names", "[mcp][builtin]") {
    auto math = MakeToolset("math");
    REQUIRE(math.has_value());
    CHECK(math->HasTool("add"));

    auto text = MakeToolset("text");
    REQUIRE(text.has_value());
    CHECK(text->HasTool("concat"));

    CHECK_FALSE(MakeToolset("crypto").has_value());
    CHECK(ToolsetNames() == std::vector<std::string>{"math", "text"});
}
