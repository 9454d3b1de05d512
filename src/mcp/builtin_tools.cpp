#include <toolmux/mcp/builtin_tools.hpp>

#include <cctype>
#include <cstdint>
#include <limits>

namespace toolmux {

namespace {

nlohmann::json IntegerProperty(const std::string& description) {
    return {{"type", "integer"}, {"description", description}};
}

nlohmann::json StringProperty(const std::string& description) {
    return {{"type", "string"}, {"description", description}};
}

nlohmann::json BinaryIntegerSchema() {
    return {
        {"type", "object"},
        {"properties", {
            {"a", IntegerProperty("First operand")},
            {"b", IntegerProperty("Second operand")}
        }},
        {"required", nlohmann::json::array({"a", "b"})}
    };
}

// Reads a required integer argument. Floats and numeric strings are rejected.
std::optional<std::int64_t> IntegerArg(const nlohmann::json& args,
                                       const std::string& key,
                                       std::string& error) {
    if (!args.is_object() || !args.contains(key)) {
        error = "Missing required argument '" + key + "'";
        return std::nullopt;
    }
    const auto& value = args[key];
    if (value.is_number_unsigned() &&
        value.get<std::uint64_t>() >
            static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        error = "Argument '" + key + "' is out of range";
        return std::nullopt;
    }
    if (value.is_number_integer()) {
        return value.get<std::int64_t>();
    }
    error = "Argument '" + key + "' must be an integer";
    return std::nullopt;
}

std::optional<std::string> StringArg(const nlohmann::json& args,
                                     const std::string& key,
                                     std::string& error) {
    if (!args.is_object() || !args.contains(key)) {
        error = "Missing required argument '" + key + "'";
        return std::nullopt;
    }
    const auto& value = args[key];
    if (value.is_string()) {
        return value.get<std::string>();
    }
    error = "Argument '" + key + "' must be a string";
    return std::nullopt;
}

template <typename Op>
ToolHandler IntegerBinaryHandler(Op op, const char* verb) {
    return [op, verb](const nlohmann::json& args) -> ToolResult {
        std::string error;
        auto a = IntegerArg(args, "a", error);
        if (!a) return ToolResult::Failure(error);
        auto b = IntegerArg(args, "b", error);
        if (!b) return ToolResult::Failure(error);

        std::int64_t out = 0;
        if (op(*a, *b, &out)) {
            return ToolResult::Failure(std::string("Integer overflow in ") + verb);
        }
        return ToolResult::Text(std::to_string(out));
    };
}

} // anonymous namespace

void RegisterMathTools(ToolRegistry& registry) {
    registry.Register(
        "add", "Add two integers together and return the sum.",
        BinaryIntegerSchema(),
        IntegerBinaryHandler(
            [](std::int64_t a, std::int64_t b, std::int64_t* out) {
                return __builtin_add_overflow(a, b, out);
            },
            "add"));

    registry.Register(
        "multiply", "Multiply two integers and return the product.",
        BinaryIntegerSchema(),
        IntegerBinaryHandler(
            [](std::int64_t a, std::int64_t b, std::int64_t* out) {
                return __builtin_mul_overflow(a, b, out);
            },
            "multiply"));
}

void RegisterTextTools(ToolRegistry& registry) {
    registry.Register(
        "uppercase", "Convert a string to uppercase letters.",
        {
            {"type", "object"},
            {"properties", {
                {"text", StringProperty("The text to convert to uppercase")}
            }},
            {"required", nlohmann::json::array({"text"})}
        },
        [](const nlohmann::json& args) -> ToolResult {
            std::string error;
            auto text = StringArg(args, "text", error);
            if (!text) return ToolResult::Failure(error);
            // ASCII only; multi-byte UTF-8 sequences pass through untouched.
            for (auto& c : *text) {
                c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
            }
            return ToolResult::Text(*text);
        });

    auto separator = StringProperty("Separator to place between the strings");
    separator["default"] = " ";
    registry.Register(
        "concat", "Concatenate two strings with a separator between them.",
        {
            {"type", "object"},
            {"properties", {
                {"a", StringProperty("First string")},
                {"b", StringProperty("Second string")},
                {"separator", separator}
            }},
            {"required", nlohmann::json::array({"a", "b"})}
        },
        [](const nlohmann::json& args) -> ToolResult {
            std::string error;
            auto a = StringArg(args, "a", error);
            if (!a) return ToolResult::Failure(error);
            auto b = StringArg(args, "b", error);
            if (!b) return ToolResult::Failure(error);

            std::string sep = " ";
            if (args.contains("separator") && !args["separator"].is_null()) {
                auto given = StringArg(args, "separator", error);
                if (!given) return ToolResult::Failure(error);
                sep = *given;
            }
            return ToolResult::Text(*a + sep + *b);
        });
}

std::vector<std::string> ToolsetNames() {
    return {"math", "text"};
}

std::optional<ToolRegistry> MakeToolset(std::string_view name) {
    ToolRegistry registry;
    if (name == "math") {
        RegisterMathTools(registry);
    } else if (name == "text") {
        RegisterTextTools(registry);
    } else {
        return std::nullopt;
    }
    return registry;
}

} // namespace toolmux
