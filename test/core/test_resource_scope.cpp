#include <catch2/catch_test_macros.hpp>

#include <toolmux/core/resource_scope.hpp>

#include <stdexcept>
#include <string>
#include <vector>

using namespace toolmux;

namespace {

ResourceScope::Cleanup Record(std::vector<std::string>& log, std::string name) {
    return [&log, name]() {
        log.push_back(name);
        return Result<void, Error>::Ok();
    };
}

ResourceScope::Cleanup Fail(std::vector<std::string>& log, std::string name) {
    return [&log, name]() {
        log.push_back(name);
        return Result<void, Error>::Err(Error::Make(
            ErrorCategory::Internal, "Terminate", name + " would not die", name));
    };
}

} // anonymous namespace

TEST_CASE("ResourceScope: Close runs actions in reverse order", "[core][scope]") {
    std::vector<std::string> log;
    ResourceScope scope;
    scope.Defer("a", Record(log, "a"));
    scope.Defer("b", Record(log, "b"));
    scope.Defer("c", Record(log, "c"));
    CHECK(scope.Size() == 3);

    auto failures = scope.Close();
    CHECK(failures.empty());
    CHECK(log == std::vector<std::string>{"c", "b", "a"});
    CHECK(scope.Empty());
}

TEST_CASE("ResourceScope: a failing action does not stop the others", "[core][scope]") {
    std::vector<std::string> log;
    ResourceScope scope;
    scope.Defer("a", Fail(log, "a"));
    scope.Defer("b", Record(log, "b"));
    scope.Defer("c", Fail(log, "c"));

    auto failures = scope.Close();
    CHECK(log == std::vector<std::string>{"c", "b", "a"});
    REQUIRE(failures.size() == 2);
    CHECK(failures[0].server == "c");
    CHECK(failures[1].server == "a");
}

TEST_CASE("ResourceScope: a throwing action becomes an Internal error", "[core][scope]") {
    ResourceScope scope;
    scope.Defer("thrower", []() -> Result<void, Error> {
        throw std::runtime_error("boom");
    });

    auto failures = scope.Close();
    REQUIRE(failures.size() == 1);
    CHECK(failures[0].category == ErrorCategory::Internal);
    CHECK(failures[0].message.find("boom") != std::string::npos);
}

TEST_CASE("ResourceScope: Release runs one action once", "[core][scope]") {
    std::vector<std::string> log;
    ResourceScope scope;
    scope.Defer("a", Record(log, "a"));
    auto b = scope.Defer("b", Record(log, "b"));

    CHECK_FALSE(scope.Release(b).has_value());
    CHECK(log == std::vector<std::string>{"b"});
    CHECK(scope.Size() == 1);

    // Second release of the same token is a no-op.
    CHECK_FALSE(scope.Release(b).has_value());
    CHECK(log.size() == 1);

    CHECK(scope.Close().empty());
    CHECK(log == std::vector<std::string>{"b", "a"});
}

TEST_CASE("ResourceScope: Release returns the action's error", "[core][scope]") {
    std::vector<std::string> log;
    ResourceScope scope;
    auto token = scope.Defer("w", Fail(log, "w"));

    auto error = scope.Release(token);
    REQUIRE(error.has_value());
    CHECK(error->server == "w");
    CHECK(scope.Empty());
}

TEST_CASE("ResourceScope: Close twice runs nothing the second time", "[core][scope]") {
    std::vector<std::string> log;
    ResourceScope scope;
    scope.Defer("a", Record(log, "a"));

    CHECK(scope.Close().empty());
    CHECK(scope.Close().empty());
    CHECK(log.size() == 1);
}

TEST_CASE("ResourceScope: destructor runs pending actions", "[core][scope]") {
    std::vector<std::string> log;
    {
        ResourceScope scope;
        scope.Defer("a", Record(log, "a"));
        scope.Defer("b", Record(log, "b"));
    }
    CHECK(log == std::vector<std::string>{"b", "a"});
}
