#include <catch2/catch_test_macros.hpp>

#include <sre_gateway/mcp/schema_validator.hpp>

using namespace sre_gateway;

namespace {

nlohmann::json LogsSchema() {
    return {
        {"type", "object"},
        {"properties", {
            {"pod", {{"type", "string"}}},
            {"namespace", {{"type", "string"}, {"default", "default"}}},
            {"container", {{"type", "string"}}},
            {"lines", {{"type", "integer"}, {"default", 100}}},
            {"files", {{"type", "array"}, {"items", {{"type", "string"}}}}},
            {"force", {{"type", "boolean"}, {"default", false}}},
        }},
        {"required", nlohmann::json::array({"pod"})},
    };
}

} // anonymous namespace

// ===========================================================================
// Accepted input
// ===========================================================================

TEST_CASE("ValidateArguments: fills defaults for absent fields", "[mcp][schema]") {
    auto result = ValidateArguments(LogsSchema(), {{"pod", "api-0"}});
    REQUIRE(result.IsOk());
    const auto& args = result.Value();
    CHECK(args["pod"] == "api-0");
    CHECK(args["namespace"] == "default");
    CHECK(args["lines"] == 100);
    CHECK(args["force"] == false);
    CHECK_FALSE(args.contains("container"));
}

TEST_CASE("ValidateArguments: given values win over defaults", "[mcp][schema]") {
    auto result = ValidateArguments(LogsSchema(),
                                    {{"pod", "api-0"}, {"namespace", "prod"}, {"lines", 5}});
    REQUIRE(result.IsOk());
    CHECK(result.Value()["namespace"] == "prod");
    CHECK(result.Value()["lines"] == 5);
}

TEST_CASE("ValidateArguments: null arguments count as an empty object", "[mcp][schema]") {
    nlohmann::json schema = {{"type", "object"},
                             {"properties", {{"service", {{"type", "string"}}}}}};
    auto result = ValidateArguments(schema, nullptr);
    REQUIRE(result.IsOk());
    CHECK(result.Value().is_object());
    CHECK(result.Value().empty());
}

TEST_CASE("ValidateArguments: whole floats pass as integers", "[mcp][schema]") {
    auto result = ValidateArguments(LogsSchema(), {{"pod", "p"}, {"lines", 20.0}});
    CHECK(result.IsOk());
}

TEST_CASE("ValidateArguments: explicit null on optional field is dropped", "[mcp][schema]") {
    auto result = ValidateArguments(LogsSchema(), {{"pod", "p"}, {"container", nullptr}});
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value().contains("container"));
}

TEST_CASE("ValidateArguments: undeclared fields pass through", "[mcp][schema]") {
    auto result = ValidateArguments(LogsSchema(), {{"pod", "p"}, {"extra", {1, 2}}});
    REQUIRE(result.IsOk());
    CHECK(result.Value()["extra"] == nlohmann::json({1, 2}));
}

// ===========================================================================
// Rejected input
// ===========================================================================

TEST_CASE("ValidateArguments: non-object arguments are rejected", "[mcp][schema][error]") {
    auto result = ValidateArguments(LogsSchema(), nlohmann::json::array({"pod"}));
    REQUIRE(result.IsErr());
    CHECK(result.Error().category == ErrorCategory::Validation);
    CHECK(result.Error().message == "arguments must be a JSON object");
}

TEST_CASE("ValidateArguments: missing required field names the field", "[mcp][schema][error]") {
    auto result = ValidateArguments(LogsSchema(), nlohmann::json::object());
    REQUIRE(result.IsErr());
    CHECK(result.Error().field == std::optional<std::string>("pod"));
    CHECK(result.Error().message == "missing required field 'pod'");
    CHECK(result.Error().RpcCode() == rpc_code::kInvalidParams);
}

TEST_CASE("ValidateArguments: null required field is missing", "[mcp][schema][error]") {
    auto result = ValidateArguments(LogsSchema(), {{"pod", nullptr}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "missing required field 'pod'");
}

TEST_CASE("ValidateArguments: type mismatch is rejected", "[mcp][schema][error]") {
    auto result = ValidateArguments(LogsSchema(), {{"pod", "p"}, {"lines", "ten"}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "field 'lines' must be of type integer");
}

TEST_CASE("ValidateArguments: fractional number is not an integer", "[mcp][schema][error]") {
    auto result = ValidateArguments(LogsSchema(), {{"pod", "p"}, {"lines", 2.5}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().field == std::optional<std::string>("lines"));
}

TEST_CASE("ValidateArguments: array items are type checked", "[mcp][schema][error]") {
    auto result = ValidateArguments(LogsSchema(),
                                    {{"pod", "p"}, {"files", nlohmann::json::array({"a", 3})}});
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "field 'files' item 1 must be of type string");
}
