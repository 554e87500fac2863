#include <catch2/catch_test_macros.hpp>

#include <aion_mcp/mcp/capability_registry.hpp>

#include <string>

using namespace aion_mcp;

namespace {

CapabilityRegistry MakeDefaultRegistry() {
    CapabilityRegistry::Builder builder;
    builder.AddTools(DefaultTools()).AddResource(ModelCatalogResource());
    return std::move(builder).Build().Value();
}

} // anonymous namespace

// ===========================================================================
// Builder
// ===========================================================================

TEST_CASE("CapabilityRegistry: list order is insertion order", "[mcp][registry]") {
    auto registry = MakeDefaultRegistry();
    REQUIRE(registry.ListTools().size() == 2);
    CHECK(registry.ListTools()[0].name == "run_inference");
    CHECK(registry.ListTools()[1].name == "data_analysis");
    REQUIRE(registry.ListResources().size() == 1);
    CHECK(registry.ListResources()[0].locator == "aion-r://models/catalog");
}

TEST_CASE("CapabilityRegistry: duplicate tool names are rejected", "[mcp][registry]") {
    CapabilityRegistry::Builder builder;
    builder.AddTool(ToolDescriptor{"echo", "", {}})
           .AddTool(ToolDescriptor{"echo", "again", {}});
    auto r = std::move(builder).Build();
    REQUIRE(r.IsErr());
    CHECK(r.Error().message.find("echo") != std::string::npos);
}

TEST_CASE("CapabilityRegistry: duplicate or empty locators are rejected", "[mcp][registry]") {
    SECTION("duplicate") {
        CapabilityRegistry::Builder builder;
        builder.AddResource(ModelCatalogResource()).AddResource(ModelCatalogResource());
        CHECK(std::move(builder).Build().IsErr());
    }
    SECTION("empty") {
        CapabilityRegistry::Builder builder;
        builder.AddResource(ResourceDescriptor{"nameless", "dataset", "", ""});
        CHECK(std::move(builder).Build().IsErr());
    }
}

TEST_CASE("CapabilityRegistry: empty registry is valid", "[mcp][registry]") {
    auto r = CapabilityRegistry::Builder{}.Build();
    REQUIRE(r.IsOk());
    CHECK(r.Value().ListTools().empty());
    CHECK(r.Value().ListResources().empty());
}

// ===========================================================================
// Descriptors
// ===========================================================================

TEST_CASE("ToolDescriptor: ToJson renders a JSON Schema", "[mcp][registry]") {
    auto registry = MakeDefaultRegistry();
    auto j = registry.ListTools()[0].ToJson();
    CHECK(j["name"] == "run_inference");
    CHECK(j["inputSchema"]["type"] == "object");
    CHECK(j["inputSchema"]["properties"]["model"]["type"] == "string");
    CHECK(j["inputSchema"]["properties"]["params"]["type"] == "object");
    CHECK(j["inputSchema"]["required"] == Json::array({"model", "prompt"}));
}

TEST_CASE("ToolDescriptor: Any fields carry no type", "[mcp][registry]") {
    auto registry = MakeDefaultRegistry();
    auto j = registry.ListTools()[1].ToJson();
    CHECK_FALSE(j["inputSchema"]["properties"]["data"].contains("type"));
    CHECK(j["inputSchema"]["properties"]["ops"]["type"] == "array");
}

TEST_CASE("ResourceDescriptor: ToJson has uri, name and kind", "[mcp][registry]") {
    auto j = ResourceDescriptor{"Sales", "dataset", "aion-r://datasets/sales", ""}.ToJson();
    CHECK(j["uri"] == "aion-r://datasets/sales");
    CHECK(j["name"] == "Sales");
    CHECK(j["kind"] == "dataset");
    CHECK_FALSE(j.contains("description"));
}

// ===========================================================================
// Validate
// ===========================================================================

TEST_CASE("Validate: accepts complete inputs and passes extras through", "[mcp][registry]") {
    auto registry = MakeDefaultRegistry();
    Json inputs = {{"model", "m1"}, {"prompt", "hi"}, {"seed", 3}};
    auto r = registry.Validate("run_inference", inputs);
    REQUIRE(r.IsOk());
    CHECK(r.Value() == inputs);
}

TEST_CASE("Validate: unknown tool", "[mcp][registry]") {
    auto registry = MakeDefaultRegistry();
    auto r = registry.Validate("nope", Json::object());
    REQUIRE(r.IsErr());
    CHECK(r.Error().kind == ValidationFailureKind::UnknownTool);
    CHECK(r.Error().ToData() == Json{{"tool", "nope"}});
}

TEST_CASE("Validate: missing required fields in schema order", "[mcp][registry]") {
    auto registry = MakeDefaultRegistry();
    auto r = registry.Validate("run_inference", Json::object());
    REQUIRE(r.IsErr());
    CHECK(r.Error().kind == ValidationFailureKind::SchemaError);
    REQUIRE(r.Error().missing.size() == 2);
    CHECK(r.Error().missing[0] == "model");
    CHECK(r.Error().missing[1] == "prompt");
    CHECK(r.Error().ToData()["missing"] == Json::array({"model", "prompt"}));
}

TEST_CASE("Validate: wrong field types are reported", "[mcp][registry]") {
    auto registry = MakeDefaultRegistry();
    auto r = registry.Validate("data_analysis",
                               Json{{"data", Json::array({1, 2})}, {"ops", "sum"}});
    REQUIRE(r.IsErr());
    CHECK(r.Error().missing.empty());
    REQUIRE(r.Error().mismatched.size() == 1);
    CHECK(r.Error().mismatched[0].field == "ops");
    CHECK(r.Error().mismatched[0].expected == "array");
    CHECK(r.Error().mismatched[0].actual == "string");
    CHECK(r.Error().Summary().find("ops") != std::string::npos);
}

TEST_CASE("Validate: non-object inputs", "[mcp][registry]") {
    auto registry = MakeDefaultRegistry();
    auto r = registry.Validate("run_inference", Json::array());
    REQUIRE(r.IsErr());
    REQUIRE(r.Error().mismatched.size() == 1);
    CHECK(r.Error().mismatched[0].field == "inputs");
}

// ===========================================================================
// Model catalog
// ===========================================================================

TEST_CASE("ModelResourcesFromCatalog: bare array", "[mcp][registry]") {
    auto catalog = Json::parse(R"([{"id":"llama-3","name":"Llama 3"},{"id":42}])");
    auto resources = ModelResourcesFromCatalog(catalog);
    REQUIRE(resources.size() == 2);
    CHECK(resources[0].locator == "aion-r://models/llama-3");
    CHECK(resources[0].name == "Llama 3");
    CHECK(resources[0].kind == "model");
    CHECK(resources[1].locator == "aion-r://models/42");
    CHECK(resources[1].name == "42");
}

TEST_CASE("ModelResourcesFromCatalog: wrapped object, bad entries skipped", "[mcp][registry]") {
    auto catalog = Json::parse(
        R"({"models":[{"name":"no id"},{"id":""},"text",{"id":"gpt","description":"d"}]})");
    auto resources = ModelResourcesFromCatalog(catalog);
    REQUIRE(resources.size() == 1);
    CHECK(resources[0].locator == "aion-r://models/gpt");
    CHECK(resources[0].description == "d");
}

TEST_CASE("ModelResourcesFromCatalog: non-list yields nothing", "[mcp][registry]") {
    CHECK(ModelResourcesFromCatalog(Json{{"status", "ok"}}).empty());
}
