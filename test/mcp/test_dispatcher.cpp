#include <catch2/catch_test_macros.hpp>

#include <aion_mcp/core/version.hpp>
#include <aion_mcp/mcp/dispatcher.hpp>

#include "mocks/mock_backend_session.hpp"

#include <string>

using namespace aion_mcp;
using namespace aion_mcp::testing;

namespace {

CapabilityRegistry MakeRegistry() {
    CapabilityRegistry::Builder builder;
    builder.AddTools(DefaultTools())
           .AddResource(ModelCatalogResource())
           .AddResource(ResourceDescriptor{"Sales", "dataset",
                                           "aion-r://datasets/sales", ""});
    return std::move(builder).Build().Value();
}

Message Request(const std::string& method, Json params, Json id = 1) {
    Message m;
    m.kind = MessageKind::Request;
    m.method = method;
    m.params = std::move(params);
    m.id = std::move(id);
    return m;
}

Message Notification(const std::string& method) {
    Message m;
    m.kind = MessageKind::Notification;
    m.method = method;
    return m;
}

// Registry, mock and bridge in one place so each test reads top-down.
struct Fixture {
    CapabilityRegistry registry = MakeRegistry();
    MockBackendSession mock;
    BackendBridge bridge{mock};
    Dispatcher dispatcher{registry, bridge};
};

} // anonymous namespace

// ===========================================================================
// initialize / list
// ===========================================================================

TEST_CASE("Dispatcher: initialize returns protocol and server info", "[mcp][dispatcher]") {
    Fixture f;
    auto r = f.dispatcher.Dispatch(Request("initialize", {{"protocolVersion", "2024-11-05"}}));
    REQUIRE(r.has_value());
    const auto& result = (*r)["result"];
    CHECK(result["protocolVersion"] == "2024-11-05");
    CHECK(result["server"]["name"] == "aion-mcp");
    CHECK(result["server"]["version"] == kVersion);
    CHECK(result["capabilities"].contains("tools"));
    CHECK(result["capabilities"].contains("resources"));
}

TEST_CASE("Dispatcher: initialize is repeatable", "[mcp][dispatcher]") {
    Fixture f;
    auto first = f.dispatcher.Dispatch(Request("initialize", Json::object(), 1));
    auto second = f.dispatcher.Dispatch(Request("initialize", Json::object(), 2));
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK((*first)["result"] == (*second)["result"]);
}

TEST_CASE("Dispatcher: tools/list works without initialize", "[mcp][dispatcher]") {
    Fixture f;
    auto r = f.dispatcher.Dispatch(Request("tools/list", Json::object(), "a"));
    REQUIRE(r.has_value());
    CHECK((*r)["id"] == "a");
    const auto& tools = (*r)["result"]["tools"];
    REQUIRE(tools.size() == 2);
    CHECK(tools[0]["name"] == "run_inference");
    CHECK(tools[1]["name"] == "data_analysis");
}

TEST_CASE("Dispatcher: resources/list returns resources in order", "[mcp][dispatcher]") {
    Fixture f;
    auto r = f.dispatcher.Dispatch(Request("resources/list", Json::object()));
    REQUIRE(r.has_value());
    const auto& resources = (*r)["result"]["resources"];
    REQUIRE(resources.size() == 2);
    CHECK(resources[0]["uri"] == "aion-r://models/catalog");
    CHECK(resources[1]["uri"] == "aion-r://datasets/sales");
}

TEST_CASE("Dispatcher: repeated list calls return identical catalogs", "[mcp][dispatcher]") {
    Fixture f;
    for (const char* method : {"tools/list", "resources/list"}) {
        INFO(method);
        auto first = f.dispatcher.Dispatch(Request(method, Json::object(), 1));
        REQUIRE(f.dispatcher.Dispatch(Request("initialize", Json::object(), 2)).has_value());
        auto second = f.dispatcher.Dispatch(Request(method, Json::object(), 1));
        REQUIRE(first.has_value());
        REQUIRE(second.has_value());
        CHECK(SerializeMessage(*first) == SerializeMessage(*second));
    }
    CHECK(f.mock.GetCallCount() == 0);
    CHECK(f.mock.PostCallCount() == 0);
}

TEST_CASE("Dispatcher: unknown method", "[mcp][dispatcher]") {
    Fixture f;
    auto r = f.dispatcher.Dispatch(Request("prompts/list", Json::object(), 9));
    REQUIRE(r.has_value());
    CHECK((*r)["error"]["code"] == error_code::kMethodNotFound);
    CHECK((*r)["error"]["data"]["method"] == "prompts/list");
    CHECK((*r)["id"] == 9);
}

// ===========================================================================
// tools/call
// ===========================================================================

TEST_CASE("Dispatcher: tools/call returns the backend result verbatim", "[mcp][dispatcher]") {
    Fixture f;
    f.mock.EnqueuePost(HttpOk(200, R"({"status":"success","output":"42"})"));

    auto r = f.dispatcher.Dispatch(Request(
        "tools/call",
        {{"name", "run_inference"}, {"inputs", {{"model", "m"}, {"prompt", "p"}}}},
        3));
    REQUIRE(r.has_value());
    CHECK(SerializeMessage(*r) ==
          R"({"jsonrpc":"2.0","result":{"status":"success","output":"42"},"id":3})");
    REQUIRE(f.mock.PostCallCount() == 1);
    CHECK(f.mock.PostCalls()[0].path == "/api/v1/infer");
}

TEST_CASE("Dispatcher: tools/call accepts arguments as the inputs key", "[mcp][dispatcher]") {
    Fixture f;
    f.mock.EnqueuePost(HttpOk(200, R"({"ok":true})"));

    auto r = f.dispatcher.Dispatch(Request(
        "tools/call",
        {{"name", "data_analysis"},
         {"arguments", {{"data", Json::array({1, 2})}, {"ops", Json::array({"mean"})}}}}));
    REQUIRE(r.has_value());
    CHECK((*r)["result"]["ok"] == true);
}

TEST_CASE("Dispatcher: missing required input never reaches the backend", "[mcp][dispatcher]") {
    Fixture f;
    auto r = f.dispatcher.Dispatch(Request(
        "tools/call",
        {{"name", "run_inference"}, {"inputs", {{"model", "m"}}}},
        3));
    REQUIRE(r.has_value());
    CHECK(SerializeMessage(*r) ==
          R"({"jsonrpc":"2.0","error":{"code":-32602,"message":"Invalid params","data":{"missing":["prompt"]}},"id":3})");
    CHECK(f.mock.PostCallCount() == 0);
}

TEST_CASE("Dispatcher: unknown tool never reaches the backend", "[mcp][dispatcher]") {
    Fixture f;
    auto r = f.dispatcher.Dispatch(Request(
        "tools/call", {{"name", "does_not_exist"}, {"inputs", Json::object()}}, 4));
    REQUIRE(r.has_value());
    CHECK((*r)["error"]["code"] == error_code::kUnknownTool);
    CHECK((*r)["error"]["data"]["tool"] == "does_not_exist");
    CHECK(f.mock.PostCallCount() == 0);
}

TEST_CASE("Dispatcher: malformed tools/call params", "[mcp][dispatcher]") {
    Fixture f;
    SECTION("params not an object") {
        auto r = f.dispatcher.Dispatch(Request("tools/call", Json::array({1})));
        CHECK((*r)["error"]["code"] == error_code::kInvalidParams);
    }
    SECTION("no name, no inputs") {
        auto r = f.dispatcher.Dispatch(Request("tools/call", Json::object()));
        CHECK((*r)["error"]["code"] == error_code::kInvalidParams);
        CHECK((*r)["error"]["data"]["missing"] == Json::array({"name", "inputs"}));
    }
    SECTION("name is not a string") {
        auto r = f.dispatcher.Dispatch(Request(
            "tools/call", {{"name", 5}, {"inputs", Json::object()}}));
        CHECK((*r)["error"]["code"] == error_code::kInvalidParams);
        CHECK((*r)["error"]["data"]["mismatched"][0]["field"] == "name");
    }
    SECTION("inputs is not an object") {
        auto r = f.dispatcher.Dispatch(Request(
            "tools/call", {{"name", "run_inference"}, {"inputs", "text"}}));
        CHECK((*r)["error"]["code"] == error_code::kInvalidParams);
        CHECK((*r)["error"]["data"]["mismatched"][0]["field"] == "inputs");
    }
    CHECK(f.mock.PostCallCount() == 0);
}

TEST_CASE("Dispatcher: backend failures are mapped", "[mcp][dispatcher]") {
    Fixture f;
    const Json params = {{"name", "run_inference"},
                         {"inputs", {{"model", "m"}, {"prompt", "p"}}}};

    SECTION("unreachable") {
        f.mock.EnqueuePost(TransportError(ErrorCategory::Connection, "refused"));
        auto r = f.dispatcher.Dispatch(Request("tools/call", params));
        CHECK((*r)["error"]["code"] == error_code::kInternalError);
        CHECK((*r)["error"]["message"] == "Backend unreachable");
    }
    SECTION("application error") {
        f.mock.EnqueuePost(HttpOk(400, R"({"error":"unknown model m"})"));
        auto r = f.dispatcher.Dispatch(Request("tools/call", params));
        CHECK((*r)["error"]["code"] == error_code::kBackendError);
        CHECK((*r)["error"]["message"] == "unknown model m");
    }
}

// ===========================================================================
// Notifications and responses
// ===========================================================================

TEST_CASE("Dispatcher: notifications never produce a reply", "[mcp][dispatcher]") {
    Fixture f;
    CHECK_FALSE(f.dispatcher.Dispatch(Notification("notifications/initialized")).has_value());
    CHECK_FALSE(f.dispatcher.Dispatch(Notification("tools/list")).has_value());
    CHECK_FALSE(f.dispatcher.Dispatch(Notification("no/such/method")).has_value());
}

TEST_CASE("Dispatcher: failing tools/call notification is silent", "[mcp][dispatcher]") {
    Fixture f;
    f.mock.EnqueuePost(TransportError(ErrorCategory::Timeout, "timed out"));
    Message m = Notification("tools/call");
    m.params = Json{{"name", "run_inference"},
                    {"inputs", {{"model", "m"}, {"prompt", "p"}}}};
    CHECK_FALSE(f.dispatcher.Dispatch(m).has_value());
    CHECK(f.mock.PostCallCount() == 1);
}

TEST_CASE("Dispatcher: inbound responses are ignored", "[mcp][dispatcher]") {
    Fixture f;
    Message m;
    m.kind = MessageKind::Response;
    m.id = 1;
    m.result = Json::object();
    CHECK_FALSE(f.dispatcher.Dispatch(m).has_value());
}
