#include <catch2/catch_test_macros.hpp>

#include <aion_mcp/mcp/mcp_server.hpp>

#include "mocks/mock_backend_session.hpp"

#include <sstream>
#include <string>
#include <vector>

using namespace aion_mcp;
using namespace aion_mcp::testing;

namespace {

std::string Frame(const std::string& payload) {
    return EncodeFrame(payload);
}

std::string Frame(const Json& message) {
    return EncodeFrame(message.dump());
}

// Decode every frame the server wrote.
std::vector<Json> ReadReplies(const std::string& output) {
    std::istringstream in(output);
    FrameReader reader(in);
    std::vector<Json> replies;
    while (true) {
        auto frame = reader.ReadFrame();
        REQUIRE(frame.IsOk());
        if (frame.Value().status == FrameReader::Status::EndOfStream) {
            break;
        }
        replies.push_back(Json::parse(frame.Value().payload));
    }
    return replies;
}

struct Fixture {
    CapabilityRegistry registry = [] {
        CapabilityRegistry::Builder builder;
        builder.AddTools(DefaultTools()).AddResource(ModelCatalogResource());
        return std::move(builder).Build().Value();
    }();
    MockBackendSession mock;
    BackendBridge bridge{mock};
    Dispatcher dispatcher{registry, bridge};
};

} // anonymous namespace

// ===========================================================================
// HandlePayload
// ===========================================================================

TEST_CASE("McpServer: HandlePayload answers a request", "[mcp][server]") {
    Fixture f;
    std::istringstream in;
    std::ostringstream out;
    McpServer server(f.dispatcher, in, out);

    auto r = server.HandlePayload(R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})");
    REQUIRE(r.has_value());
    CHECK((*r)["result"]["tools"].size() == 2);
    CHECK(out.str().empty());
}

TEST_CASE("McpServer: HandlePayload parse error has null id", "[mcp][server]") {
    Fixture f;
    std::istringstream in;
    std::ostringstream out;
    McpServer server(f.dispatcher, in, out);

    auto r = server.HandlePayload("not json");
    REQUIRE(r.has_value());
    CHECK((*r)["error"]["code"] == error_code::kParseError);
    CHECK((*r)["id"].is_null());
}

TEST_CASE("McpServer: HandlePayload batch is rejected", "[mcp][server]") {
    Fixture f;
    std::istringstream in;
    std::ostringstream out;
    McpServer server(f.dispatcher, in, out);

    auto r = server.HandlePayload(R"([{"jsonrpc":"2.0","id":1,"method":"tools/list"}])");
    REQUIRE(r.has_value());
    CHECK((*r)["error"]["code"] == error_code::kInvalidRequest);
}

// ===========================================================================
// Run (stdio loop)
// ===========================================================================

TEST_CASE("McpServer: Run answers frames in order", "[mcp][server]") {
    Fixture f;
    std::string input;
    input += Frame(Json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"},
                        {"params", {{"protocolVersion", "2024-11-05"}}}});
    input += Frame(Json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    input += Frame(Json{{"jsonrpc", "2.0"}, {"id", "two"}, {"method", "tools/list"}});
    input += Frame(Json{{"jsonrpc", "2.0"}, {"id", 3}, {"method", "resources/list"}});

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(f.dispatcher, in, out);

    auto run = server.Run();
    REQUIRE(run.IsOk());

    auto replies = ReadReplies(out.str());
    REQUIRE(replies.size() == 3);
    CHECK(replies[0]["id"] == 1);
    CHECK(replies[0]["result"]["protocolVersion"] == "2024-11-05");
    CHECK(replies[1]["id"] == "two");
    CHECK(replies[1]["result"]["tools"].size() == 2);
    CHECK(replies[2]["id"] == 3);
    CHECK(replies[2]["result"]["resources"][0]["uri"] == "aion-r://models/catalog");
}

TEST_CASE("McpServer: Run forwards tools/call to the backend", "[mcp][server]") {
    Fixture f;
    f.mock.EnqueuePost(HttpOk(200, R"({"status":"success","output":"42"})"));

    std::istringstream in(Frame(std::string(
        R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"run_inference","inputs":{"model":"m","prompt":"p"}},"id":3})")));
    std::ostringstream out;
    McpServer server(f.dispatcher, in, out);

    REQUIRE(server.Run().IsOk());
    CHECK(out.str() == EncodeFrame(
        R"({"jsonrpc":"2.0","result":{"status":"success","output":"42"},"id":3})"));
}

TEST_CASE("McpServer: notifications alone produce no output", "[mcp][server]") {
    Fixture f;
    std::string input;
    input += Frame(Json{{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    input += Frame(Json{{"jsonrpc", "2.0"}, {"method", "unknown/thing"}});
    input += Frame(Json{{"jsonrpc", "2.0"}, {"method", 7}});

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(f.dispatcher, in, out);

    REQUIRE(server.Run().IsOk());
    CHECK(out.str().empty());
}

TEST_CASE("McpServer: malformed JSON is answered and the loop continues", "[mcp][server]") {
    Fixture f;
    std::string input = Frame(std::string("{not json"));
    input += Frame(Json{{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(f.dispatcher, in, out);

    REQUIRE(server.Run().IsOk());
    auto replies = ReadReplies(out.str());
    REQUIRE(replies.size() == 2);
    CHECK(replies[0]["error"]["code"] == error_code::kParseError);
    CHECK(replies[0]["id"].is_null());
    CHECK(replies[1]["id"] == 2);
}

TEST_CASE("McpServer: deeply nested request is answered and the loop continues", "[mcp][server]") {
    Fixture f;
    std::string input = Frame(
        R"({"jsonrpc":"2.0","id":1,"method":"tools/list","params":)" +
        std::string(200000, '[') + std::string(200000, ']') + "}");
    input += Frame(Json{{"jsonrpc", "2.0"}, {"id", 2}, {"method", "tools/list"}});

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(f.dispatcher, in, out);

    REQUIRE(server.Run().IsOk());
    auto replies = ReadReplies(out.str());
    REQUIRE(replies.size() == 2);
    CHECK(replies[0]["error"]["code"] == error_code::kParseError);
    CHECK(replies[0]["id"].is_null());
    CHECK(replies[1]["id"] == 2);
    CHECK(replies[1]["result"]["tools"].size() == 2);
}

TEST_CASE("McpServer: bad header block is answered and the loop continues", "[mcp][server]") {
    Fixture f;
    std::string input = "Content-Length: abc\r\n\r\n";
    input += Frame(Json{{"jsonrpc", "2.0"}, {"id", 5}, {"method", "tools/list"}});

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(f.dispatcher, in, out);

    REQUIRE(server.Run().IsOk());
    auto replies = ReadReplies(out.str());
    REQUIRE(replies.size() == 2);
    CHECK(replies[0]["error"]["code"] == error_code::kParseError);
    CHECK(replies[1]["id"] == 5);
}

TEST_CASE("McpServer: truncated frame ends the run without a reply", "[mcp][server]") {
    Fixture f;
    std::string input = Frame(Json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}});
    input += "Content-Length: 500\r\n\r\n{\"jsonrpc\":\"2.0\",\"id\":2,";

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(f.dispatcher, in, out);

    auto run = server.Run();
    REQUIRE(run.IsErr());
    CHECK(run.Error().category == ErrorCategory::Framing);
    CHECK(run.Error().ExitCode() == 1);

    auto replies = ReadReplies(out.str());
    REQUIRE(replies.size() == 1);
    CHECK(replies[0]["id"] == 1);
}

TEST_CASE("McpServer: output failure stops the run", "[mcp][server]") {
    Fixture f;
    std::istringstream in(
        Frame(Json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}}));
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    McpServer server(f.dispatcher, in, out);

    auto run = server.Run();
    REQUIRE(run.IsErr());
    CHECK(run.Error().category == ErrorCategory::Io);
}
