#include <catch2/catch_test_macros.hpp>

#include <archive_mcp/mcp/mcp_server.hpp>

#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace archive_mcp;

namespace {

ToolResult Text(const std::string& text, bool is_error = false) {
    return {is_error, nlohmann::json::array({{{"type", "text"}, {"text", text}}})};
}

void RegisterTestTools(McpServer& server) {
    server.Tools().Register("echo", "Echo the input",
        {{"type", "object"},
         {"properties", {{"message", {{"type", "string"}}}}},
         {"required", nlohmann::json::array({"message"})}},
        [](const nlohmann::json& args) { return Text(args.value("message", "")); });

    server.Tools().Register("fails", "Always throws", nlohmann::json::object(),
        [](const nlohmann::json&) -> ToolResult {
            throw std::runtime_error("disk on fire");
        });

    server.Tools().Register("soft_error", "Reports a tool-level error",
        nlohmann::json::object(),
        [](const nlohmann::json&) { return Text("bad input", true); });
}

nlohmann::json Request(nlohmann::json id, const std::string& method,
                       nlohmann::json params = nlohmann::json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", std::move(id)}, {"method", method},
            {"params", std::move(params)}};
}

} // anonymous namespace

// ===========================================================================
// RouteMethod
// ===========================================================================

TEST_CASE("RouteMethod: exact names only", "[mcp][server]") {
    CHECK(RouteMethod("initialize") == MethodCategory::Initialize);
    CHECK(RouteMethod("tools/list") == MethodCategory::ToolsList);
    CHECK(RouteMethod("tools/call") == MethodCategory::ToolsCall);
    CHECK(RouteMethod("resources/list") == MethodCategory::ResourcesList);
    CHECK(RouteMethod("resources/read") == MethodCategory::ResourcesRead);
    CHECK(RouteMethod("context/get") == MethodCategory::ContextGet);
    CHECK_FALSE(RouteMethod("Initialize").has_value());
    CHECK_FALSE(RouteMethod("tools/list ").has_value());
    CHECK_FALSE(RouteMethod("").has_value());
}

// ===========================================================================
// McpResponse
// ===========================================================================

TEST_CASE("McpResponse: success and failure encodings", "[mcp][server]") {
    auto ok = McpResponse::Success(3, {{"x", 1}}).ToJson();
    CHECK(ok == nlohmann::json{{"jsonrpc", "2.0"}, {"id", 3}, {"result", {{"x", 1}}}});

    auto err = McpResponse::Failure("abc", rpc_error::kMethodNotFound, "nope");
    CHECK(err.IsError());
    auto j = err.ToJson();
    CHECK(j["id"] == "abc");
    CHECK(j["error"]["code"] == -32601);
    CHECK(j["error"]["message"] == "nope");
    CHECK_FALSE(j.contains("result"));
}

// ===========================================================================
// Dispatch
// ===========================================================================

TEST_CASE("McpServer: initialize reports server info and capabilities", "[mcp][server]") {
    McpServer server(ServerInfo{"archive-mcp", "1.2.3"});

    auto response = server.Dispatch({"initialize", nlohmann::json::object(), 1});
    REQUIRE_FALSE(response.IsError());
    const auto& r = response.outcome.Value();
    CHECK(r["protocolVersion"] == "2024-11-05");
    CHECK(r["serverInfo"]["name"] == "archive-mcp");
    CHECK(r["serverInfo"]["version"] == "1.2.3");
    CHECK(r["capabilities"]["tools"]["enabled"] == true);
    CHECK(r["capabilities"]["resources"]["enabled"] == true);
    CHECK(r["capabilities"]["context"]["enabled"] == true);
    CHECK(response.id == 1);
}

TEST_CASE("McpServer: tools/list returns registered tools", "[mcp][server]") {
    McpServer server(ServerInfo{"t", "0"});
    RegisterTestTools(server);

    auto response = server.Dispatch({"tools/list", nlohmann::json::object(), 2});
    REQUIRE_FALSE(response.IsError());
    const auto& tools = response.outcome.Value()["tools"];
    REQUIRE(tools.size() == 3);
    CHECK(tools[0]["name"] == "echo");
    CHECK(tools[0]["description"] == "Echo the input");
    CHECK(tools[0]["inputSchema"]["required"][0] == "message");
}

TEST_CASE("McpServer: tools/call runs the handler", "[mcp][server]") {
    McpServer server(ServerInfo{"t", "0"});
    RegisterTestTools(server);

    auto response = server.Dispatch(
        {"tools/call", {{"name", "echo"}, {"arguments", {{"message", "hi"}}}}, 7});
    REQUIRE_FALSE(response.IsError());
    const auto& r = response.outcome.Value();
    CHECK(r["content"][0]["text"] == "hi");
    CHECK_FALSE(r.contains("isError"));
}

TEST_CASE("McpServer: tools/call without arguments uses an empty object", "[mcp][server]") {
    McpServer server(ServerInfo{"t", "0"});
    RegisterTestTools(server);

    auto response = server.Dispatch({"tools/call", {{"name", "echo"}}, 8});
    REQUIRE_FALSE(response.IsError());
    CHECK(response.outcome.Value()["content"][0]["text"] == "");
}

TEST_CASE("McpServer: tool-level errors set isError", "[mcp][server]") {
    McpServer server(ServerInfo{"t", "0"});
    RegisterTestTools(server);

    auto response = server.Dispatch({"tools/call", {{"name", "soft_error"}}, 9});
    REQUIRE_FALSE(response.IsError());
    CHECK(response.outcome.Value()["isError"] == true);
}

TEST_CASE("McpServer: unknown method is MethodNotFound", "[mcp][server]") {
    McpServer server(ServerInfo{"t", "0"});

    auto response = server.Dispatch({"frobnicate", nlohmann::json::object(), 4});
    REQUIRE(response.IsError());
    CHECK(response.outcome.Error().code == -32601);
    CHECK(response.outcome.Error().message == "Method not found: frobnicate");

    auto j = response.ToJson();
    CHECK(j["id"] == 4);
    CHECK_FALSE(j.contains("result"));
}

TEST_CASE("McpServer: unknown tool is an internal error", "[mcp][server]") {
    McpServer server(ServerInfo{"t", "0"});

    auto response = server.Dispatch({"tools/call", {{"name", "missing"}}, 5});
    REQUIRE(response.IsError());
    CHECK(response.outcome.Error().code == -32603);
    CHECK(response.outcome.Error().message == "Internal error: Tool not found: missing");
}

TEST_CASE("McpServer: missing tool name is an internal error", "[mcp][server]") {
    McpServer server(ServerInfo{"t", "0"});

    auto response = server.Dispatch({"tools/call", nlohmann::json::object(), 5});
    REQUIRE(response.IsError());
    CHECK(response.outcome.Error().code == -32603);
    CHECK(response.outcome.Error().message == "Internal error: Missing 'name' parameter");
}

TEST_CASE("McpServer: non-object arguments are rejected", "[mcp][server]") {
    McpServer server(ServerInfo{"t", "0"});
    RegisterTestTools(server);

    auto response = server.Dispatch(
        {"tools/call", {{"name", "echo"}, {"arguments", nlohmann::json::array()}}, 5});
    REQUIRE(response.IsError());
    CHECK(response.outcome.Error().code == -32603);
}

TEST_CASE("McpServer: throwing handler becomes an internal error", "[mcp][server]") {
    McpServer server(ServerInfo{"t", "0"});
    RegisterTestTools(server);

    auto response = server.Dispatch({"tools/call", {{"name", "fails"}}, 6});
    REQUIRE(response.IsError());
    CHECK(response.outcome.Error().code == -32603);
    CHECK(response.outcome.Error().message == "Internal error: disk on fire");
}

TEST_CASE("McpServer: handler returning an invalid future", "[mcp][server]") {
    McpServer server(ServerInfo{"t", "0"});
    server.Tools().RegisterAsync("hollow", "Returns nothing", nlohmann::json::object(),
        [](const nlohmann::json&) { return std::future<ToolResult>{}; });

    auto response = server.Dispatch({"tools/call", {{"name", "hollow"}}, 6});
    REQUIRE(response.IsError());
    CHECK(response.outcome.Error().code == -32603);
}

TEST_CASE("McpServer: resources/list and resources/read", "[mcp][server]") {
    McpServer server(ServerInfo{"t", "0"});
    server.Resources().Register("archive://index", "Archive Index", "Listing",
                                [] { return std::string("3 documents"); });

    auto list = server.Dispatch({"resources/list", nlohmann::json::object(), 1});
    REQUIRE_FALSE(list.IsError());
    const auto& resources = list.outcome.Value()["resources"];
    REQUIRE(resources.size() == 1);
    CHECK(resources[0] == nlohmann::json{{"uri", "archive://index"},
                                         {"name", "Archive Index"},
                                         {"description", "Listing"},
                                         {"mimeType", "text/plain"}});

    auto read = server.Dispatch({"resources/read", {{"uri", "archive://index"}}, 2});
    REQUIRE_FALSE(read.IsError());
    const auto& contents = read.outcome.Value()["contents"];
    REQUIRE(contents.size() == 1);
    CHECK(contents[0]["uri"] == "archive://index");
    CHECK(contents[0]["mimeType"] == "text/plain");
    CHECK(contents[0]["text"] == "3 documents");
}

TEST_CASE("McpServer: resources/read of unknown URI", "[mcp][server]") {
    McpServer server(ServerInfo{"t", "0"});

    auto response = server.Dispatch({"resources/read", {{"uri", "archive://x"}}, 3});
    REQUIRE(response.IsError());
    CHECK(response.outcome.Error().code == -32603);
    CHECK(response.outcome.Error().message ==
          "Internal error: Resource not found: archive://x");

    auto missing = server.Dispatch({"resources/read", nlohmann::json::object(), 4});
    REQUIRE(missing.IsError());
    CHECK(missing.outcome.Error().code == -32603);
}

TEST_CASE("McpServer: context/get merges providers", "[mcp][server]") {
    McpServer server(ServerInfo{"t", "0"});
    server.Context().Register([](const nlohmann::json&) {
        return nlohmann::json{{"status", "starting"}, {"a", 1}};
    });
    server.Context().Register([](const nlohmann::json&) {
        return nlohmann::json{{"status", "operational"}};
    });

    auto response = server.Dispatch({"context/get", nlohmann::json::object(), 1});
    REQUIRE_FALSE(response.IsError());
    CHECK(response.outcome.Value() ==
          nlohmann::json{{"a", 1}, {"status", "operational"}});
}

TEST_CASE("McpServer: context provider returning non-object", "[mcp][server]") {
    McpServer server(ServerInfo{"t", "0"});
    server.Context().Register([](const nlohmann::json&) { return nlohmann::json(42); });

    auto response = server.Dispatch({"context/get", nlohmann::json::object(), 1});
    REQUIRE(response.IsError());
    CHECK(response.outcome.Error().code == -32603);
}

TEST_CASE("McpServer: a suspended handler does not block other requests",
          "[mcp][server][concurrency]") {
    McpServer server(ServerInfo{"t", "0"});
    std::promise<void> gate;
    auto opened = gate.get_future().share();

    server.Tools().Register("wait", "Blocks until released", nlohmann::json::object(),
        [opened](const nlohmann::json&) {
            auto status = opened.wait_for(std::chrono::seconds(5));
            return Text(status == std::future_status::ready ? "released" : "timeout");
        });
    server.Tools().Register("release", "Opens the gate", nlohmann::json::object(),
        [&gate](const nlohmann::json&) {
            gate.set_value();
            return Text("ok");
        });

    auto waiting = std::async(std::launch::async, [&server] {
        return server.Dispatch({"tools/call", {{"name", "wait"}}, 1});
    });
    auto release = server.Dispatch({"tools/call", {{"name", "release"}}, 2});
    auto waited = waiting.get();

    REQUIRE_FALSE(release.IsError());
    REQUIRE_FALSE(waited.IsError());
    CHECK(waited.outcome.Value()["content"][0]["text"] == "released");
}

TEST_CASE("McpServer: concurrent dispatch keeps ids paired", "[mcp][server][concurrency]") {
    McpServer server(ServerInfo{"t", "0"});
    RegisterTestTools(server);

    constexpr int kRequests = 32;
    std::vector<std::future<McpResponse>> pending;
    for (int i = 0; i < kRequests; ++i) {
        pending.push_back(std::async(std::launch::async, [&server, i] {
            return server.Dispatch({"tools/call",
                                    {{"name", "echo"},
                                     {"arguments", {{"message", std::to_string(i)}}}},
                                    i});
        }));
    }
    for (int i = 0; i < kRequests; ++i) {
        auto response = pending[i].get();
        REQUIRE_FALSE(response.IsError());
        CHECK(response.id == i);
        CHECK(response.outcome.Value()["content"][0]["text"] == std::to_string(i));
    }
}

// ===========================================================================
// HandleMessage
// ===========================================================================

TEST_CASE("McpServer: HandleMessage echoes ids verbatim", "[mcp][server]") {
    McpServer server(ServerInfo{"t", "0"});

    auto numeric = server.HandleMessage(Request(42, "initialize"));
    REQUIRE(numeric.has_value());
    CHECK((*numeric)["jsonrpc"] == "2.0");
    CHECK((*numeric)["id"] == 42);

    auto text = server.HandleMessage(Request("req-1", "tools/list"));
    REQUIRE(text.has_value());
    CHECK((*text)["id"] == "req-1");
}

TEST_CASE("McpServer: HandleMessage without id still answers", "[mcp][server]") {
    McpServer server(ServerInfo{"t", "0"});

    auto response = server.HandleMessage({{"jsonrpc", "2.0"}, {"method", "frobnicate"}});
    REQUIRE(response.has_value());
    CHECK((*response)["id"].is_null());
    CHECK((*response)["error"]["code"] == -32601);
}

TEST_CASE("McpServer: notifications get no response", "[mcp][server]") {
    McpServer server(ServerInfo{"t", "0"});

    auto response = server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    CHECK_FALSE(response.has_value());

    // With an id it is a request and is answered.
    auto with_id = server.HandleMessage(Request(1, "notifications/initialized"));
    REQUIRE(with_id.has_value());
    CHECK((*with_id)["error"]["code"] == -32601);
}

TEST_CASE("McpServer: malformed messages are Invalid Request", "[mcp][server]") {
    McpServer server(ServerInfo{"t", "0"});

    SECTION("not an object") {
        auto r = server.HandleMessage(nlohmann::json::array({1, 2}));
        REQUIRE(r.has_value());
        CHECK((*r)["error"]["code"] == -32600);
        CHECK((*r)["id"].is_null());
    }
    SECTION("missing method") {
        auto r = server.HandleMessage({{"jsonrpc", "2.0"}, {"id", 1}});
        REQUIRE(r.has_value());
        CHECK((*r)["error"]["code"] == -32600);
        CHECK((*r)["id"] == 1);
    }
    SECTION("wrong protocol version") {
        auto r = server.HandleMessage({{"jsonrpc", "1.0"}, {"id", 1}, {"method", "initialize"}});
        REQUIRE(r.has_value());
        CHECK((*r)["error"]["code"] == -32600);
    }
    SECTION("params not an object") {
        auto r = server.HandleMessage(Request(1, "tools/list", nlohmann::json::array()));
        REQUIRE(r.has_value());
        CHECK((*r)["error"]["code"] == -32600);
    }
}

TEST_CASE("McpServer: null params are treated as empty", "[mcp][server]") {
    McpServer server(ServerInfo{"t", "0"});

    auto r = server.HandleMessage(Request(1, "context/get", nullptr));
    REQUIRE(r.has_value());
    CHECK((*r)["result"] == nlohmann::json::object());
}
