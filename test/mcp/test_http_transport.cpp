#include <catch2/catch_test_macros.hpp>

#include <archive_mcp/mcp/http_transport.hpp>

#include <httplib.h>

#include <string>
#include <thread>

using namespace archive_mcp;

namespace {

// Runs an HttpTransport on an OS-chosen local port for the test's lifetime.
class LocalTransport {
public:
    explicit LocalTransport(const McpServer& server) : transport_(server) {
        port_ = transport_.BindToAnyPort("127.0.0.1");
        thread_ = std::thread([this] { (void)transport_.ListenAfterBind(); });
        transport_.WaitUntilReady();
    }

    ~LocalTransport() {
        transport_.Stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    LocalTransport(const LocalTransport&) = delete;
    LocalTransport& operator=(const LocalTransport&) = delete;

    [[nodiscard]] int Port() const noexcept { return port_; }

private:
    HttpTransport transport_;
    int port_ = 0;
    std::thread thread_;
};

void RegisterEcho(McpServer& server) {
    server.Tools().Register("echo", "Echo", nlohmann::json::object(),
        [](const nlohmann::json& args) {
            return ToolResult{false, nlohmann::json::array(
                {{{"type", "text"}, {"text", args.value("message", "")}}})};
        });
}

} // anonymous namespace

TEST_CASE("HttpTransport: POST /mcp round trip", "[mcp][http]") {
    McpServer server(ServerInfo{"archive-mcp", "9.9.9"});
    RegisterEcho(server);
    LocalTransport local(server);
    REQUIRE(local.Port() > 0);

    httplib::Client cli("127.0.0.1", local.Port());
    auto res = cli.Post("/mcp",
        R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"echo","arguments":{"message":"over http"}}})",
        "application/json");
    REQUIRE(res);
    CHECK(res->status == 200);

    auto body = nlohmann::json::parse(res->body);
    CHECK(body["id"] == 1);
    CHECK(body["result"]["content"][0]["text"] == "over http");
}

TEST_CASE("HttpTransport: POST / is an alias", "[mcp][http]") {
    McpServer server(ServerInfo{"archive-mcp", "9.9.9"});
    LocalTransport local(server);

    httplib::Client cli("127.0.0.1", local.Port());
    auto res = cli.Post("/", R"({"jsonrpc":"2.0","id":"x","method":"initialize"})",
                        "application/json");
    REQUIRE(res);
    CHECK(res->status == 200);
    auto body = nlohmann::json::parse(res->body);
    CHECK(body["result"]["serverInfo"]["version"] == "9.9.9");
}

TEST_CASE("HttpTransport: notifications answer 204", "[mcp][http]") {
    McpServer server(ServerInfo{"archive-mcp", "9.9.9"});
    LocalTransport local(server);

    httplib::Client cli("127.0.0.1", local.Port());
    auto res = cli.Post("/mcp", R"({"jsonrpc":"2.0","method":"notifications/initialized"})",
                        "application/json");
    REQUIRE(res);
    CHECK(res->status == 204);
    CHECK(res->body.empty());
}

TEST_CASE("HttpTransport: malformed body yields a parse error", "[mcp][http]") {
    McpServer server(ServerInfo{"archive-mcp", "9.9.9"});
    LocalTransport local(server);

    httplib::Client cli("127.0.0.1", local.Port());
    auto res = cli.Post("/mcp", "{oops", "application/json");
    REQUIRE(res);
    CHECK(res->status == 400);
    auto body = nlohmann::json::parse(res->body);
    CHECK(body["error"]["code"] == -32700);
    CHECK(body["id"].is_null());
}

TEST_CASE("HttpTransport: GET /health", "[mcp][http]") {
    McpServer server(ServerInfo{"archive-mcp", "9.9.9"});
    LocalTransport local(server);

    httplib::Client cli("127.0.0.1", local.Port());
    auto res = cli.Get("/health");
    REQUIRE(res);
    CHECK(res->status == 200);
    auto body = nlohmann::json::parse(res->body);
    CHECK(body == nlohmann::json{{"status", "ok"}, {"server", "archive-mcp"},
                                 {"version", "9.9.9"}});
}
