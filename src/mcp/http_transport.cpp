#include <archive_mcp/mcp/http_transport.hpp>

#include <archive_mcp/core/log.hpp>

#include <httplib.h>

#include <string>

namespace archive_mcp {

namespace {

constexpr const char* kJsonContentType = "application/json";

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl — pimpl body holding the httplib::Server and its routes.
// ---------------------------------------------------------------------------
struct HttpTransport::Impl {
    const McpServer& server;
    httplib::Server http;

    explicit Impl(const McpServer& s) : server(s) {
        auto rpc = [this](const httplib::Request& req, httplib::Response& res) {
            HandleRpc(req, res);
        };
        http.Post("/mcp", rpc);
        http.Post("/", rpc);

        http.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            nlohmann::json body = {
                {"status", "ok"},
                {"server", server.Info().name},
                {"version", server.Info().version},
            };
            res.set_content(body.dump(), kJsonContentType);
        });

        http.set_logger([](const httplib::Request& req, const httplib::Response& res) {
            LogDebug("http", req.method + " " + req.path + " -> " +
                                 std::to_string(res.status));
        });
    }

    void HandleRpc(const httplib::Request& req, httplib::Response& res) const {
        nlohmann::json message;
        try {
            message = nlohmann::json::parse(req.body);
        } catch (const nlohmann::json::parse_error& e) {
            LogWarn("http", std::string("Parse error: ") + e.what());
            res.status = 400;
            res.set_content(
                DumpWire(McpResponse::Failure(nullptr, rpc_error::kParseError,
                                              "Parse error")
                             .ToJson()),
                kJsonContentType);
            return;
        }

        auto response = server.HandleMessage(message);
        if (!response) {
            res.status = 204;
            return;
        }
        res.set_content(DumpWire(*response), kJsonContentType);
    }
};

HttpTransport::HttpTransport(const McpServer& server)
    : impl_(std::make_unique<Impl>(server)) {}

HttpTransport::~HttpTransport() {
    Stop();
}

bool HttpTransport::Listen(const std::string& host, int port) {
    LogInfo("http", "Serving MCP on http://" + host + ":" + std::to_string(port));
    if (!impl_->http.listen(host, port)) {
        LogError("http", "Cannot bind " + host + ":" + std::to_string(port));
        return false;
    }
    return true;
}

int HttpTransport::BindToAnyPort(const std::string& host) {
    return impl_->http.bind_to_any_port(host);
}

bool HttpTransport::ListenAfterBind() {
    return impl_->http.listen_after_bind();
}

void HttpTransport::WaitUntilReady() const {
    impl_->http.wait_until_ready();
}

void HttpTransport::Stop() {
    if (impl_->http.is_running()) {
        impl_->http.stop();
    }
}

} // namespace archive_mcp
