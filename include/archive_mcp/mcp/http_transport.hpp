#pragma once

#include <archive_mcp/mcp/mcp_server.hpp>

#include <memory>
#include <string>

namespace archive_mcp {

// ---------------------------------------------------------------------------
// HttpTransport — JSON-RPC over HTTP using cpp-httplib.
//
// Routes:
//   POST /mcp, POST /   one JSON-RPC message per request body; 204 for
//                       notifications
//   GET  /health        {"status":"ok","server":...,"version":...}
//
// Uses pimpl to keep httplib out of the public header.
// ---------------------------------------------------------------------------
class HttpTransport {
public:
    explicit HttpTransport(const McpServer& server);
    ~HttpTransport();

    HttpTransport(const HttpTransport&) = delete;
    HttpTransport& operator=(const HttpTransport&) = delete;

    // Bind and serve until Stop(). Returns false if the address cannot be bound.
    [[nodiscard]] bool Listen(const std::string& host, int port);

    // Two-step variant: bind an OS-chosen port, then serve on it.
    // BindToAnyPort returns the port, or -1 on failure.
    [[nodiscard]] int BindToAnyPort(const std::string& host);
    [[nodiscard]] bool ListenAfterBind();

    void WaitUntilReady() const;
    void Stop();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace archive_mcp
