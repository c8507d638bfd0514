#pragma once

#include <archive_mcp/mcp/mcp_server.hpp>

#include <iostream>
#include <mutex>
#include <string>

#include <nlohmann/json.hpp>

namespace archive_mcp {

// ---------------------------------------------------------------------------
// StdioTransport — newline-delimited JSON-RPC over a pair of streams.
//
// Each non-empty input line is dispatched on its own task so a slow tool
// does not block later requests; responses are written one per line in
// completion order. Run() returns after EOF once every in-flight request has
// been answered. Nothing but protocol messages is written to `out`.
// ---------------------------------------------------------------------------
class StdioTransport {
public:
    explicit StdioTransport(const McpServer& server,
                            std::istream& in = std::cin,
                            std::ostream& out = std::cout);

    // Blocks until EOF on the input stream.
    void Run();

    // Handle one raw line synchronously. Malformed JSON answers -32700.
    void HandleLine(const std::string& line);

private:
    void Write(const nlohmann::json& message);

    const McpServer& server_;
    std::istream& in_;
    std::ostream& out_;
    std::mutex out_mutex_;
};

} // namespace archive_mcp
