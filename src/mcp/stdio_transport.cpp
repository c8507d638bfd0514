#include <archive_mcp/mcp/stdio_transport.hpp>

#include <archive_mcp/core/log.hpp>

#include <algorithm>
#include <chrono>
#include <future>
#include <vector>

namespace archive_mcp {

namespace {

bool IsBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    });
}

bool IsReady(const std::future<void>& f) {
    return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

} // anonymous namespace

StdioTransport::StdioTransport(const McpServer& server,
                               std::istream& in,
                               std::ostream& out)
    : server_(server), in_(in), out_(out) {}

void StdioTransport::Run() {
    LogInfo("stdio", "Serving MCP on stdin/stdout");

    std::vector<std::future<void>> in_flight;
    std::string line;
    while (std::getline(in_, line)) {
        if (IsBlank(line)) continue;

        in_flight.push_back(std::async(std::launch::async,
                                       [this, line] { HandleLine(line); }));

        // Reap finished requests so the list stays bounded by concurrency.
        auto done = std::stable_partition(in_flight.begin(), in_flight.end(),
                                          [](const std::future<void>& f) {
                                              return !IsReady(f);
                                          });
        for (auto it = done; it != in_flight.end(); ++it) {
            it->get();
        }
        in_flight.erase(done, in_flight.end());
    }

    for (auto& f : in_flight) {
        f.get();
    }
    LogInfo("stdio", "Input closed, shutting down");
}

void StdioTransport::HandleLine(const std::string& line) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        LogWarn("stdio", std::string("Parse error: ") + e.what());
        Write(McpResponse::Failure(nullptr, rpc_error::kParseError, "Parse error")
                  .ToJson());
        return;
    }

    auto response = server_.HandleMessage(message);
    if (response) {
        Write(*response);
    }
}

void StdioTransport::Write(const nlohmann::json& message) {
    auto text = DumpWire(message);
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ << text << "\n";
    out_.flush();
}

} // namespace archive_mcp
