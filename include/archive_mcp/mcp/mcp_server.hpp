#pragma once

#include <archive_mcp/mcp/context_aggregator.hpp>
#include <archive_mcp/mcp/mcp_types.hpp>
#include <archive_mcp/mcp/resource_registry.hpp>
#include <archive_mcp/mcp/tool_registry.hpp>

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace archive_mcp {

constexpr const char* kProtocolVersion = "2024-11-05";

struct ServerInfo {
    std::string name;
    std::string version;
};

enum class MethodCategory {
    Initialize,
    ToolsList,
    ToolsCall,
    ResourcesList,
    ResourcesRead,
    ContextGet,
};

// Exact, case-sensitive match; nullopt for anything else.
[[nodiscard]] std::optional<MethodCategory> RouteMethod(std::string_view method);

// ---------------------------------------------------------------------------
// McpServer — MCP 2024-11-05 request dispatcher.
//
// Owns the tool, resource and context registries and maps each request onto
// them:
//   - initialize
//   - tools/list, tools/call
//   - resources/list, resources/read
//   - context/get
// Dispatch never throws: unknown methods become -32601, any failure inside
// a handler becomes -32603. Transports live elsewhere (stdio_transport,
// http_transport) and only call HandleMessage.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ServerInfo info);

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    [[nodiscard]] const ServerInfo& Info() const noexcept { return info_; }

    [[nodiscard]] ToolRegistry& Tools() noexcept { return tools_; }
    [[nodiscard]] const ToolRegistry& Tools() const noexcept { return tools_; }
    [[nodiscard]] ResourceRegistry& Resources() noexcept { return resources_; }
    [[nodiscard]] const ResourceRegistry& Resources() const noexcept { return resources_; }
    [[nodiscard]] ContextAggregator& Context() noexcept { return context_; }
    [[nodiscard]] const ContextAggregator& Context() const noexcept { return context_; }

    [[nodiscard]] McpResponse Dispatch(const McpRequest& request) const;

    // Decode one JSON-RPC message, dispatch it and encode the response.
    // Returns nullopt for notifications (no "id", method "notifications/...").
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message) const;

private:
    nlohmann::json HandleInitialize(const nlohmann::json& params) const;
    nlohmann::json HandleToolsList() const;
    nlohmann::json HandleToolsCall(const nlohmann::json& params) const;
    nlohmann::json HandleResourcesList() const;
    nlohmann::json HandleResourcesRead(const nlohmann::json& params) const;
    nlohmann::json HandleContextGet(const nlohmann::json& params) const;

    ServerInfo info_;
    ToolRegistry tools_;
    ResourceRegistry resources_;
    ContextAggregator context_;
};

} // namespace archive_mcp
