#include <archive_mcp/mcp/mcp_server.hpp>

#include <archive_mcp/core/log.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace archive_mcp {

namespace {

constexpr std::string_view kNotificationPrefix = "notifications/";

std::string RequireStringParam(const nlohmann::json& params, const char* key) {
    if (!params.contains(key) || !params[key].is_string()) {
        throw std::invalid_argument(std::string("Missing '") + key + "' parameter");
    }
    return params[key].get<std::string>();
}

template <typename T>
T Await(std::future<T> future, const std::string& what) {
    if (!future.valid()) {
        throw std::runtime_error(what + " handler returned no result");
    }
    return future.get();
}

McpResponse InvalidRequest(nlohmann::json id, const std::string& detail) {
    return McpResponse::Failure(std::move(id), rpc_error::kInvalidRequest,
                                "Invalid Request: " + detail);
}

} // anonymous namespace

std::optional<MethodCategory> RouteMethod(std::string_view method) {
    if (method == "initialize") return MethodCategory::Initialize;
    if (method == "tools/list") return MethodCategory::ToolsList;
    if (method == "tools/call") return MethodCategory::ToolsCall;
    if (method == "resources/list") return MethodCategory::ResourcesList;
    if (method == "resources/read") return MethodCategory::ResourcesRead;
    if (method == "context/get") return MethodCategory::ContextGet;
    return std::nullopt;
}

McpServer::McpServer(ServerInfo info) : info_(std::move(info)) {}

McpResponse McpServer::Dispatch(const McpRequest& request) const {
    auto category = RouteMethod(request.method);
    if (!category) {
        LogDebug("mcp", "Unknown method: " + request.method);
        return McpResponse::Failure(request.id, rpc_error::kMethodNotFound,
                                    "Method not found: " + request.method);
    }

    const auto& params = request.params.is_null() ? nlohmann::json::object()
                                                  : request.params;
    try {
        nlohmann::json result;
        switch (*category) {
            case MethodCategory::Initialize:    result = HandleInitialize(params); break;
            case MethodCategory::ToolsList:     result = HandleToolsList(); break;
            case MethodCategory::ToolsCall:     result = HandleToolsCall(params); break;
            case MethodCategory::ResourcesList: result = HandleResourcesList(); break;
            case MethodCategory::ResourcesRead: result = HandleResourcesRead(params); break;
            case MethodCategory::ContextGet:    result = HandleContextGet(params); break;
        }
        return McpResponse::Success(request.id, std::move(result));
    } catch (const std::exception& e) {
        LogWarn("mcp", request.method + " failed: " + e.what());
        return McpResponse::Failure(request.id, rpc_error::kInternalError,
                                    std::string("Internal error: ") + e.what());
    } catch (...) {
        LogError("mcp", request.method + " failed with a non-standard exception");
        return McpResponse::Failure(request.id, rpc_error::kInternalError,
                                    "Internal error: unknown exception");
    }
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) const {
    if (!message.is_object()) {
        return InvalidRequest(nullptr, "expected a JSON object").ToJson();
    }

    const bool has_id = message.contains("id");
    nlohmann::json id = has_id ? message["id"] : nlohmann::json(nullptr);

    if (message.contains("jsonrpc") && message["jsonrpc"] != "2.0") {
        return InvalidRequest(id, "unsupported JSON-RPC version").ToJson();
    }
    if (!message.contains("method") || !message["method"].is_string()) {
        return InvalidRequest(id, "missing method").ToJson();
    }

    McpRequest request;
    request.method = message["method"].get<std::string>();
    request.id = std::move(id);

    if (!has_id && request.method.compare(0, kNotificationPrefix.size(),
                                          kNotificationPrefix) == 0) {
        LogDebug("mcp", "Notification: " + request.method);
        return std::nullopt;
    }

    if (message.contains("params") && !message["params"].is_null()) {
        if (!message["params"].is_object()) {
            return InvalidRequest(request.id, "params must be an object").ToJson();
        }
        request.params = message["params"];
    }

    return Dispatch(request).ToJson();
}

nlohmann::json McpServer::HandleInitialize(const nlohmann::json& params) const {
    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        LogInfo("mcp", "Client connected: " +
                           params["clientInfo"].value("name", std::string("unknown")));
    }

    auto enabled = nlohmann::json{{"enabled", true}};
    return {
        {"protocolVersion", kProtocolVersion},
        {"serverInfo", {
            {"name", info_.name},
            {"version", info_.version},
        }},
        {"capabilities", {
            {"tools", enabled},
            {"resources", enabled},
            {"context", enabled},
        }},
    };
}

nlohmann::json McpServer::HandleToolsList() const {
    auto tools = nlohmann::json::array();
    for (const auto& tool : tools_.Tools()) {
        tools.push_back({
            {"name", tool.name},
            {"description", tool.description},
            {"inputSchema", tool.input_schema},
        });
    }
    return {{"tools", tools}};
}

nlohmann::json McpServer::HandleToolsCall(const nlohmann::json& params) const {
    auto name = RequireStringParam(params, "name");
    auto arguments = params.value("arguments", nlohmann::json::object());
    if (arguments.is_null()) {
        arguments = nlohmann::json::object();
    }
    if (!arguments.is_object()) {
        throw std::invalid_argument("'arguments' must be an object");
    }

    LogDebug("mcp", "tools/call " + name);
    auto result = Await(tools_.Invoke(name, arguments), "Tool '" + name + "'");

    nlohmann::json out;
    out["content"] = result.content;
    if (result.is_error) {
        out["isError"] = true;
    }
    return out;
}

nlohmann::json McpServer::HandleResourcesList() const {
    auto resources = nlohmann::json::array();
    for (const auto& r : resources_.Resources()) {
        resources.push_back({
            {"uri", r.uri},
            {"name", r.name},
            {"description", r.description},
            {"mimeType", r.mime_type},
        });
    }
    return {{"resources", resources}};
}

nlohmann::json McpServer::HandleResourcesRead(const nlohmann::json& params) const {
    auto uri = RequireStringParam(params, "uri");

    LogDebug("mcp", "resources/read " + uri);
    auto read = resources_.Read(uri);
    auto text = Await(std::move(read.content), "Resource '" + uri + "'");

    return {
        {"contents", nlohmann::json::array({
            {
                {"uri", uri},
                {"mimeType", read.descriptor.mime_type},
                {"text", text},
            },
        })},
    };
}

nlohmann::json McpServer::HandleContextGet(const nlohmann::json& params) const {
    return context_.Collect(params);
}

} // namespace archive_mcp
