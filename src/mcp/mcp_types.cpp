#include <archive_mcp/mcp/mcp_types.hpp>

namespace archive_mcp {

nlohmann::json McpResponse::ToJson() const {
    nlohmann::json j = {
        {"jsonrpc", "2.0"},
        {"id", id},
    };
    if (outcome.IsOk()) {
        j["result"] = outcome.Value();
    } else {
        j["error"] = {
            {"code", outcome.Error().code},
            {"message", outcome.Error().message},
        };
    }
    return j;
}

std::string DumpWire(const nlohmann::json& j, int indent) {
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace archive_mcp
