#pragma once

#include <archive_mcp/core/result.hpp>

#include <future>
#include <stdexcept>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace archive_mcp {

// JSON-RPC 2.0 error codes used on the wire.
namespace rpc_error {
constexpr int kParseError     = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInternalError  = -32603;
} // namespace rpc_error

struct RpcError {
    int code = rpc_error::kInternalError;
    std::string message;
};

// ---------------------------------------------------------------------------
// McpRequest — a decoded request. id is echoed verbatim (null if absent).
// ---------------------------------------------------------------------------
struct McpRequest {
    std::string method;
    nlohmann::json params = nlohmann::json::object();
    nlohmann::json id = nullptr;
};

// ---------------------------------------------------------------------------
// McpResponse — the correlation id plus exactly one of result / error.
// ---------------------------------------------------------------------------
struct McpResponse {
    nlohmann::json id;
    Result<nlohmann::json, RpcError> outcome;

    static McpResponse Success(nlohmann::json id, nlohmann::json result) {
        return {std::move(id), Result<nlohmann::json, RpcError>::Ok(std::move(result))};
    }

    static McpResponse Failure(nlohmann::json id, int code, std::string message) {
        return {std::move(id),
                Result<nlohmann::json, RpcError>::Err(RpcError{code, std::move(message)})};
    }

    [[nodiscard]] bool IsError() const noexcept { return outcome.IsErr(); }

    // {"jsonrpc":"2.0","id":...,"result":...} or {..., "error":{code,message}}
    [[nodiscard]] nlohmann::json ToJson() const;
};

// Thrown by the registries when a name or URI is not registered. The
// dispatcher reports it as an internal error like any other handler failure.
class NotFoundError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Wrap an already computed value in the future-returning handler convention.
template <typename T>
std::future<T> MakeReadyFuture(T value) {
    std::promise<T> promise;
    promise.set_value(std::move(value));
    return promise.get_future();
}

// Serialize for the wire; invalid UTF-8 in document text is replaced rather
// than failing the whole response.
std::string DumpWire(const nlohmann::json& j, int indent = -1);

} // namespace archive_mcp
