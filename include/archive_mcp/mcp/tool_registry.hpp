#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace archive_mcp {

// ---------------------------------------------------------------------------
// ToolDescriptor — what tools/list advertises for one tool.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ToolResult — result of executing a tool.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content = nlohmann::json::array();  // array of content blocks
};

using ToolHandler = std::function<ToolResult(const nlohmann::json& arguments)>;
using AsyncToolHandler =
    std::function<std::future<ToolResult>(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry — name -> (descriptor, handler).
//
// Registering an existing name replaces descriptor and handler but keeps the
// tool's position in Tools(). Safe to use from multiple threads.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& input_schema,
                  ToolHandler handler);

    void RegisterAsync(const std::string& name,
                       const std::string& description,
                       const nlohmann::json& input_schema,
                       AsyncToolHandler handler);

    // Registration order.
    [[nodiscard]] std::vector<ToolDescriptor> Tools() const;

    [[nodiscard]] bool HasTool(const std::string& name) const;
    [[nodiscard]] std::size_t Size() const;

    // Throws NotFoundError for an unregistered name. Exceptions raised by the
    // handler propagate, either directly or through the returned future.
    [[nodiscard]] std::future<ToolResult> Invoke(const std::string& name,
                                                 const nlohmann::json& arguments) const;

private:
    struct Entry {
        ToolDescriptor descriptor;
        AsyncToolHandler handler;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    std::map<std::string, std::size_t> positions_;
};

} // namespace archive_mcp
