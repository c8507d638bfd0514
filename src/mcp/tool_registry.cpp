#include <archive_mcp/mcp/tool_registry.hpp>

#include <archive_mcp/mcp/mcp_types.hpp>

#include <utility>

namespace archive_mcp {

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    RegisterAsync(name, description, input_schema,
                  [handler = std::move(handler)](const nlohmann::json& arguments) {
                      return MakeReadyFuture(handler(arguments));
                  });
}

void ToolRegistry::RegisterAsync(const std::string& name,
                                 const std::string& description,
                                 const nlohmann::json& input_schema,
                                 AsyncToolHandler handler) {
    Entry entry{{name, description, input_schema}, std::move(handler)};

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(name);
    if (it != positions_.end()) {
        entries_[it->second] = std::move(entry);
        return;
    }
    positions_.emplace(name, entries_.size());
    entries_.push_back(std::move(entry));
}

std::vector<ToolDescriptor> ToolRegistry::Tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ToolDescriptor> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) {
        out.push_back(e.descriptor);
    }
    return out;
}

bool ToolRegistry::HasTool(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.count(name) > 0;
}

std::size_t ToolRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::future<ToolResult> ToolRegistry::Invoke(const std::string& name,
                                             const nlohmann::json& arguments) const {
    AsyncToolHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(name);
        if (it == positions_.end()) {
            throw NotFoundError("Tool not found: " + name);
        }
        handler = entries_[it->second].handler;
    }
    return handler(arguments);
}

} // namespace archive_mcp
