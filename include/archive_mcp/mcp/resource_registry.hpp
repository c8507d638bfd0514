#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace archive_mcp {

struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type = "text/plain";
};

using ResourceHandler = std::function<std::string()>;
using AsyncResourceHandler = std::function<std::future<std::string>()>;

// A pending read: the descriptor as registered plus the handler's result.
struct ResourceRead {
    ResourceDescriptor descriptor;
    std::future<std::string> content;
};

// ---------------------------------------------------------------------------
// ResourceRegistry — URI -> (descriptor, handler). Same replacement and
// ordering rules as ToolRegistry.
// ---------------------------------------------------------------------------
class ResourceRegistry {
public:
    void Register(const std::string& uri,
                  const std::string& name,
                  const std::string& description,
                  ResourceHandler handler,
                  const std::string& mime_type = "text/plain");

    void RegisterAsync(const std::string& uri,
                       const std::string& name,
                       const std::string& description,
                       AsyncResourceHandler handler,
                       const std::string& mime_type = "text/plain");

    [[nodiscard]] std::vector<ResourceDescriptor> Resources() const;
    [[nodiscard]] bool HasResource(const std::string& uri) const;
    [[nodiscard]] std::size_t Size() const;

    // Throws NotFoundError for an unregistered URI.
    [[nodiscard]] ResourceRead Read(const std::string& uri) const;

private:
    struct Entry {
        ResourceDescriptor descriptor;
        AsyncResourceHandler handler;
    };

    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
    std::map<std::string, std::size_t> positions_;
};

} // namespace archive_mcp
