#include <archive_mcp/mcp/resource_registry.hpp>

#include <archive_mcp/mcp/mcp_types.hpp>

#include <utility>

namespace archive_mcp {

void ResourceRegistry::Register(const std::string& uri,
                                const std::string& name,
                                const std::string& description,
                                ResourceHandler handler,
                                const std::string& mime_type) {
    RegisterAsync(uri, name, description,
                  [handler = std::move(handler)]() { return MakeReadyFuture(handler()); },
                  mime_type);
}

void ResourceRegistry::RegisterAsync(const std::string& uri,
                                     const std::string& name,
                                     const std::string& description,
                                     AsyncResourceHandler handler,
                                     const std::string& mime_type) {
    Entry entry{{uri, name, description, mime_type}, std::move(handler)};

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = positions_.find(uri);
    if (it != positions_.end()) {
        entries_[it->second] = std::move(entry);
        return;
    }
    positions_.emplace(uri, entries_.size());
    entries_.push_back(std::move(entry));
}

std::vector<ResourceDescriptor> ResourceRegistry::Resources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ResourceDescriptor> out;
    out.reserve(entries_.size());
    for (const auto& e : entries_) {
        out.push_back(e.descriptor);
    }
    return out;
}

bool ResourceRegistry::HasResource(const std::string& uri) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return positions_.count(uri) > 0;
}

std::size_t ResourceRegistry::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

ResourceRead ResourceRegistry::Read(const std::string& uri) const {
    Entry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(uri);
        if (it == positions_.end()) {
            throw NotFoundError("Resource not found: " + uri);
        }
        entry = entries_[it->second];
    }
    return {std::move(entry.descriptor), entry.handler()};
}

} // namespace archive_mcp
