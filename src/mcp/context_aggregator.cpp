#include <archive_mcp/mcp/context_aggregator.hpp>

#include <archive_mcp/mcp/mcp_types.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace archive_mcp {

void ContextAggregator::Register(ContextProvider provider) {
    RegisterAsync([provider = std::move(provider)](const nlohmann::json& params) {
        return MakeReadyFuture(provider(params));
    });
}

void ContextAggregator::RegisterAsync(AsyncContextProvider provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_.push_back(std::move(provider));
}

std::size_t ContextAggregator::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.size();
}

nlohmann::json ContextAggregator::Collect(const nlohmann::json& params) const {
    std::vector<AsyncContextProvider> providers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        providers = providers_;
    }

    std::vector<std::future<nlohmann::json>> pending;
    pending.reserve(providers.size());
    for (const auto& provider : providers) {
        pending.push_back(provider(params));
    }

    auto merged = nlohmann::json::object();
    for (std::size_t i = 0; i < pending.size(); ++i) {
        if (!pending[i].valid()) {
            throw std::runtime_error("Context provider " + std::to_string(i) +
                                     " returned no result");
        }
        auto part = pending[i].get();
        if (!part.is_object()) {
            throw std::runtime_error("Context provider " + std::to_string(i) +
                                     " returned " + part.type_name() +
                                     ", expected object");
        }
        merged.update(part);
    }
    return merged;
}

} // namespace archive_mcp
