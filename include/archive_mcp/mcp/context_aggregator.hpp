#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <mutex>
#include <vector>

#include <nlohmann/json.hpp>

namespace archive_mcp {

// A provider returns a JSON object that is merged into the context/get result.
using ContextProvider = std::function<nlohmann::json(const nlohmann::json& params)>;
using AsyncContextProvider =
    std::function<std::future<nlohmann::json>(const nlohmann::json& params)>;

// ---------------------------------------------------------------------------
// ContextAggregator — ordered list of context providers.
//
// Collect() starts every provider in registration order, then merges their
// objects in that same order; on a key collision the later provider wins.
// ---------------------------------------------------------------------------
class ContextAggregator {
public:
    void Register(ContextProvider provider);
    void RegisterAsync(AsyncContextProvider provider);

    [[nodiscard]] std::size_t Size() const;

    // Throws std::runtime_error when a provider yields something other than
    // an object; provider exceptions propagate.
    [[nodiscard]] nlohmann::json Collect(const nlohmann::json& params) const;

private:
    mutable std::mutex mutex_;
    std::vector<AsyncContextProvider> providers_;
};

} // namespace archive_mcp
