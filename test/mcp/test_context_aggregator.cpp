#include <catch2/catch_test_macros.hpp>

#include <archive_mcp/mcp/context_aggregator.hpp>

#include <future>
#include <stdexcept>
#include <string>
#include <vector>

using namespace archive_mcp;

TEST_CASE("ContextAggregator: no providers yields empty object", "[mcp][context]") {
    ContextAggregator context;
    auto merged = context.Collect(nlohmann::json::object());
    CHECK(merged.is_object());
    CHECK(merged.empty());
}

TEST_CASE("ContextAggregator: later providers win on key collision", "[mcp][context]") {
    ContextAggregator context;
    context.Register([](const nlohmann::json&) {
        return nlohmann::json{{"a", 1}, {"shared", "first"}};
    });
    context.Register([](const nlohmann::json&) {
        return nlohmann::json{{"b", 2}, {"shared", "second"}};
    });

    auto merged = context.Collect(nlohmann::json::object());
    CHECK(merged == nlohmann::json{{"a", 1}, {"b", 2}, {"shared", "second"}});
    CHECK(context.Size() == 2);
}

TEST_CASE("ContextAggregator: providers see the request params", "[mcp][context]") {
    ContextAggregator context;
    context.Register([](const nlohmann::json& params) {
        return nlohmann::json{{"echo", params.value("topic", "")}};
    });

    auto merged = context.Collect({{"topic", "letters"}});
    CHECK(merged["echo"] == "letters");
}

TEST_CASE("ContextAggregator: invokes providers in registration order", "[mcp][context]") {
    ContextAggregator context;
    std::vector<int> calls;
    for (int i = 0; i < 3; ++i) {
        context.Register([&calls, i](const nlohmann::json&) {
            calls.push_back(i);
            return nlohmann::json::object();
        });
    }

    (void)context.Collect(nlohmann::json::object());
    CHECK(calls == std::vector<int>{0, 1, 2});
}

TEST_CASE("ContextAggregator: async providers merge in registration order",
          "[mcp][context]") {
    ContextAggregator context;
    context.RegisterAsync([](const nlohmann::json&) {
        return std::async(std::launch::async, [] {
            return nlohmann::json{{"k", "async"}};
        });
    });
    context.Register([](const nlohmann::json&) {
        return nlohmann::json{{"k", "sync"}};
    });

    CHECK(context.Collect(nlohmann::json::object())["k"] == "sync");
}

TEST_CASE("ContextAggregator: non-object result is an error", "[mcp][context]") {
    ContextAggregator context;
    context.Register([](const nlohmann::json&) { return nlohmann::json::array({1}); });

    CHECK_THROWS_AS(context.Collect(nlohmann::json::object()), std::runtime_error);
}

TEST_CASE("ContextAggregator: provider exceptions propagate", "[mcp][context]") {
    ContextAggregator context;
    context.Register([](const nlohmann::json&) -> nlohmann::json {
        throw std::logic_error("context unavailable");
    });

    CHECK_THROWS_AS(context.Collect(nlohmann::json::object()), std::logic_error);
}

TEST_CASE("ContextAggregator: provider returning no future throws", "[mcp][context]") {
    ContextAggregator context;
    context.RegisterAsync([](const nlohmann::json&) {
        return std::future<nlohmann::json>{};
    });

    CHECK_THROWS_AS(context.Collect(nlohmann::json::object()), std::runtime_error);
}
