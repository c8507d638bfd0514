#include <catch2/catch_test_macros.hpp>

#include <archive_mcp/mcp/mcp_types.hpp>
#include <archive_mcp/mcp/resource_registry.hpp>

#include <future>
#include <stdexcept>
#include <string>

using namespace archive_mcp;

TEST_CASE("ResourceRegistry: register and list resources", "[mcp][resources]") {
    ResourceRegistry registry;
    registry.Register("archive://index", "Archive Index", "All documents",
                      [] { return std::string("index body"); });
    registry.Register("archive://documents/a.html", "Document: a.html", "Page",
                      [] { return std::string("<p>a</p>"); }, "text/html");

    auto resources = registry.Resources();
    REQUIRE(resources.size() == 2);
    CHECK(resources[0].uri == "archive://index");
    CHECK(resources[0].mime_type == "text/plain");
    CHECK(resources[1].name == "Document: a.html");
    CHECK(resources[1].mime_type == "text/html");
    CHECK(registry.HasResource("archive://index"));
    CHECK_FALSE(registry.HasResource("archive://nothing"));
}

TEST_CASE("ResourceRegistry: Read returns descriptor and content", "[mcp][resources]") {
    ResourceRegistry registry;
    registry.Register("archive://documents/a.md", "Document: a.md", "Notes",
                      [] { return std::string("# Notes"); }, "text/markdown");

    auto read = registry.Read("archive://documents/a.md");
    CHECK(read.descriptor.mime_type == "text/markdown");
    CHECK(read.content.get() == "# Notes");
}

TEST_CASE("ResourceRegistry: async handler", "[mcp][resources]") {
    ResourceRegistry registry;
    registry.RegisterAsync("archive://slow", "Slow", "Computed elsewhere", [] {
        return std::async(std::launch::async, [] { return std::string("done"); });
    });

    CHECK(registry.Read("archive://slow").content.get() == "done");
}

TEST_CASE("ResourceRegistry: unknown URI throws NotFoundError", "[mcp][resources]") {
    ResourceRegistry registry;
    try {
        (void)registry.Read("archive://missing");
        FAIL("expected NotFoundError");
    } catch (const NotFoundError& e) {
        CHECK(std::string(e.what()) == "Resource not found: archive://missing");
    }
}

TEST_CASE("ResourceRegistry: re-registering replaces in place", "[mcp][resources]") {
    ResourceRegistry registry;
    registry.Register("r://1", "one", "", [] { return std::string("v1"); });
    registry.Register("r://2", "two", "", [] { return std::string("x"); });
    registry.Register("r://1", "one again", "", [] { return std::string("v2"); });

    auto resources = registry.Resources();
    REQUIRE(resources.size() == 2);
    CHECK(resources[0].uri == "r://1");
    CHECK(resources[0].name == "one again");
    CHECK(registry.Read("r://1").content.get() == "v2");
    CHECK(registry.Size() == 2);
}
