#include <catch2/catch_test_macros.hpp>

#include <mcp_fleet/catalog/tool_catalog.hpp>

#include <map>
#include <string>
#include <vector>

using namespace mcp_fleet;

namespace {

// Scripted backend: method -> list of results, consumed per call.
struct ScriptedBackend {
    std::map<std::string, std::vector<Result<nlohmann::json, Error>>> replies;
    std::vector<std::pair<std::string, nlohmann::json>> calls;

    RequestFn Fn() {
        return [this](const std::string& method, const nlohmann::json& params) {
            calls.emplace_back(method, params);
            auto& queue = replies[method];
            if (queue.empty()) {
                return Result<nlohmann::json, Error>::Err(Error::Make(
                    ErrorCategory::BackendError, method, "test", "Method not found (code -32601)"));
            }
            auto next = queue.front();
            queue.erase(queue.begin());
            return next;
        };
    }
};

nlohmann::json Tool(const std::string& name, const std::string& description = "") {
    return {{"name", name},
            {"description", description},
            {"inputSchema", {{"type", "object"}}}};
}

Result<nlohmann::json, Error> Ok(nlohmann::json value) {
    return Result<nlohmann::json, Error>::Ok(std::move(value));
}

} // anonymous namespace

TEST_CASE("ToolCatalog: Refresh registers qualified tools", "[catalog]") {
    ScriptedBackend backend;
    backend.replies["tools/list"] = {Ok({{"tools", {Tool("get_current_time", "Now"),
                                                     Tool("convert_time")}}})};
    ToolCatalog catalog;

    auto refreshed = catalog.Refresh("time", backend.Fn());
    REQUIRE(refreshed.IsOk());
    CHECK(refreshed.Value() == 2);
    CHECK(catalog.Size() == 2);

    auto entry = catalog.Resolve("time.get_current_time");
    REQUIRE(entry.IsOk());
    CHECK(entry.Value().backend == "time");
    CHECK(entry.Value().tool_name == "get_current_time");
    CHECK(entry.Value().description == "Now");

    auto j = entry.Value().ToJson();
    CHECK(j["name"] == "time.get_current_time");
    CHECK(j["actual_name"] == "get_current_time");
    CHECK(j["inputSchema"]["type"] == "object");
}

TEST_CASE("ToolCatalog: follows nextCursor pagination", "[catalog]") {
    ScriptedBackend backend;
    backend.replies["tools/list"] = {
        Ok({{"tools", {Tool("a")}}, {"nextCursor", "page2"}}),
        Ok({{"tools", {Tool("b")}}}),
    };
    ToolCatalog catalog(CatalogOptions{false, false});

    REQUIRE(catalog.Refresh("fs", backend.Fn()).Value() == 2);
    REQUIRE(backend.calls.size() == 2);
    CHECK(backend.calls[1].second["cursor"] == "page2");
}

TEST_CASE("ToolCatalog: failed tools/list keeps previous entries", "[catalog]") {
    ScriptedBackend backend;
    backend.replies["tools/list"] = {
        Ok({{"tools", {Tool("a")}}}),
        Result<nlohmann::json, Error>::Err(
            Error::Make(ErrorCategory::ResponseTimeout, "tools/list", "fs", "timed out")),
    };
    ToolCatalog catalog;
    REQUIRE(catalog.Refresh("fs", backend.Fn()).IsOk());

    auto second = catalog.Refresh("fs", backend.Fn());
    REQUIRE(second.IsErr());
    CHECK(second.Error().category == ErrorCategory::ResponseTimeout);
    CHECK(catalog.Resolve("fs.a").IsOk());
}

TEST_CASE("ToolCatalog: refresh replaces only that backend's tools", "[catalog]") {
    ScriptedBackend time;
    time.replies["tools/list"] = {Ok({{"tools", {Tool("now")}}}),
                                  Ok({{"tools", {Tool("later")}}})};
    ScriptedBackend fs;
    fs.replies["tools/list"] = {Ok({{"tools", {Tool("read")}}})};

    ToolCatalog catalog;
    REQUIRE(catalog.Refresh("time", time.Fn()).IsOk());
    REQUIRE(catalog.Refresh("fs", fs.Fn()).IsOk());
    REQUIRE(catalog.Refresh("time", time.Fn()).IsOk());

    CHECK(catalog.Resolve("time.now").IsErr());
    CHECK(catalog.Resolve("time.later").IsOk());
    CHECK(catalog.Resolve("fs.read").IsOk());
    CHECK(catalog.Backends() == std::vector<std::string>{"fs", "time"});
}

TEST_CASE("ToolCatalog: tools without a name are skipped", "[catalog]") {
    ScriptedBackend backend;
    backend.replies["tools/list"] = {Ok({{"tools", {Tool("ok"), {{"description", "nameless"}}, 5}}})};
    ToolCatalog catalog;
    CHECK(catalog.Refresh("x", backend.Fn()).Value() == 1);
}

TEST_CASE("ToolCatalog: non-object tools/list result is a protocol error", "[catalog]") {
    ScriptedBackend backend;
    backend.replies["tools/list"] = {Ok(nlohmann::json::array())};
    ToolCatalog catalog;
    auto r = catalog.Refresh("x", backend.Fn());
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::ProtocolParseError);
}

TEST_CASE("ToolCatalog: resources and prompts are optional", "[catalog]") {
    ScriptedBackend backend;
    backend.replies["tools/list"] = {Ok({{"tools", {Tool("a")}}})};
    backend.replies["resources/list"] = {Ok({{"resources", {{{"uri", "file:///tmp/x"},
                                                             {"name", "x"},
                                                             {"mimeType", "text/plain"}}}}})};
    // prompts/list unanswered: the scripted backend returns an error.
    ToolCatalog catalog;

    REQUIRE(catalog.Refresh("fs", backend.Fn()).IsOk());
    auto resources = catalog.Resources();
    REQUIRE(resources.size() == 1);
    CHECK(resources[0].backend == "fs");
    CHECK(resources[0].uri == "file:///tmp/x");
    CHECK(resources[0].mime_type == "text/plain");
    CHECK(catalog.Prompts().empty());
}

TEST_CASE("ToolCatalog: Resolve suggests similar tools", "[catalog]") {
    ScriptedBackend backend;
    backend.replies["tools/list"] = {Ok({{"tools", {Tool("get_current_time"), Tool("convert_time"),
                                                     Tool("time_zone"), Tool("time_diff")}}})};
    ToolCatalog catalog;
    REQUIRE(catalog.Refresh("time", backend.Fn()).IsOk());

    auto r = catalog.Resolve("time.TIME");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::ToolNotFound);
    CHECK(r.Error().backend == "time");
    CHECK(r.Error().message.find("Similar tools: ") != std::string::npos);
    CHECK(catalog.Suggest("time.TIME").size() == ToolCatalog::kMaxSuggestions);

    auto none = catalog.Resolve("weather.forecast");
    REQUIRE(none.IsErr());
    CHECK(none.Error().message == "tool 'weather.forecast' not found");
}

TEST_CASE("ToolCatalog: Invalidate drops a backend", "[catalog]") {
    ScriptedBackend backend;
    backend.replies["tools/list"] = {Ok({{"tools", {Tool("a"), Tool("b")}}})};
    ToolCatalog catalog;
    REQUIRE(catalog.Refresh("fs", backend.Fn()).IsOk());

    catalog.Invalidate("fs");
    CHECK(catalog.Size() == 0);
    CHECK(catalog.ToolsFor("fs").empty());
}
