#pragma once

#include <mcp_fleet/config/app_config.hpp>
#include <mcp_fleet/core/result.hpp>

#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_fleet {

struct ToolEntry {
    std::string qualified_name;   // "backend.tool"
    std::string backend;
    std::string tool_name;        // name the backend knows it by
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();

    [[nodiscard]] nlohmann::json ToJson() const;
};

struct ResourceEntry {
    std::string backend;
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type;
};

struct PromptEntry {
    std::string backend;
    std::string name;
    std::string description;
    nlohmann::json arguments = nlohmann::json::array();
};

// Issues one JSON-RPC request to a backend and returns its "result".
using RequestFn = std::function<Result<nlohmann::json, Error>(
    const std::string& method, const nlohmann::json& params)>;

// ---------------------------------------------------------------------------
// ToolCatalog: flat namespace of every tool the fleet offers, keyed by
// "backend.tool". Discovery goes through a RequestFn, so the catalog never
// talks to a process itself and never executes calls.
// ---------------------------------------------------------------------------
class ToolCatalog {
public:
    static constexpr size_t kMaxSuggestions = 3;
    static constexpr int kMaxPages = 100;

    explicit ToolCatalog(CatalogOptions options = {});

    ToolCatalog(const ToolCatalog&) = delete;
    ToolCatalog& operator=(const ToolCatalog&) = delete;

    /// Re-run discovery for one backend and replace its entries in one step.
    /// Follows nextCursor pagination. A failed tools/list leaves the previous
    /// entries untouched; failed resources/prompts listings are only logged.
    /// Returns the number of tools now registered for the backend.
    [[nodiscard]] Result<size_t, Error> Refresh(const std::string& backend,
                                                const RequestFn& request);

    void Invalidate(const std::string& backend);

    /// ToolNotFound (with up to three similar names) when unknown.
    [[nodiscard]] Result<ToolEntry, Error> Resolve(const std::string& qualified_name) const;

    [[nodiscard]] std::vector<ToolEntry> Tools() const;
    [[nodiscard]] std::vector<ToolEntry> ToolsFor(const std::string& backend) const;
    [[nodiscard]] std::vector<ResourceEntry> Resources() const;
    [[nodiscard]] std::vector<PromptEntry> Prompts() const;
    [[nodiscard]] std::vector<std::string> Backends() const;
    [[nodiscard]] size_t Size() const;

    /// Qualified names containing the query (or its tool part),
    /// case-insensitive, sorted.
    [[nodiscard]] std::vector<std::string> Suggest(const std::string& query,
                                                   size_t limit = kMaxSuggestions) const;

private:
    CatalogOptions options_;

    mutable std::mutex mutex_;
    std::map<std::string, ToolEntry> tools_;   // qualified name -> entry
    std::map<std::string, std::vector<ResourceEntry>> resources_;
    std::map<std::string, std::vector<PromptEntry>> prompts_;
};

} // namespace mcp_fleet
