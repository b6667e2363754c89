#include <mcp_fleet/catalog/tool_catalog.hpp>

#include <mcp_fleet/core/log.hpp>
#include <mcp_fleet/core/types.hpp>

#include <algorithm>
#include <cctype>
#include <iterator>
#include <optional>
#include <set>

namespace mcp_fleet {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string StringField(const nlohmann::json& obj, const char* key) {
    auto it = obj.find(key);
    if (it != obj.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "";
}

// Collect every element of result[field] across nextCursor pages.
Result<std::vector<nlohmann::json>, Error> ListPaged(const RequestFn& request,
                                                     const std::string& method,
                                                     const char* field,
                                                     const std::string& backend) {
    std::vector<nlohmann::json> items;
    std::optional<std::string> cursor;
    for (int page = 0; page < ToolCatalog::kMaxPages; ++page) {
        nlohmann::json params = nlohmann::json::object();
        if (cursor) {
            params["cursor"] = *cursor;
        }
        auto result = request(method, params);
        if (result.IsErr()) {
            return Result<std::vector<nlohmann::json>, Error>::Err(result.Error());
        }
        const auto& body = result.Value();
        if (!body.is_object()) {
            return Result<std::vector<nlohmann::json>, Error>::Err(Error::Make(
                ErrorCategory::ProtocolParseError, method, backend,
                "result is not an object"));
        }
        auto list = body.find(field);
        if (list != body.end() && list->is_array()) {
            for (const auto& item : *list) {
                items.push_back(item);
            }
        }
        auto next = body.find("nextCursor");
        if (next == body.end() || !next->is_string() || next->get<std::string>().empty()) {
            return Result<std::vector<nlohmann::json>, Error>::Ok(std::move(items));
        }
        cursor = next->get<std::string>();
    }
    LogWarn("catalog", backend + ": " + method + " exceeded " +
                           std::to_string(ToolCatalog::kMaxPages) + " pages, truncating");
    return Result<std::vector<nlohmann::json>, Error>::Ok(std::move(items));
}

} // anonymous namespace

nlohmann::json ToolEntry::ToJson() const {
    return {
        {"name", qualified_name},
        {"description", description},
        {"backend", backend},
        {"actual_name", tool_name},
        {"inputSchema", input_schema},
    };
}

ToolCatalog::ToolCatalog(CatalogOptions options) : options_(options) {}

Result<size_t, Error> ToolCatalog::Refresh(const std::string& backend,
                                           const RequestFn& request) {
    auto listed = ListPaged(request, "tools/list", "tools", backend);
    if (listed.IsErr()) {
        LogWarn("catalog", backend + ": tools/list failed: " + listed.Error().message);
        return Result<size_t, Error>::Err(listed.Error());
    }

    std::map<std::string, ToolEntry> fresh;
    for (const auto& tool : listed.Value()) {
        if (!tool.is_object()) {
            continue;
        }
        std::string name = StringField(tool, "name");
        if (name.empty()) {
            LogWarn("catalog", backend + ": skipping tool without a name");
            continue;
        }
        ToolEntry entry;
        entry.backend = backend;
        entry.tool_name = name;
        entry.qualified_name = QualifiedToolName::Join(backend, name).ToString();
        entry.description = StringField(tool, "description");
        auto schema = tool.find("inputSchema");
        if (schema != tool.end() && schema->is_object()) {
            entry.input_schema = *schema;
        }
        if (fresh.count(entry.qualified_name) != 0) {
            LogWarn("catalog", backend + ": duplicate tool " + name + ", keeping the last one");
        }
        fresh[entry.qualified_name] = std::move(entry);
    }

    std::vector<ResourceEntry> resources;
    if (options_.discover_resources) {
        auto listed_resources = ListPaged(request, "resources/list", "resources", backend);
        if (listed_resources.IsErr()) {
            LogDebug("catalog", backend + ": resources/list unavailable: " +
                                    listed_resources.Error().message);
        } else {
            for (const auto& r : listed_resources.Value()) {
                if (!r.is_object()) {
                    continue;
                }
                resources.push_back(ResourceEntry{backend, StringField(r, "uri"),
                                                  StringField(r, "name"),
                                                  StringField(r, "description"),
                                                  StringField(r, "mimeType")});
            }
        }
    }

    std::vector<PromptEntry> prompts;
    if (options_.discover_prompts) {
        auto listed_prompts = ListPaged(request, "prompts/list", "prompts", backend);
        if (listed_prompts.IsErr()) {
            LogDebug("catalog", backend + ": prompts/list unavailable: " +
                                    listed_prompts.Error().message);
        } else {
            for (const auto& p : listed_prompts.Value()) {
                if (!p.is_object()) {
                    continue;
                }
                PromptEntry entry{backend, StringField(p, "name"),
                                  StringField(p, "description"), nlohmann::json::array()};
                auto args = p.find("arguments");
                if (args != p.end() && args->is_array()) {
                    entry.arguments = *args;
                }
                prompts.push_back(std::move(entry));
            }
        }
    }

    size_t count = fresh.size();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = tools_.begin(); it != tools_.end();) {
            if (it->second.backend == backend) {
                it = tools_.erase(it);
            } else {
                ++it;
            }
        }
        tools_.insert(std::make_move_iterator(fresh.begin()),
                      std::make_move_iterator(fresh.end()));
        resources_[backend] = std::move(resources);
        prompts_[backend] = std::move(prompts);
    }
    LogInfo("catalog", backend + ": " + std::to_string(count) + " tools");
    return Result<size_t, Error>::Ok(count);
}

void ToolCatalog::Invalidate(const std::string& backend) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = tools_.begin(); it != tools_.end();) {
        if (it->second.backend == backend) {
            it = tools_.erase(it);
        } else {
            ++it;
        }
    }
    resources_.erase(backend);
    prompts_.erase(backend);
}

Result<ToolEntry, Error> ToolCatalog::Resolve(const std::string& qualified_name) const {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = tools_.find(qualified_name);
        if (it != tools_.end()) {
            return Result<ToolEntry, Error>::Ok(it->second);
        }
    }

    std::string backend;
    auto parsed = QualifiedToolName::Parse(qualified_name);
    if (parsed.IsOk()) {
        backend = parsed.Value().Backend();
    }
    std::string message = "tool '" + qualified_name + "' not found";
    auto similar = Suggest(qualified_name);
    if (!similar.empty()) {
        message += ". Similar tools: ";
        for (size_t i = 0; i < similar.size(); ++i) {
            message += (i == 0 ? "" : ", ") + similar[i];
        }
    }
    return Result<ToolEntry, Error>::Err(
        Error::Make(ErrorCategory::ToolNotFound, "ResolveTool", backend, message));
}

std::vector<ToolEntry> ToolCatalog::Tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ToolEntry> out;
    out.reserve(tools_.size());
    for (const auto& [name, entry] : tools_) {
        out.push_back(entry);
    }
    return out;
}

std::vector<ToolEntry> ToolCatalog::ToolsFor(const std::string& backend) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ToolEntry> out;
    for (const auto& [name, entry] : tools_) {
        if (entry.backend == backend) {
            out.push_back(entry);
        }
    }
    return out;
}

std::vector<ResourceEntry> ToolCatalog::Resources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ResourceEntry> out;
    for (const auto& [backend, list] : resources_) {
        out.insert(out.end(), list.begin(), list.end());
    }
    return out;
}

std::vector<PromptEntry> ToolCatalog::Prompts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PromptEntry> out;
    for (const auto& [backend, list] : prompts_) {
        out.insert(out.end(), list.begin(), list.end());
    }
    return out;
}

std::vector<std::string> ToolCatalog::Backends() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::set<std::string> names;
    for (const auto& [name, entry] : tools_) {
        names.insert(entry.backend);
    }
    return {names.begin(), names.end()};
}

size_t ToolCatalog::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.size();
}

std::vector<std::string> ToolCatalog::Suggest(const std::string& query, size_t limit) const {
    std::string needle = ToLower(query);
    std::string tool_part;
    auto dot = needle.find('.');
    if (dot != std::string::npos && dot + 1 < needle.size()) {
        tool_part = needle.substr(dot + 1);
    }

    std::vector<std::string> out;
    if (needle.empty() || limit == 0) {
        return out;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [name, entry] : tools_) {
        std::string candidate = ToLower(name);
        if (candidate.find(needle) != std::string::npos ||
            (!tool_part.empty() && candidate.find(tool_part) != std::string::npos)) {
            out.push_back(name);
            if (out.size() >= limit) {
                break;
            }
        }
    }
    return out;
}

} // namespace mcp_fleet
