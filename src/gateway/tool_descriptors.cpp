#include <mcp_fleet/gateway/tool_descriptors.hpp>

#include <set>

namespace mcp_fleet {

namespace {

Error DescriptorError(const std::string& name, const std::string& message) {
    return Error::Make(ErrorCategory::InvalidRequest, "ParseDescriptors", name, message);
}

} // anonymous namespace

Result<BackendConfig, Error> ParseBackendConfigJson(const std::string& name,
                                                    const nlohmann::json& value) {
    using R = Result<BackendConfig, Error>;
    if (!value.is_object()) {
        return R::Err(DescriptorError(name, "backend configuration must be an object"));
    }
    BackendConfig config;
    auto command = value.find("command");
    if (command == value.end() || !command->is_string() || command->get<std::string>().empty()) {
        return R::Err(DescriptorError(name, "backend configuration needs a 'command' string"));
    }
    config.command = command->get<std::string>();

    auto args = value.find("args");
    if (args != value.end() && !args->is_null()) {
        if (!args->is_array()) {
            return R::Err(DescriptorError(name, "'args' must be an array of strings"));
        }
        for (const auto& arg : *args) {
            if (!arg.is_string()) {
                return R::Err(DescriptorError(name, "'args' must be an array of strings"));
            }
            config.args.push_back(arg.get<std::string>());
        }
    }

    auto env = value.find("env");
    if (env != value.end() && !env->is_null()) {
        if (!env->is_object()) {
            return R::Err(DescriptorError(name, "'env' must be an object of strings"));
        }
        for (auto it = env->begin(); it != env->end(); ++it) {
            if (it.value().is_string()) {
                config.env[it.key()] = it.value().get<std::string>();
            } else if (it.value().is_number() || it.value().is_boolean()) {
                config.env[it.key()] = it.value().dump();
            } else {
                return R::Err(DescriptorError(name, "env value '" + it.key() + "' must be a string"));
            }
        }
    }

    auto cwd = value.find("cwd");
    if (cwd != value.end() && cwd->is_string()) {
        config.cwd = cwd->get<std::string>();
    }
    return R::Ok(std::move(config));
}

Result<std::vector<RetrievedBackend>, Error> ParseRetrievedDescriptors(
    const nlohmann::json& descriptors) {
    using R = Result<std::vector<RetrievedBackend>, Error>;

    nlohmann::json list;
    if (descriptors.is_array()) {
        list = descriptors;
    } else if (descriptors.is_object() && descriptors.contains("tools") &&
               descriptors["tools"].is_array()) {
        list = descriptors["tools"];
    } else if (descriptors.is_object()) {
        list = nlohmann::json::array({descriptors});
    } else {
        return R::Err(DescriptorError("", "descriptors must be an object or an array"));
    }

    std::vector<RetrievedBackend> out;
    std::set<std::string> seen;
    for (const auto& descriptor : list) {
        if (!descriptor.is_object()) {
            return R::Err(DescriptorError("", "each descriptor must be an object"));
        }
        auto server_config = descriptor.find("mcp_server_config");
        if (server_config == descriptor.end() || !server_config->is_object()) {
            return R::Err(DescriptorError("", "descriptor has no 'mcp_server_config'"));
        }
        auto servers = server_config->find("mcpServers");
        if (servers == server_config->end() || !servers->is_object()) {
            return R::Err(DescriptorError("", "'mcp_server_config' has no 'mcpServers' map"));
        }

        std::string tool_name;
        if (descriptor.contains("tool_name") && descriptor["tool_name"].is_string()) {
            tool_name = descriptor["tool_name"].get<std::string>();
        }
        double score = 0.0;
        if (descriptor.contains("relevance_score") && descriptor["relevance_score"].is_number()) {
            score = descriptor["relevance_score"].get<double>();
        }

        for (auto it = servers->begin(); it != servers->end(); ++it) {
            if (seen.count(it.key()) != 0) {
                continue;
            }
            auto config = ParseBackendConfigJson(it.key(), it.value());
            if (config.IsErr()) {
                return R::Err(config.Error());
            }
            seen.insert(it.key());
            out.push_back(RetrievedBackend{it.key(), config.Value(), tool_name, score});
        }
    }
    return R::Ok(std::move(out));
}

} // namespace mcp_fleet
