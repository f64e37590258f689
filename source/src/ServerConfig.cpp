#include "ServerConfig.hpp"
#include "Utils.hpp"

#include <format>
#include <algorithm>
#include <unordered_set>

#include <boost/url.hpp>
#include <yaml-cpp/yaml.h>

namespace {
    std::string required_scalar(const YAML::Node& entry, const char* key, size_t index) {
        const auto node = entry[key];

        if (!node || node.IsNull()) throw ConfigError(std::format("servers[{}]: missing required field '{}'", index, key));
        if (!node.IsScalar()) throw ConfigError(std::format("servers[{}]: field '{}' must be a string", index, key));

        auto value = trim(node.as<std::string>());
        if (value.empty()) throw ConfigError(std::format("servers[{}]: field '{}' is empty", index, key));

        return value;
    }

    std::string optional_scalar(const YAML::Node& entry, const char* key, size_t index) {
        const auto node = entry[key];

        if (!node || node.IsNull()) return {};
        if (!node.IsScalar()) throw ConfigError(std::format("servers[{}]: field '{}' must be a string", index, key));

        return trim(node.as<std::string>());
    }

    // returns the url host, which doubles as the default host label
    std::string validate_api_base(const std::string& api_base, size_t index) {
        auto rv = boost::urls::parse_uri(api_base);
        if (!rv) throw ConfigError(std::format("servers[{}]: invalid openai_api_base '{}'", index, api_base));

        auto scheme = std::string(rv->scheme());
        if (scheme != "http" && scheme != "https")
            throw ConfigError(std::format("servers[{}]: unsupported scheme '{}' in openai_api_base", index, scheme));

        auto host = std::string(rv->host());
        if (host.empty()) throw ConfigError(std::format("servers[{}]: openai_api_base has no host", index));

        return host;
    }
}

std::vector<ServerDescriptor> parse_server_config(const std::string& yaml_text) {
    YAML::Node root;

    try {
        root = YAML::Load(yaml_text);
    }
    catch (const YAML::Exception& ex) {
        throw ConfigError(std::format("invalid yaml: {}", ex.what()));
    }

    if (!root || !root.IsMap() || !root["servers"]) throw ConfigError("config has no 'servers' list");

    const auto list = root["servers"];
    if (!list.IsSequence()) throw ConfigError("'servers' must be a list");
    if (list.size() == 0) throw ConfigError("'servers' list is empty");

    std::vector<ServerDescriptor> out;
    out.reserve(list.size());

    std::unordered_set<std::string> seen;

    for (size_t i = 0; i < list.size(); ++i) {
        const auto entry = list[i];
        if (!entry.IsMap()) throw ConfigError(std::format("servers[{}]: entry must be a mapping", i));

        ServerDescriptor sd;

        sd.model_name   = required_scalar(entry, "openai_model", i);
        sd.api_base_url = required_scalar(entry, "openai_api_base", i);
        sd.api_key_ref  = optional_scalar(entry, "openai_api_key", i);

        auto host = validate_api_base(sd.api_base_url, i);

        sd.id = optional_scalar(entry, "shortname", i);
        if (sd.id.empty()) sd.id = sd.model_name;

        sd.host_label = optional_scalar(entry, "server", i);
        if (sd.host_label.empty()) sd.host_label = host;

        if (const auto mt = entry["max_tokens"]; mt && !mt.IsNull()) {
            int64_t value{};

            try {
                value = mt.as<int64_t>();
            }
            catch (const YAML::Exception&) {
                throw ConfigError(std::format("servers[{}]: max_tokens must be an integer", i));
            }

            if (value <= 0 || value > 1'000'000) throw ConfigError(std::format("servers[{}]: max_tokens out of range", i));
            sd.max_tokens = static_cast<uint32_t>(value);
        }

        if (!seen.insert(sd.id).second) throw ConfigError(std::format("duplicate server shortname '{}'", sd.id));

        out.push_back(std::move(sd));
    }

    return out;
}

std::vector<ServerDescriptor> load_server_config(const std::string& path) {
    std::string text;

    try {
        text = read_from_file(path);
    }
    catch (const std::exception& ex) {
        throw ConfigError(ex.what());
    }

    try {
        return parse_server_config(text);
    }
    catch (const ConfigError& ex) {
        throw ConfigError(std::format("{}: {}", path, ex.what()));
    }
}

bool is_openai_server(const ServerDescriptor& server) {
    return server.api_base_url.find("api.openai.com") != std::string::npos;
}

std::vector<ServerDescriptor> filter_servers(const std::vector<ServerDescriptor>& servers, const ServerFilter& filter) {
    for (const auto& id: filter.only) {
        auto known = std::ranges::any_of(servers, [&id](const auto& s) { return s.id == id; });
        if (!known) throw ConfigError(std::format("unknown server '{}' in --only", id));
    }

    std::vector<ServerDescriptor> out;

    for (const auto& server: servers) {
        if (filter.skip_openai && is_openai_server(server)) continue;
        if (!filter.only.empty() && !std::ranges::contains(filter.only, server.id)) continue;

        out.push_back(server);
    }

    if (out.empty()) throw ConfigError("no servers left to test after filtering");

    return out;
}
