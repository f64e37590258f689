#pragma once

#include "ServerDescriptor.hpp"
#include "Errors.hpp"

#include <string>
#include <vector>
#include <string_view>

struct ServerFilter {
    std::vector<std::string> only;  // empty -> keep all
    bool skip_openai = false;
};

// parses the `servers:` list, throws ConfigError on anything malformed
std::vector<ServerDescriptor> parse_server_config(const std::string& yaml_text);
std::vector<ServerDescriptor> load_server_config(const std::string& path);

std::vector<ServerDescriptor> filter_servers(const std::vector<ServerDescriptor>& servers, const ServerFilter& filter);

bool is_openai_server(const ServerDescriptor& server);
