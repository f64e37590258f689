#pragma once

#include <string>
#include <optional>
#include <cstdint>

struct ServerDescriptor {
    std::string id;             // shortname, unique per config
    std::string host_label;     // "server" in the yaml, falls back to url host
    std::string api_base_url;
    std::string api_key_ref;    // ${ENV} reference or literal key
    std::string model_name;

    std::optional<uint32_t> max_tokens = std::nullopt;
};
