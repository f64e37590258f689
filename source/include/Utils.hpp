#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string_view>

std::string read_from_file(const std::string& path);

// "${NAME}" -> getenv(NAME), literal -> itself, empty -> $OPENAI_API_KEY
std::optional<std::string> resolve_api_key(std::string_view key_ref);

// the env var a key reference points at, for error messages
std::string key_env_name(std::string_view key_ref);

std::string clock_string(std::chrono::system_clock::time_point tp);
std::string trim(std::string_view in);
std::vector<std::string> split_list(std::string_view in, char sep = ',');

// code points, not bytes
size_t utf8_length(std::string_view in);

// the first `count` code points, never splitting a multi-byte sequence
std::string_view utf8_prefix(std::string_view in, size_t count);
