#include "Utils.hpp"

#include <ctime>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <format>

std::string read_from_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);

    if (!file.is_open()) {
        throw std::runtime_error("Could not open file: " + path);
    }

    std::streamsize size = file.tellg();
    file.seekg(0, std::ios::beg);

    std::string data(static_cast<size_t>(size), '\0');
    file.read(data.data(), size);

    return data;
}

std::string key_env_name(std::string_view key_ref) {
    if (key_ref.empty()) return "OPENAI_API_KEY";
    if (key_ref.size() >= 3 && key_ref.starts_with("${") && key_ref.ends_with("}")) return std::string(key_ref.substr(2, key_ref.size() - 3));
    return {};
}

std::optional<std::string> resolve_api_key(std::string_view key_ref) {
    auto env = key_env_name(key_ref);

    // literal key
    if (env.empty()) return std::string(key_ref);

    const char* value = std::getenv(env.c_str());
    if (!value || !*value) return std::nullopt;

    return std::string(value);
}

std::string clock_string(std::chrono::system_clock::time_point tp) {
    auto t = std::chrono::system_clock::to_time_t(tp);

    std::tm local{};
    localtime_r(&t, &local);

    return std::format("{:02}:{:02}:{:02}", local.tm_hour, local.tm_min, local.tm_sec);
}

std::string trim(std::string_view in) {
    auto first = in.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) return {};

    auto last = in.find_last_not_of(" \t\r\n");
    return std::string(in.substr(first, last - first + 1));
}

std::vector<std::string> split_list(std::string_view in, char sep) {
    std::vector<std::string> out;

    size_t pos = 0;
    while (pos <= in.size()) {
        auto next = in.find(sep, pos);
        if (next == std::string_view::npos) next = in.size();

        auto item = trim(in.substr(pos, next - pos));
        if (!item.empty()) out.push_back(std::move(item));

        pos = next + 1;
    }

    return out;
}

namespace {
    bool is_continuation(char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; }
}

size_t utf8_length(std::string_view in) {
    size_t n = 0;
    for (char c: in) if (!is_continuation(c)) ++n;
    return n;
}

std::string_view utf8_prefix(std::string_view in, size_t count) {
    size_t seen = 0;

    for (size_t i = 0; i < in.size(); ++i) {
        if (is_continuation(in[i])) continue;
        if (seen++ == count) return in.substr(0, i);
    }

    return in;
}
