#pragma once

#include <string>
#include <chrono>
#include <limits>
#include <cstdint>
#include <optional>
#include <string_view>

enum class ProbeStatus: uint8_t {
    Success = 0,
    Timeout,
    ConnectionError,
    ProtocolError,
    AuthError
};

std::string_view to_string(ProbeStatus status);

struct TokenUsage {
    static constexpr uint64_t unknown = std::numeric_limits<uint64_t>::max();

    uint64_t total = unknown, prompt = unknown, completion = unknown;

    bool known() const { return total != unknown; }

    bool operator==(const TokenUsage&) const = default;
};

// one per probe attempt, never modified after the coordinator records it
struct ProbeOutcome {
    std::string server_id{};

    std::chrono::system_clock::time_point issued_at{};
    std::chrono::milliseconds duration{};

    ProbeStatus status = ProbeStatus::ProtocolError;

    // exactly one of these is set, depending on status
    std::optional<TokenUsage> tokens = std::nullopt;
    std::optional<std::string> error_detail = std::nullopt;

    std::string reply{};

    bool ok() const { return status == ProbeStatus::Success; }

    bool operator==(const ProbeOutcome&) const = default;

    static ProbeOutcome success(std::string server_id, std::chrono::system_clock::time_point issued_at,
                                std::chrono::milliseconds duration, TokenUsage tokens, std::string reply = {});

    static ProbeOutcome failure(std::string server_id, std::chrono::system_clock::time_point issued_at,
                                std::chrono::milliseconds duration, ProbeStatus status, std::string detail);
};
