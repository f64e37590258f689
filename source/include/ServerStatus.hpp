#pragma once

#include "ServerDescriptor.hpp"
#include "ProbeOutcome.hpp"

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <string_view>

struct ServerStatus {
    static constexpr size_t HISTORY_LIMIT = 20;

    ServerDescriptor descriptor;
    ProbeOutcome last_outcome;

    // oldest first, at most HISTORY_LIMIT entries
    std::vector<ProbeOutcome> recent;

    uint64_t consecutive_failures{}, total_rounds{}, total_successes{};

    uint64_t total_failures() const { return total_rounds - total_successes; }

    double success_ratio() const {
        return total_rounds == 0 ? 0.0 : static_cast<double>(total_successes) / static_cast<double>(total_rounds);
    }
};

// immutable per-round view handed to renderers
struct StatusView {
    uint64_t rounds_applied{};

    // configured order
    std::vector<ServerStatus> servers;

    const ServerStatus* find(std::string_view id) const {
        for (const auto& s: servers) if (s.descriptor.id == id) return &s;
        return nullptr;
    }
};
