#pragma once

#include "ProbeOutcome.hpp"

#include <vector>
#include <chrono>
#include <cstdint>
#include <algorithm>

// outcomes are in configured server order, one per server
struct RoundSnapshot {
    uint64_t round{};

    std::chrono::system_clock::time_point started_at{}, finished_at{};

    std::vector<ProbeOutcome> outcomes;

    size_t successes() const {
        return static_cast<size_t>(std::ranges::count_if(outcomes, [](const auto& o) { return o.ok(); }));
    }

    bool all_succeeded() const { return successes() == outcomes.size(); }
    bool all_failed() const { return !outcomes.empty() && successes() == 0; }
};
