#pragma once

#include "RoundSnapshot.hpp"
#include "ServerStatus.hpp"

#include <chrono>
#include <cstdint>

// Formats rounds for the user. Implementations only read what they are handed and throw RenderError when output fails.
class Renderer {
public:
    virtual ~Renderer() = default;

    virtual bool is_interactive() const = 0;

    virtual void render_round(const RoundSnapshot& snapshot, const StatusView& status) = 0;

    virtual void start() {}
    virtual void stop() {}

    virtual void round_started(uint64_t round) {}
    virtual void render_waiting(std::chrono::seconds remaining, std::chrono::seconds total) {}
};
