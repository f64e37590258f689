#pragma once

#include "Renderer.hpp"

#include <chrono>
#include <string>
#include <ostream>

// plain report, one block per server per round
class ConsoleRenderer: public Renderer {
public:
    ConsoleRenderer(std::ostream& out, bool color, std::chrono::seconds delay);

    bool is_interactive() const override { return false; }

    void round_started(uint64_t round) override;
    void render_round(const RoundSnapshot& snapshot, const StatusView& status) override;
    void render_waiting(std::chrono::seconds remaining, std::chrono::seconds total) override;

private:
    struct Palette {
        std::string green, red, cyan, yellow, bold, reset;
    };

    void render_server(const ProbeOutcome& outcome, const ServerStatus* status);
    void check_stream();

    std::ostream& _out;
    Palette _c;
    std::chrono::seconds _delay;
};
