#include "ConsoleRenderer.hpp"
#include "Errors.hpp"
#include "Utils.hpp"

#include <print>
#include <format>
#include <ostream>
#include <algorithm>

namespace {
    std::string seconds_string(std::chrono::milliseconds d) {
        return std::format("{:.2f}s", static_cast<double>(d.count()) / 1000.0);
    }

    std::string usage_string(const TokenUsage& usage) {
        if (!usage.known()) return "unknown";

        auto part = [](uint64_t v) { return v == TokenUsage::unknown ? std::string("?") : std::to_string(v); };
        return std::format("{} (prompt={}, completion={})", usage.total, part(usage.prompt), part(usage.completion));
    }
}

ConsoleRenderer::ConsoleRenderer(std::ostream& out, bool color, std::chrono::seconds delay): _out(out), _delay(delay) {
    if (color) _c = { "\033[92m", "\033[91m", "\033[96m", "\033[93m", "\033[1m", "\033[0m" };
}

void ConsoleRenderer::check_stream() {
    if (!_out) throw RenderError("console output stream failed");
}

void ConsoleRenderer::round_started(uint64_t round) {
    if (_delay.count() > 0) std::println(_out, "\n{}Test Iteration #{}{}", _c.bold, round, _c.reset);

    std::println(_out, "\n{}TESTING ALL MODEL SERVER ENDPOINTS{}", _c.yellow, _c.reset);
    std::println(_out, "{}Started at: {}{}", _c.yellow, clock_string(std::chrono::system_clock::now()), _c.reset);
    std::println(_out, "{}{}{}", _c.yellow, std::string(60, '='), _c.reset);

    _out.flush();
    check_stream();
}

void ConsoleRenderer::render_server(const ProbeOutcome& outcome, const ServerStatus* status) {
    const auto& id = outcome.server_id;
    auto tag = std::format("[{}{}{}]", _c.bold, id, _c.reset);

    std::println(_out, "\n{}", std::string(60, '='));

    if (status) {
        const auto& sd = status->descriptor;
        std::println(_out, "{}{}SERVER: {} ({}){}", _c.bold, _c.cyan, id, sd.model_name, _c.reset);
        std::println(_out, "{}", std::string(60, '-'));
        std::println(_out, "{} API Base: {}", tag, sd.api_base_url);
        std::println(_out, "{} Host: {}", tag, sd.host_label);
    }
    else {
        std::println(_out, "{}{}SERVER: {}{}", _c.bold, _c.cyan, id, _c.reset);
        std::println(_out, "{}", std::string(60, '-'));
    }

    if (outcome.ok()) {
        std::println(_out, "{} Success: Endpoint responded in {}", tag, seconds_string(outcome.duration));

        if (outcome.reply.empty()) std::println(_out, "{} Response: EMPTY (model connected but returned no content)", tag);
        else std::println(_out, "{} Response: {}", tag, outcome.reply);

        std::println(_out, "{} Tokens: {}", tag, usage_string(outcome.tokens.value_or(TokenUsage{})));
    }
    else {
        std::println(_out, "{} {}{}{}: {} (after {})", tag, _c.red, to_string(outcome.status), _c.reset,
                     outcome.error_detail.value_or(""), seconds_string(outcome.duration));
    }

    auto colour = outcome.ok() ? _c.green : _c.red;
    std::println(_out, "{} Status: {}{}{}", tag, colour, outcome.ok() ? "SUCCESS" : "FAILURE", _c.reset);

    if (status) {
        std::println(_out, "{} History: {}/{} ok, {} consecutive failure{}", tag,
                     status->total_successes, status->total_rounds,
                     status->consecutive_failures, status->consecutive_failures == 1 ? "" : "s");
    }

    std::println(_out, "{}", std::string(60, '-'));
}

void ConsoleRenderer::render_round(const RoundSnapshot& snapshot, const StatusView& status) {
    for (const auto& outcome: snapshot.outcomes) render_server(outcome, status.find(outcome.server_id));

    auto border = std::string(80, '=');

    std::println(_out, "\n{}{}{}", _c.bold, border, _c.reset);

    if (snapshot.all_succeeded()) std::println(_out, "{}SUMMARY: {}All tests passed{}", _c.bold, _c.green, _c.reset);
    else std::println(_out, "{}SUMMARY: {}Some tests failed{} ({}/{} ok)", _c.bold, _c.red, _c.reset, snapshot.successes(), snapshot.outcomes.size());

    if (_delay.count() > 0) {
        std::println(_out, "{}Waiting {} seconds before next test run...{}", _c.bold, _delay.count(), _c.reset);
        std::println(_out, "{}Press Ctrl+C to exit{}", _c.bold, _c.reset);
    }

    std::println(_out, "{}{}{}", _c.bold, border, _c.reset);

    _out.flush();
    check_stream();
}

void ConsoleRenderer::render_waiting(std::chrono::seconds remaining, std::chrono::seconds total) {
    if (total.count() <= 0) return;

    auto left = remaining.count();

    // every 5 seconds, then every second for the last 10
    if (left % 5 != 0 && left >= 10) return;

    auto percent = static_cast<int>((total.count() - left) * 100 / total.count());
    auto filled = static_cast<size_t>(percent / 5);

    auto bar = std::string(filled, '=') + ">" + std::string(20 - std::min<size_t>(filled, 20), ' ');

    std::print(_out, "\r{}{}[{}] {} seconds remaining... ({}%){}", _c.bold, _c.cyan, bar, left, percent, _c.reset);
    if (left == 0) std::println(_out, "");

    _out.flush();
    check_stream();
}
