#include "RoundCoordinator.hpp"
#include "Log.hpp"

#include <format>
#include <exception>

RoundCoordinator::RoundState::RoundState(boost::asio::any_io_executor exec, size_t n): slots(n), cancels(n), done(exec), pending(n) {
    deadlines.reserve(n);
    for (size_t i = 0; i < n; ++i) deadlines.emplace_back(exec);

    done.expires_at(boost::asio::steady_timer::time_point::max());
}

// first writer wins, a false return means the slot was already recorded
bool RoundCoordinator::RoundState::finalize(size_t slot, ProbeOutcome&& outcome) {
    if (slots[slot]) return false;

    slots[slot] = std::move(outcome);
    deadlines[slot].cancel();

    if (--pending == 0) done.cancel();

    return true;
}

RoundCoordinator::RoundCoordinator(boost::asio::any_io_executor exec, std::shared_ptr<BaseProbe> probe):
    _exec(exec),
    _probe(std::move(probe)),
    _late_discarded(std::make_shared<std::atomic<uint64_t>>(0))
    {}

boost::asio::awaitable<ProbeOutcome> RoundCoordinator::probe_one(std::shared_ptr<BaseProbe> probe, ServerDescriptor server, std::chrono::milliseconds timeout) {
    co_return co_await probe->async_probe(server, timeout);
}

boost::asio::awaitable<RoundSnapshot> RoundCoordinator::run_round(const std::vector<ServerDescriptor>& servers, std::chrono::milliseconds per_probe_timeout) {
    RoundSnapshot snapshot;
    snapshot.round = ++_rounds;
    snapshot.started_at = std::chrono::system_clock::now();

    auto state = std::make_shared<RoundState>(_exec, servers.size());

    for (size_t i = 0; i < servers.size(); ++i) {
        const auto& server = servers[i];

        const auto issued_at = std::chrono::system_clock::now();
        const auto started = std::chrono::steady_clock::now();

        auto& deadline = state->deadlines[i];
        deadline.expires_after(per_probe_timeout);

        deadline.async_wait([state, i, id = server.id, issued_at, started, per_probe_timeout](boost::system::error_code ec) {
            // cancelled because the probe answered first
            if (ec) return;

            auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
            auto outcome = ProbeOutcome::failure(id, issued_at, waited, ProbeStatus::Timeout,
                                                 std::format("no response within {} ms", per_probe_timeout.count()));

            if (state->finalize(i, std::move(outcome))) state->cancels[i].emit(boost::asio::cancellation_type::terminal);
        });

        boost::asio::co_spawn(
            _exec,
            probe_one(_probe, server, per_probe_timeout),
            boost::asio::bind_cancellation_slot(
                state->cancels[i].slot(),
                [state, i, id = server.id, issued_at, started, late = _late_discarded](std::exception_ptr ep, ProbeOutcome outcome) {
                    if (ep) {
                        std::string what;

                        try { std::rethrow_exception(ep); }
                        catch (const std::exception& e) { what = e.what(); }

                        auto took = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
                        outcome = ProbeOutcome::failure(id, issued_at, took, ProbeStatus::ProtocolError, std::format("probe failed: {}", what));
                    }

                    const bool cancelled = outcome.status == ProbeStatus::Timeout;

                    if (!state->finalize(i, std::move(outcome))) {
                        // a Timeout here is the probe acknowledging our cancellation, not a late answer
                        if (cancelled) return;

                        late->fetch_add(1, std::memory_order_acq_rel);
                        Log::debug("{}: late result discarded, timeout already recorded", id);
                    }
                }
            )
        );
    }

    if (state->pending > 0) {
        boost::system::error_code ec;
        co_await state->done.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    snapshot.outcomes.reserve(servers.size());

    for (size_t i = 0; i < servers.size(); ++i) {
        auto& slot = state->slots[i];

        // only reachable when the awaiting coroutine itself was cancelled
        if (!slot) {
            auto outcome = ProbeOutcome::failure(servers[i].id, snapshot.started_at, per_probe_timeout, ProbeStatus::Timeout, "round aborted");
            state->finalize(i, std::move(outcome));
            state->cancels[i].emit(boost::asio::cancellation_type::terminal);
        }

        // the slot stays engaged so a straggler still sees it as taken
        snapshot.outcomes.push_back(std::move(*slot));
    }

    snapshot.finished_at = std::chrono::system_clock::now();

    co_return snapshot;
}
