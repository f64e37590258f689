#include "PollingScheduler.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <exception>

std::string_view to_string(SchedulerState state) {
    switch (state) {
        case SchedulerState::Idle:      return "Idle";
        case SchedulerState::Running:   return "Running";
        case SchedulerState::Waiting:   return "Waiting";
        case SchedulerState::Cancelled: return "Cancelled";
    }
    return "Unknown";
}

PollingScheduler::PollingScheduler(boost::asio::any_io_executor exec,
                                   RoundCoordinator& coordinator,
                                   StatusStore& store,
                                   Renderer& renderer,
                                   ShutdownSignal& shutdown,
                                   SchedulerOptions options):
    _exec(exec),
    _coordinator(coordinator),
    _store(store),
    _renderer(renderer),
    _shutdown(shutdown),
    _options(options),
    _tick(exec)
    {}

void PollingScheduler::transition(SchedulerState next) {
    if (next == _state) return;

    auto prev = _state;
    _state = next;

    Log::debug("scheduler: {} -> {}", to_string(prev), to_string(next));

    if (_hook) _hook(prev, next);
}

template <typename Fn>
void PollingScheduler::guarded(std::string_view what, Fn&& fn) {
    try {
        fn();
    }
    catch (const RenderError& e) {
        Log::error("renderer failed during {}: {}", what, e.what());
    }
    catch (const std::exception& e) {
        Log::error("renderer threw during {}: {}", what, e.what());
    }
}

boost::asio::awaitable<void> PollingScheduler::run_one_round() {
    transition(SchedulerState::Running);

    const auto round_number = _coordinator.rounds_run() + 1;
    Log::info("round {} started, {} server(s)", round_number, _store.servers().size());

    guarded("round start", [&] { _renderer.round_started(round_number); });

    auto snapshot = co_await _coordinator.run_round(_store.servers(), _options.probe_timeout);

    for (const auto& outcome: snapshot.outcomes) {
        if (!outcome.ok()) Log::warn("{}: {}: {}", outcome.server_id, to_string(outcome.status), outcome.error_detail.value_or(""));
    }

    auto view = _store.apply(snapshot);

    ++_result.rounds;
    _result.last_round_all_failed = snapshot.all_failed();

    Log::info("round {} finished, {}/{} ok", snapshot.round, snapshot.successes(), snapshot.outcomes.size());

    guarded("round render", [&] { _renderer.render_round(snapshot, *view); });
}

boost::asio::awaitable<void> PollingScheduler::wait_delay() {
    transition(SchedulerState::Waiting);

    const auto total = _options.delay;
    boost::system::error_code ec;

    for (auto remaining = total; remaining.count() > 0; remaining -= std::chrono::seconds(1)) {
        if (_shutdown.requested()) co_return;

        guarded("countdown", [&] { _renderer.render_waiting(remaining, total); });

        _tick.expires_after(std::chrono::seconds(1));
        co_await _tick.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }

    if (!_shutdown.requested()) guarded("countdown", [&] { _renderer.render_waiting(std::chrono::seconds(0), total); });
}

boost::asio::awaitable<SchedulerResult> PollingScheduler::run() {
    _shutdown.on_request([this] { _tick.cancel(); });

    while (true) {
        if (_shutdown.requested()) {
            transition(SchedulerState::Cancelled);
            break;
        }

        co_await run_one_round();

        if (_shutdown.requested()) {
            transition(SchedulerState::Cancelled);
            break;
        }

        if (!_options.continuous()) {
            transition(SchedulerState::Idle);
            break;
        }

        co_await wait_delay();
    }

    _result.final_state = _state;

    Log::info("scheduler stopped after {} round(s), state {}", _result.rounds, to_string(_state));

    co_return _result;
}
