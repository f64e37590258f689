#pragma once

#include "Renderer.hpp"
#include "StatusStore.hpp"
#include "ShutdownSignal.hpp"
#include "RoundCoordinator.hpp"
#include "ServerDescriptor.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>

#include <boost/asio.hpp>

enum class SchedulerState: uint8_t { Idle, Running, Waiting, Cancelled };

std::string_view to_string(SchedulerState state);

struct SchedulerOptions {
    std::chrono::milliseconds probe_timeout{ 30000 };
    std::chrono::seconds delay{ 0 };    // zero -> one-shot

    bool continuous() const { return delay.count() > 0; }
};

struct SchedulerResult {
    uint64_t rounds = 0;
    SchedulerState final_state = SchedulerState::Idle;
    bool last_round_all_failed = false;
};

// Drives rounds one after another: coordinator -> store -> renderer.
// A shutdown request is honoured between rounds, never in the middle of one.
class PollingScheduler {
public:
    using TransitionHook = std::function<void(SchedulerState from, SchedulerState to)>;

    PollingScheduler(boost::asio::any_io_executor exec,
                     RoundCoordinator& coordinator,
                     StatusStore& store,
                     Renderer& renderer,
                     ShutdownSignal& shutdown,
                     SchedulerOptions options);

    [[nodiscard]] boost::asio::awaitable<SchedulerResult> run();

    SchedulerState state() const { return _state; }

    void on_transition(TransitionHook hook) { _hook = std::move(hook); }

private:
    void transition(SchedulerState next);

    boost::asio::awaitable<void> run_one_round();
    boost::asio::awaitable<void> wait_delay();

    // renderer failures are logged, never fatal
    template <typename Fn>
    void guarded(std::string_view what, Fn&& fn);

    boost::asio::any_io_executor _exec;
    RoundCoordinator& _coordinator;
    StatusStore& _store;
    Renderer& _renderer;
    ShutdownSignal& _shutdown;
    SchedulerOptions _options;

    boost::asio::steady_timer _tick;

    SchedulerState _state = SchedulerState::Idle;
    SchedulerResult _result;
    TransitionHook _hook;
};
