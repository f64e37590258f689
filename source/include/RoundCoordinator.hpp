#pragma once

#include "BaseProbe.hpp"
#include "RoundSnapshot.hpp"
#include "ServerDescriptor.hpp"

#include <atomic>
#include <memory>
#include <vector>
#include <chrono>
#include <optional>

#include <boost/asio.hpp>

// Fans one probe per server out on the executor and races each against its own timer.
// The timer is authoritative: once it records Timeout for a slot, the probe is sent a
// terminal cancellation and whatever it returns later is dropped.
// All completion handlers run on _exec, which must not be run from more than one thread.
class RoundCoordinator {
public:
    RoundCoordinator(boost::asio::any_io_executor exec, std::shared_ptr<BaseProbe> probe);

    [[nodiscard]] boost::asio::awaitable<RoundSnapshot> run_round(const std::vector<ServerDescriptor>& servers, std::chrono::milliseconds per_probe_timeout);

    uint64_t rounds_run() const { return _rounds; }
    // real answers that arrived after their timeout was recorded
    uint64_t late_results_discarded() const { return _late_discarded->load(std::memory_order_acquire); }

private:
    struct RoundState {
        RoundState(boost::asio::any_io_executor exec, size_t n);

        bool finalize(size_t slot, ProbeOutcome&& outcome);

        std::vector<std::optional<ProbeOutcome>> slots;
        std::vector<boost::asio::steady_timer> deadlines;
        std::vector<boost::asio::cancellation_signal> cancels;

        boost::asio::steady_timer done;
        size_t pending;
    };

    static boost::asio::awaitable<ProbeOutcome> probe_one(std::shared_ptr<BaseProbe> probe, ServerDescriptor server, std::chrono::milliseconds timeout);

    boost::asio::any_io_executor _exec;
    std::shared_ptr<BaseProbe> _probe;

    uint64_t _rounds{};

    // shared with handlers that can outlive the round
    std::shared_ptr<std::atomic<uint64_t>> _late_discarded;
};
