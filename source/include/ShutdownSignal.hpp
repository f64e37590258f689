#pragma once

#include <mutex>
#include <atomic>
#include <vector>
#include <functional>

#include <boost/asio.hpp>

// The one cancellation source for the process. request() is safe from any thread;
// registered callbacks always run on the executor, once.
class ShutdownSignal {
public:
    explicit ShutdownSignal(boost::asio::any_io_executor exec): _exec(exec) {}

    void request();
    bool requested() const noexcept { return _requested.load(std::memory_order_acquire); }

    // posted immediately if the request already happened
    void on_request(std::function<void()> callback);

    // completes once shutdown has been requested
    [[nodiscard]] boost::asio::awaitable<void> async_wait();

private:
    boost::asio::any_io_executor _exec;
    std::atomic<bool> _requested{ false };

    std::mutex _mutex;
    std::vector<std::function<void()>> _callbacks;
};
