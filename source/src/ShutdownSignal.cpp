#include "ShutdownSignal.hpp"
#include "Log.hpp"

#include <memory>

void ShutdownSignal::request() {
    std::vector<std::function<void()>> pending;

    {
        std::scoped_lock lock(_mutex);
        if (_requested.exchange(true, std::memory_order_acq_rel)) return;
        pending.swap(_callbacks);
    }

    Log::info("shutdown requested");

    for (auto& cb: pending) boost::asio::post(_exec, std::move(cb));
}

void ShutdownSignal::on_request(std::function<void()> callback) {
    {
        std::scoped_lock lock(_mutex);

        if (!_requested.load(std::memory_order_acquire)) {
            _callbacks.push_back(std::move(callback));
            return;
        }
    }

    boost::asio::post(_exec, std::move(callback));
}

boost::asio::awaitable<void> ShutdownSignal::async_wait() {
    if (requested()) co_return;

    auto timer = std::make_shared<boost::asio::steady_timer>(_exec, boost::asio::steady_timer::time_point::max());
    on_request([timer] { timer->cancel(); });

    boost::system::error_code ec;
    while (!requested()) {
        co_await timer->async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
}
