#pragma once

#include <utility>  // boost 1.74 asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace keyrescue {

/**
 * @brief One-shot event that coroutines can await.
 *
 * Backed by a steady_timer that never expires; set() cancels every pending
 * wait. Must be used from a single executor (or strand).
 */
class AsyncEvent {
public:
    explicit AsyncEvent(boost::asio::any_io_executor executor)
        : timer_(std::move(executor), boost::asio::steady_timer::time_point::max()) {}

    AsyncEvent(const AsyncEvent&) = delete;
    AsyncEvent& operator=(const AsyncEvent&) = delete;

    void set() {
        set_ = true;
        timer_.cancel();
    }

    bool isSet() const noexcept { return set_; }

    boost::asio::awaitable<void> wait() {
        while (!set_) {
            boost::system::error_code ec;
            co_await timer_.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
        }
    }

private:
    boost::asio::steady_timer timer_;
    bool set_{false};
};

} // namespace keyrescue
