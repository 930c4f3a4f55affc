#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

namespace keyrescue::concurrency {

/**
 * @brief Per-path async mutex with FIFO hand-off.
 *
 * A waiter that outlives its timeout takes the slot over from the current
 * holder; the evicted holder's later release is ignored. Must be used from a
 * single executor.
 */
class FileMutex {
public:
    class Guard {
    public:
        Guard() = default;
        Guard(FileMutex* owner, std::string path, uint64_t ticket)
            : owner_(owner), path_(std::move(path)), ticket_(ticket) {}
        Guard(Guard&& other) noexcept
            : owner_(std::exchange(other.owner_, nullptr)), path_(std::move(other.path_)),
              ticket_(other.ticket_) {}
        Guard& operator=(Guard&& other) noexcept {
            if (this != &other) {
                unlock();
                owner_ = std::exchange(other.owner_, nullptr);
                path_ = std::move(other.path_);
                ticket_ = other.ticket_;
            }
            return *this;
        }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard() { unlock(); }

        void unlock() {
            if (owner_) {
                owner_->release(path_, ticket_);
                owner_ = nullptr;
            }
        }
        bool owns() const noexcept { return owner_ != nullptr; }

    private:
        FileMutex* owner_ = nullptr;
        std::string path_;
        uint64_t ticket_ = 0;
    };

    explicit FileMutex(boost::asio::any_io_executor executor,
                       std::chrono::milliseconds defaultTimeout = std::chrono::milliseconds{30'000});

    boost::asio::awaitable<Guard> lock(std::string path,
                                       std::optional<std::chrono::milliseconds> timeout = {});

    /// Runs @p fn with the path's mutex held; the result of @p fn is passed through.
    template <typename F>
    auto withFileMutex(std::string path, F fn,
                       std::optional<std::chrono::milliseconds> timeout = {})
        -> boost::asio::awaitable<typename std::invoke_result_t<F&>::value_type> {
        auto guard = co_await lock(std::move(path), timeout);
        co_return co_await fn();
    }

    std::size_t activePaths() const;
    uint64_t takeovers() const;

private:
    struct Waiter {
        Waiter(boost::asio::any_io_executor ex, uint64_t t) : timer(std::move(ex)), ticket(t) {}
        boost::asio::steady_timer timer;
        uint64_t ticket;
        bool granted = false;
    };

    struct Slot {
        uint64_t owner = 0;
        std::deque<std::shared_ptr<Waiter>> waiters;
    };

    void release(const std::string& path, uint64_t ticket);

    boost::asio::any_io_executor executor_;
    std::chrono::milliseconds defaultTimeout_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Slot> slots_;
    uint64_t nextTicket_{0};
    uint64_t takeovers_{0};
};

} // namespace keyrescue::concurrency
