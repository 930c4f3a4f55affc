#include <keyrescue/concurrency/file_mutex.h>

#include <spdlog/spdlog.h>

#include <algorithm>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace keyrescue::concurrency {

FileMutex::FileMutex(boost::asio::any_io_executor executor,
                     std::chrono::milliseconds defaultTimeout)
    : executor_(std::move(executor)), defaultTimeout_(defaultTimeout) {}

boost::asio::awaitable<FileMutex::Guard>
FileMutex::lock(std::string path, std::optional<std::chrono::milliseconds> timeout) {
    std::shared_ptr<Waiter> waiter;
    const auto wait = timeout.value_or(defaultTimeout_);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        const uint64_t ticket = ++nextTicket_;
        auto& slot = slots_[path];
        if (slot.owner == 0) {
            slot.owner = ticket;
            co_return Guard(this, path, ticket);
        }
        waiter = std::make_shared<Waiter>(executor_, ticket);
        waiter->timer.expires_after(wait);
        slot.waiters.push_back(waiter);
    }

    boost::system::error_code ec;
    co_await waiter->timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));

    std::lock_guard<std::mutex> lk(mutex_);
    if (!waiter->granted) {
        auto& slot = slots_[path];
        slot.waiters.erase(std::remove(slot.waiters.begin(), slot.waiters.end(), waiter),
                           slot.waiters.end());
        spdlog::warn("[FileMutex] {} still held after {}ms, taking over", path, wait.count());
        slot.owner = waiter->ticket;
        ++takeovers_;
    }
    co_return Guard(this, path, waiter->ticket);
}

void FileMutex::release(const std::string& path, uint64_t ticket) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = slots_.find(path);
    if (it == slots_.end() || it->second.owner != ticket) {
        // Evicted by a timed-out waiter.
        return;
    }
    auto& slot = it->second;
    if (slot.waiters.empty()) {
        slots_.erase(it);
        return;
    }
    auto next = slot.waiters.front();
    slot.waiters.pop_front();
    slot.owner = next->ticket;
    next->granted = true;
    next->timer.cancel();
}

std::size_t FileMutex::activePaths() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return slots_.size();
}

uint64_t FileMutex::takeovers() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return takeovers_;
}

} // namespace keyrescue::concurrency
