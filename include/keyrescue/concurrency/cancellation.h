#pragma once

#include <atomic>
#include <memory>

namespace keyrescue {

/// Cooperative cancellation flag polled between phases and iterations.
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    bool isCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

inline bool isCancelled(const std::shared_ptr<CancellationToken>& token) noexcept {
    return token && token->isCancelled();
}

} // namespace keyrescue
