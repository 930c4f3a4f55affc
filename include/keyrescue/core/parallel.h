#pragma once

#include <keyrescue/core/async_event.h>

#include <spdlog/spdlog.h>

#include <cstddef>
#include <exception>
#include <memory>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace keyrescue {

/**
 * @brief Run every task concurrently on the calling coroutine's executor and
 * wait for all of them.
 *
 * Results keep the order of @p tasks. A task that throws leaves a
 * default-constructed slot and is logged; the group itself never throws.
 */
template <typename T>
boost::asio::awaitable<std::vector<T>> gatherAll(std::vector<boost::asio::awaitable<T>> tasks) {
    static_assert(std::is_default_constructible_v<T>,
                  "gatherAll requires default-constructible results");

    if (tasks.empty()) {
        co_return std::vector<T>{};
    }
    auto executor = co_await boost::asio::this_coro::executor;

    struct GroupState {
        explicit GroupState(boost::asio::any_io_executor ex, std::size_t n)
            : results(n), pending(n), done(std::move(ex)) {}
        std::vector<T> results;
        std::size_t pending;
        AsyncEvent done;
    };

    auto state = std::make_shared<GroupState>(executor, tasks.size());

    for (std::size_t i = 0; i < tasks.size(); ++i) {
        boost::asio::co_spawn(executor, std::move(tasks[i]),
                              [state, i](std::exception_ptr ep, T value) {
                                  if (ep) {
                                      try {
                                          std::rethrow_exception(ep);
                                      } catch (const std::exception& e) {
                                          spdlog::debug("[Parallel] task {} failed: {}", i,
                                                        e.what());
                                      }
                                  } else {
                                      state->results[i] = std::move(value);
                                  }
                                  if (--state->pending == 0) {
                                      state->done.set();
                                  }
                              });
    }

    co_await state->done.wait();
    co_return std::move(state->results);
}

/**
 * @brief Run a blocking callable on @p blockingExecutor and resume the caller on
 * its own executor with the result.
 *
 * The callable's result type must be default-constructible.
 */
template <typename F>
auto runBlocking(boost::asio::any_io_executor blockingExecutor, F fn)
    -> boost::asio::awaitable<std::invoke_result_t<F&>> {
    using R = std::invoke_result_t<F&>;
    auto task = [fn = std::move(fn)]() mutable -> boost::asio::awaitable<R> { co_return fn(); };
    co_return co_await boost::asio::co_spawn(blockingExecutor, std::move(task),
                                             boost::asio::use_awaitable);
}

} // namespace keyrescue
