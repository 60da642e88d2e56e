#pragma once

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>
#include <utility>

#include "docent_core/async/cancellation_token.hpp"

namespace docent_core::async {

enum class WaitStatus { Ready, TimedOut, Cancelled };

// Runs `fn` on a detached thread and returns a future for its result.
// Exceptions thrown by `fn` are rethrown from future::get(). The thread owns
// the promise, so abandoning the future after a timeout is safe; whatever
// `fn` captures must stay valid until it returns.
template <typename Fn>
auto launch_detached(Fn fn) -> std::future<std::invoke_result_t<Fn &>> {
  using Result = std::invoke_result_t<Fn &>;
  auto promise = std::make_shared<std::promise<Result>>();
  std::future<Result> future = promise->get_future();
  std::thread([promise, fn = std::move(fn)]() mutable {
    try {
      if constexpr (std::is_void_v<Result>) {
        fn();
        promise->set_value();
      } else {
        promise->set_value(fn());
      }
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  }).detach();
  return future;
}

// Waits until the future is ready, the timeout elapses or the token is
// cancelled, whichever comes first. A non-positive timeout waits without a
// deadline.
template <typename T>
WaitStatus wait_for_result(std::future<T> &future,
                           std::chrono::milliseconds timeout,
                           const CancellationToken &cancel) {
  constexpr auto slice = std::chrono::milliseconds(50);
  const bool bounded = timeout.count() > 0;
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (true) {
    if (cancel.is_cancelled()) {
      return WaitStatus::Cancelled;
    }
    auto wait = slice;
    if (bounded) {
      const auto now = std::chrono::steady_clock::now();
      if (now >= deadline) {
        return future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready
                   ? WaitStatus::Ready
                   : WaitStatus::TimedOut;
      }
      wait = std::min(slice,
                      std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) +
                          std::chrono::milliseconds(1));
    }
    if (future.wait_for(wait) == std::future_status::ready) {
      return WaitStatus::Ready;
    }
  }
}

}  // namespace docent_core::async
