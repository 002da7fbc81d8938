#pragma once

#include <chrono>
#include <concepts>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace resonance::governor {

template <typename Result>
struct FailSafeOutcome {
  Result      value;
  bool        failover{false};
  std::string engine;
  double      duration_ms{0};
  std::string primary_error;
};

/*
  Runs a primary implementation and falls back to a legacy one.

  The primary runs on a worker thread and the caller waits at most the
  timeout for it. A primary that throws or has not finished in time is
  abandoned and the legacy implementation runs on the calling thread. The
  abandoned worker keeps running until the primary returns and its result
  is dropped, so the primary must own everything it touches.

  Both failing raises FailoverExhausted carrying both messages.
*/
class FailSafeExecutor {
 public:
  explicit FailSafeExecutor(std::chrono::milliseconds timeout) : timeout_(timeout) {
  }

  template <typename Primary, typename Legacy>
    requires std::invocable<Primary> && std::invocable<Legacy> &&
             std::same_as<std::invoke_result_t<Primary>, std::invoke_result_t<Legacy>> &&
             (!std::is_void_v<std::invoke_result_t<Primary>>)
  FailSafeOutcome<std::invoke_result_t<Primary>> Execute(std::string_view operation, Primary&& primary,
                                                         Legacy&& legacy) {
    using Clock  = std::chrono::steady_clock;
    using Result = std::invoke_result_t<Primary>;

    std::string primary_error;
    const auto  start = Clock::now();

    auto task   = std::make_shared<std::packaged_task<Result()>>(std::forward<Primary>(primary));
    auto future = task->get_future();
    std::thread([task] { (*task)(); }).detach();

    if (future.wait_for(timeout_) == std::future_status::ready) {
      try {
        Result       value   = future.get();
        const double elapsed = std::chrono::duration<double, std::milli>(Clock::now() - start).count();
        return FailSafeOutcome<Result>{std::move(value), false, "primary", elapsed, {}};
      } catch (const std::exception& e) {
        primary_error = e.what();
      }
    } else {
      primary_error = "operation exceeded " + std::to_string(timeout_.count()) + "ms";
    }

    ++failover_count_;
    last_failover_ = util::Now();
    RESONANCE_LOG_WARN("Failing over to legacy implementation",
                       {observability::StringField("operation", operation),
                        observability::StringField("error", primary_error),
                        observability::IntField("failover_count", static_cast<int64_t>(failover_count_))});

    const auto failover_start = Clock::now();
    try {
      Result       value   = legacy();
      const double elapsed = std::chrono::duration<double, std::milli>(Clock::now() - failover_start).count();
      return FailSafeOutcome<Result>{std::move(value), true, "legacy", elapsed, primary_error};
    } catch (const std::exception& e) {
      throw util::FailoverExhausted("Both engines failed: " + primary_error + " | " + e.what());
    }
  }

  uint64_t failover_count() const {
    return failover_count_;
  }

  std::optional<util::TimePoint> last_failover() const {
    return last_failover_;
  }

  std::chrono::milliseconds timeout() const {
    return timeout_;
  }

 private:
  std::chrono::milliseconds      timeout_;
  uint64_t                       failover_count_{0};
  std::optional<util::TimePoint> last_failover_;
};

} // namespace resonance::governor
