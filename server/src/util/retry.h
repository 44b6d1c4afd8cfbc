#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>

#include "util/deadline.h"

namespace walkplan {

// Thrown by an operation to signal that retrying cannot help (bad input,
// "no route" answers). RetryWithBackoff stops at the first one.
class PermanentFailure : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

struct RetryPolicy {
  int max_attempts = 3;
  std::chrono::milliseconds initial_backoff{200};
  double backoff_multiplier = 2.0;
  std::chrono::milliseconds max_backoff{2000};
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

inline Sleeper ThreadSleeper() {
  return [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

// Result-or-error of a retried operation.
template <typename T>
struct RetryResult {
  std::optional<T> value;
  int attempts = 0;
  std::string last_error;

  bool ok() const { return value.has_value(); }
};

// Backoff before attempt `attempt + 1`, for attempt >= 1.
inline std::chrono::milliseconds BackoffDelay(
    const RetryPolicy& policy, int attempt
) {
  double delay = static_cast<double>(policy.initial_backoff.count());
  for (int i = 1; i < attempt; ++i) {
    delay *= policy.backoff_multiplier;
  }
  auto result = std::chrono::milliseconds{static_cast<long long>(delay)};
  return result < policy.max_backoff ? result : policy.max_backoff;
}

// Runs `operation` until it returns, up to policy.max_attempts times, sleeping
// with exponential backoff in between. Exceptions never escape: the last
// error message is reported in the result instead. A PermanentFailure or an
// expired deadline ends the loop early.
template <typename Operation>
auto RetryWithBackoff(
    Operation&& operation,
    const RetryPolicy& policy,
    const Deadline& deadline,
    const Sleeper& sleep = ThreadSleeper()
) -> RetryResult<std::invoke_result_t<Operation&>> {
  RetryResult<std::invoke_result_t<Operation&>> result;
  int max_attempts = policy.max_attempts < 1 ? 1 : policy.max_attempts;
  for (int attempt = 1; attempt <= max_attempts; ++attempt) {
    if (deadline.Expired()) {
      result.last_error = "deadline expired";
      return result;
    }
    result.attempts = attempt;
    try {
      result.value.emplace(operation());
      return result;
    } catch (const PermanentFailure& e) {
      result.last_error = e.what();
      return result;
    } catch (const std::exception& e) {
      result.last_error = e.what();
    }
    if (attempt < max_attempts) {
      auto delay = BackoffDelay(policy, attempt);
      if (deadline.Remaining(delay) < delay) {
        result.last_error += " (deadline reached during backoff)";
        return result;
      }
      sleep(delay);
    }
  }
  return result;
}

}  // namespace walkplan
