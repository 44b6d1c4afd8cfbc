#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace walkplan {

// End-to-end deadline for one planning request. Copies share the
// cancellation flag, so cancelling any copy cancels them all.
class Deadline {
 public:
  using Clock = std::chrono::steady_clock;

  static Deadline Never() { return Deadline(std::nullopt); }

  static Deadline After(std::chrono::milliseconds budget) {
    return Deadline(Clock::now() + budget);
  }

  bool Expired() const {
    if (cancelled_->load()) {
      return true;
    }
    return expires_at_.has_value() && Clock::now() >= *expires_at_;
  }

  // Time left, or `cap` when there is no deadline. Never negative.
  std::chrono::milliseconds Remaining(std::chrono::milliseconds cap) const {
    if (cancelled_->load()) {
      return std::chrono::milliseconds{0};
    }
    if (!expires_at_) {
      return cap;
    }
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        *expires_at_ - Clock::now()
    );
    if (left.count() < 0) {
      return std::chrono::milliseconds{0};
    }
    return left < cap ? left : cap;
  }

  void Cancel() const { cancelled_->store(true); }

 private:
  explicit Deadline(std::optional<Clock::time_point> expires_at)
      : expires_at_(expires_at),
        cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

  std::optional<Clock::time_point> expires_at_;
  std::shared_ptr<std::atomic<bool>> cancelled_;
};

}  // namespace walkplan
