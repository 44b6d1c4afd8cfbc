#include "util/retry.h"

#include <gtest/gtest.h>

#include <format>
#include <vector>

namespace walkplan {
namespace {

struct RecordingSleeper {
  std::vector<std::chrono::milliseconds> delays;

  Sleeper AsSleeper() {
    return [this](std::chrono::milliseconds d) { delays.push_back(d); };
  }
};

TEST(RetryWithBackoffTest, ReturnsFirstSuccess) {
  RecordingSleeper sleeper;
  int calls = 0;
  auto result = RetryWithBackoff(
      [&] {
        ++calls;
        return 42;
      },
      RetryPolicy{},
      Deadline::Never(),
      sleeper.AsSleeper()
  );
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(*result.value, 42);
  EXPECT_EQ(result.attempts, 1);
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(sleeper.delays.empty());
}

TEST(RetryWithBackoffTest, RetriesTransientErrorsWithExponentialBackoff) {
  RecordingSleeper sleeper;
  int calls = 0;
  auto result = RetryWithBackoff(
      [&]() -> int {
        if (++calls < 3) {
          throw std::runtime_error("connection reset");
        }
        return 7;
      },
      RetryPolicy{.max_attempts = 3, .initial_backoff = std::chrono::milliseconds{100}},
      Deadline::Never(),
      sleeper.AsSleeper()
  );
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(*result.value, 7);
  EXPECT_EQ(result.attempts, 3);
  ASSERT_EQ(sleeper.delays.size(), 2);
  EXPECT_EQ(sleeper.delays[0], std::chrono::milliseconds{100});
  EXPECT_EQ(sleeper.delays[1], std::chrono::milliseconds{200});
}

TEST(RetryWithBackoffTest, GivesUpAfterMaxAttempts) {
  RecordingSleeper sleeper;
  int calls = 0;
  auto result = RetryWithBackoff(
      [&]() -> int {
        ++calls;
        throw std::runtime_error(std::format("timeout {}", calls));
      },
      RetryPolicy{.max_attempts = 2},
      Deadline::Never(),
      sleeper.AsSleeper()
  );
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(calls, 2);
  EXPECT_EQ(result.attempts, 2);
  EXPECT_EQ(result.last_error, "timeout 2");
  EXPECT_EQ(sleeper.delays.size(), 1);
}

TEST(RetryWithBackoffTest, PermanentFailureStopsImmediately) {
  RecordingSleeper sleeper;
  int calls = 0;
  auto result = RetryWithBackoff(
      [&]() -> int {
        ++calls;
        throw PermanentFailure("no route");
      },
      RetryPolicy{.max_attempts = 5},
      Deadline::Never(),
      sleeper.AsSleeper()
  );
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(result.last_error, "no route");
  EXPECT_TRUE(sleeper.delays.empty());
}

TEST(RetryWithBackoffTest, CancelledDeadlineSkipsTheCall) {
  Deadline deadline = Deadline::Never();
  deadline.Cancel();
  int calls = 0;
  auto result = RetryWithBackoff(
      [&] { return ++calls; }, RetryPolicy{}, deadline, [](auto) {}
  );
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(calls, 0);
  EXPECT_EQ(result.attempts, 0);
}

TEST(BackoffDelayTest, CappedAtMaxBackoff) {
  RetryPolicy policy{
      .max_attempts = 10,
      .initial_backoff = std::chrono::milliseconds{500},
      .backoff_multiplier = 3.0,
      .max_backoff = std::chrono::milliseconds{2000},
  };
  EXPECT_EQ(BackoffDelay(policy, 1), std::chrono::milliseconds{500});
  EXPECT_EQ(BackoffDelay(policy, 2), std::chrono::milliseconds{1500});
  EXPECT_EQ(BackoffDelay(policy, 3), std::chrono::milliseconds{2000});
}

}  // namespace
}  // namespace walkplan
