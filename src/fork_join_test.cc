#include "fork_join.h"

#include <atomic>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <absl/status/status.h>

namespace layup {
namespace {

TEST(ForkJoinTest, VisitsEveryIndexOnce) {
  std::vector<int> visits(1000, 0);
  ForkJoin(4, visits.size(), [&](size_t i) { visits[i] += 1; });
  for (size_t i = 0; i < visits.size(); ++i) {
    EXPECT_EQ(1, visits[i]) << "index " << i;
  }
}

TEST(ForkJoinTest, NothingToDo) {
  std::atomic<int> calls(0);
  ForkJoin(4, 0, [&](size_t) { ++calls; });
  EXPECT_EQ(0, calls.load());
}

TEST(ForkJoinTest, ZeroThreadsRunsInline) {
  std::thread::id caller = std::this_thread::get_id();
  std::vector<std::thread::id> ran_on(10);
  ForkJoin(0, ran_on.size(), [&](size_t i) {
    ran_on[i] = std::this_thread::get_id();
  });
  for (const auto &id : ran_on) {
    EXPECT_EQ(caller, id);
  }
}

TEST(ForkJoinTest, MoreThreadsThanWork) {
  std::vector<size_t> squares(3, 0);
  ForkJoin(16, squares.size(), [&](size_t i) { squares[i] = i * i; });
  EXPECT_EQ((std::vector<size_t>{0, 1, 4}), squares);
}

TEST(ForkJoinTest, ResultsAreIndependentOfThreadCount) {
  auto run = [](size_t threads) {
    std::vector<long> out(257);
    ForkJoin(threads, out.size(), [&](size_t i) {
      out[i] = static_cast<long>(i) * 3 - 7;
    });
    return out;
  };
  EXPECT_EQ(run(1), run(3));
  EXPECT_EQ(run(1), run(8));
}

TEST(ForkJoinWithStatusTest, AllSucceed) {
  std::vector<int> visits(100, 0);
  absl::Status status = ForkJoinWithStatus(4, visits.size(), [&](size_t i) {
    visits[i] += 1;
    return absl::OkStatus();
  });
  EXPECT_TRUE(status.ok());
  EXPECT_EQ(std::vector<int>(100, 1), visits);
}

TEST(ForkJoinWithStatusTest, FirstFailureByIndexWins) {
  absl::Status status = ForkJoinWithStatus(4, 50, [](size_t i) {
    if (i == 40)
      return absl::NotFoundError("forty");
    if (i == 9)
      return absl::InvalidArgumentError("nine");
    return absl::OkStatus();
  });
  EXPECT_EQ(absl::StatusCode::kInvalidArgument, status.code());
  EXPECT_EQ("nine", status.message());
}

TEST(ForkJoinWithStatusTest, ExceptionsBecomeInternalErrors) {
  std::vector<int> visits(20, 0);
  absl::Status status = ForkJoinWithStatus(
      3, visits.size(), [&](size_t i) -> absl::Status {
    visits[i] += 1;
    if (i == 7)
      throw std::runtime_error("degenerate ring");
    return absl::OkStatus();
  });
  EXPECT_EQ(absl::StatusCode::kInternal, status.code());
  EXPECT_THAT(std::string(status.message()),
              testing::HasSubstr("degenerate ring"));
  // The other workers are not cut short.
  EXPECT_EQ(std::vector<int>(20, 1), visits);
}

TEST(ForkJoinWithStatusTest, ExceptionsOnTheCallingThread) {
  absl::Status status = ForkJoinWithStatus(
      1, 3, [](size_t i) -> absl::Status {
    if (i == 1)
      throw std::length_error("too long");
    return absl::OkStatus();
  });
  EXPECT_EQ(absl::StatusCode::kInternal, status.code());
}

}  // namespace
}  // namespace layup
