#ifndef FORK_JOIN_H_
#define FORK_JOIN_H_

#include <algorithm>
#include <cstddef>
#include <exception>
#include <thread>
#include <vector>

#include <glog/logging.h>
#include <absl/status/status.h>
#include <absl/strings/str_cat.h>

namespace layup {

// Calls fn(i) for every i in [0, count) across up to num_threads workers and
// returns once they have all finished. Worker k takes k, k + n, k + 2n, ...
//
// fn must only write to state owned by index i; the join is the only
// synchronisation.
template<typename Function>
void ForkJoin(size_t num_threads, size_t count, const Function &fn) {
  if (count == 0)
    return;
  size_t num_workers = std::max<size_t>(1, std::min(num_threads, count));
  if (num_workers == 1) {
    for (size_t i = 0; i < count; ++i) {
      fn(i);
    }
    return;
  }

  VLOG(2) << "Forking " << num_workers << " workers over " << count
          << " items";
  std::vector<std::thread> workers;
  workers.reserve(num_workers);
  for (size_t k = 0; k < num_workers; ++k) {
    workers.emplace_back([&fn, k, num_workers, count]() {
      for (size_t i = k; i < count; i += num_workers) {
        fn(i);
      }
    });
  }
  for (auto &worker : workers) {
    worker.join();
  }
}

// As ForkJoin, for an fn returning absl::Status. A std::exception escaping
// fn(i) becomes an Internal status for i. Returns the first failure in index
// order, once every index has run.
template<typename Function>
absl::Status ForkJoinWithStatus(size_t num_threads, size_t count,
                                const Function &fn) {
  std::vector<absl::Status> statuses(count);
  ForkJoin(num_threads, count, [&](size_t i) {
    try {
      statuses[i] = fn(i);
    } catch (const std::exception &e) {
      statuses[i] = absl::InternalError(
          absl::StrCat("Item ", i, " failed: ", e.what()));
    }
  });
  for (const absl::Status &status : statuses) {
    if (!status.ok())
      return status;
  }
  return absl::OkStatus();
}

}  // namespace layup

#endif  // FORK_JOIN_H_
