#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace tollgate::routing {

/// Interruptible sleep shared by every poll loop of one router.
class cancellable_timer final {
 public:
  /// Wait for `duration`. Returns false when cancelled before it elapsed.
  bool wait_for(std::chrono::milliseconds duration);

  /// Wake every waiter; later waits return immediately.
  void cancel();

  bool cancelled() const;

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  bool cancelled_{false};
};

}  // namespace tollgate::routing
