#include <tollgate/routing/cancellable_timer.hpp>

namespace tollgate::routing {

bool cancellable_timer::wait_for(const std::chrono::milliseconds duration) {
  auto lock = std::unique_lock{mutex_};
  return !condition_.wait_for(lock, duration, [this] { return cancelled_; });
}

void cancellable_timer::cancel() {
  {
    auto lock = std::scoped_lock{mutex_};
    cancelled_ = true;
  }
  condition_.notify_all();
}

bool cancellable_timer::cancelled() const {
  auto lock = std::scoped_lock{mutex_};
  return cancelled_;
}

}  // namespace tollgate::routing
