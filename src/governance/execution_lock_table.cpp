#include <tollgate/governance/execution_lock_table.hpp>

#include <iterator>
#include <utility>

namespace tollgate::governance {

namespace {

constexpr auto kPruneInterval = std::size_t{1024};

}  // namespace

execution_lock_table::guard::guard(std::shared_ptr<std::mutex> mutex)
    : mutex_{std::move(mutex)}, lock_{*mutex_} {}

execution_lock_table::guard execution_lock_table::lock(
    std::string_view execution_id) {
  auto mutex = std::shared_ptr<std::mutex>{};
  {
    auto lock = std::scoped_lock{mutex_};
    if (++acquisitions_ % kPruneInterval == 0) {
      prune();
    }
    auto it = locks_.find(execution_id);
    if (it != std::end(locks_)) {
      mutex = it->second.lock();
    }
    if (!mutex) {
      mutex = std::make_shared<std::mutex>();
      locks_.insert_or_assign(std::string{execution_id}, mutex);
    }
  }
  return guard{std::move(mutex)};
}

std::size_t execution_lock_table::size() const {
  auto lock = std::scoped_lock{mutex_};
  return locks_.size();
}

void execution_lock_table::prune() {
  for (auto it = std::begin(locks_); it != std::end(locks_);) {
    if (it->second.expired()) {
      it = locks_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace tollgate::governance
