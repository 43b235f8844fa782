#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace tollgate::governance {

/// One mutex per execution_id, created on demand and dropped once unused.
class execution_lock_table final {
 public:
  class guard final {
   public:
    explicit guard(std::shared_ptr<std::mutex> mutex);

   private:
    std::shared_ptr<std::mutex> mutex_;
    std::unique_lock<std::mutex> lock_;
  };

  guard lock(std::string_view execution_id);

  std::size_t size() const;

 private:
  void prune();

  mutable std::mutex mutex_;
  std::map<std::string, std::weak_ptr<std::mutex>, std::less<>> locks_;
  std::size_t acquisitions_{};
};

}  // namespace tollgate::governance
