#include <tollgate/routing/agent_router.hpp>
#include <tollgate/routing/load_slot.hpp>

#include <utility>

namespace tollgate::routing {

load_slot::load_slot(agent_router& router,
                     std::size_t index,
                     std::string agent_id)
    : router_{&router}, index_{index}, agent_id_{std::move(agent_id)} {}

load_slot::~load_slot() { release(); }

load_slot::load_slot(load_slot&& other) noexcept
    : router_{std::exchange(other.router_, nullptr)},
      index_{other.index_},
      agent_id_{std::move(other.agent_id_)} {}

load_slot& load_slot::operator=(load_slot&& other) noexcept {
  if (this != &other) {
    release();
    router_ = std::exchange(other.router_, nullptr);
    index_ = other.index_;
    agent_id_ = std::move(other.agent_id_);
  }
  return *this;
}

void load_slot::release() {
  if (router_ != nullptr) {
    std::exchange(router_, nullptr)->release(index_);
  }
}

}  // namespace tollgate::routing
