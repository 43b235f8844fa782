#pragma once

#include <cstddef>
#include <string>

namespace tollgate::routing {

class agent_router;

/// Reservation of one in-flight unit on an agent.
///
/// Move-only. The reservation is returned to the router when the slot is
/// destroyed or released, on every exit path.
class load_slot final {
 public:
  load_slot(agent_router& router, std::size_t index, std::string agent_id);
  ~load_slot();

  load_slot(const load_slot&) = delete;
  load_slot& operator=(const load_slot&) = delete;
  load_slot(load_slot&& other) noexcept;
  load_slot& operator=(load_slot&& other) noexcept;

  const std::string& agent_id() const { return agent_id_; }
  std::size_t index() const { return index_; }
  bool held() const { return router_ != nullptr; }

  void release();

 private:
  agent_router* router_{nullptr};
  std::size_t index_{};
  std::string agent_id_;
};

}  // namespace tollgate::routing
