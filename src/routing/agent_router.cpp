#include <tollgate/common/clock.hpp>
#include <tollgate/routing/agent_router.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <utility>

namespace tollgate::routing {

namespace {

bool is_eligible(const tollgate::schema::agent_descriptor_t& agent) {
  return !agent.isolated &&
         agent.health == tollgate::schema::agent_health_t::healthy &&
         agent.load < agent.max_in_flight;
}

routing_outcome make_failure(std::optional<std::string> agent_id,
                             const tollgate::schema::error_code code,
                             std::string reason) {
  auto outcome = routing_outcome{};
  outcome.success = false;
  outcome.agent_id = std::move(agent_id);
  auto failure = tollgate::schema::execution_failure_t{};
  failure.code = code;
  failure.reason = std::move(reason);
  outcome.failure = std::move(failure);
  return outcome;
}

}  // namespace

agent_router::agent_router(std::vector<agent_registration> registrations,
                           poll_policy policy)
    : poll_policy_{policy} {
  agents_.reserve(registrations.size());
  for (auto& registration : registrations) {
    if (!registration.executor) {
      spdlog::warn("agent {} registered without an executor, skipping",
                   registration.agent_id);
      continue;
    }
    if (find_agent(registration.agent_id)) {
      spdlog::warn("duplicate agent id {}, keeping the first registration",
                   registration.agent_id);
      continue;
    }
    auto entry = agent_entry{};
    entry.descriptor.agent_id = registration.agent_id;
    entry.descriptor.capabilities = registration.capabilities;
    entry.descriptor.max_in_flight = std::max(1u, registration.max_in_flight);
    entry.executor = std::move(registration.executor);
    auto index = agents_.size();
    for (const auto& capability : entry.descriptor.capabilities) {
      routes_[capability].push_back(index);
    }
    spdlog::info("agent {} registered ({} capabilities, max_in_flight {})",
                 entry.descriptor.agent_id, entry.descriptor.capabilities.size(),
                 entry.descriptor.max_in_flight);
    agents_.push_back(std::move(entry));
  }
}

std::optional<tollgate::schema::agent_descriptor_t> agent_router::select(
    std::string_view kind) const {
  auto lock = std::scoped_lock{mutex_};
  auto index = find_eligible(kind);
  if (!index) {
    return std::nullopt;
  }
  return agents_[*index].descriptor;
}

std::optional<load_slot> agent_router::acquire(std::string_view kind) {
  auto lock = std::scoped_lock{mutex_};
  auto index = find_eligible(kind);
  if (!index) {
    spdlog::debug("no eligible agent for {}", kind);
    return std::nullopt;
  }
  auto& agent = agents_[*index].descriptor;
  ++agent.load;
  spdlog::debug("agent {} reserved for {} (load {}/{})", agent.agent_id, kind,
                agent.load, agent.max_in_flight);
  return std::optional<load_slot>{std::in_place, *this, *index,
                                  agent.agent_id};
}

routing_outcome agent_router::execute(
    const tollgate::schema::command_t& command) {
  auto slot = acquire(command.kind);
  if (!slot) {
    return make_failure(std::nullopt,
                        tollgate::schema::error_code::no_available_agent,
                        "no_available_agent");
  }
  return execute(command, std::move(*slot));
}

routing_outcome agent_router::execute(
    const tollgate::schema::command_t& command,
    load_slot slot) {
  auto executor = std::shared_ptr<capability_executor>{};
  {
    auto lock = std::scoped_lock{mutex_};
    executor = agents_[slot.index()].executor;
  }

  auto status = job_status{};
  try {
    status = executor->execute(command.kind, command.parameters);
    if (std::holds_alternative<job_pending>(status)) {
      auto poller = job_poller{*executor, poll_policy_, timer_};
      status = poller.run(std::move(status));
    }
  } catch (const std::exception& e) {
    status = job_failed{std::string{"executor raised: "} + e.what()};
  } catch (...) {
    status = job_failed{"executor raised a non-standard exception"};
  }

  return std::visit(
      overloaded{
          [&](const job_done& done) {
            record_success(slot.index());
            auto outcome = routing_outcome{};
            outcome.success = true;
            outcome.agent_id = slot.agent_id();
            outcome.result = done.result;
            return outcome;
          },
          [&](const job_failed& failed) {
            record_failure(slot.index(), failed.error);
            spdlog::error("agent {} failed {} for {}: {}", slot.agent_id(),
                          command.kind, command.execution_id, failed.error);
            return make_failure(slot.agent_id(), failed.code, failed.error);
          },
          [&](const job_pending& pending) {
            record_failure(slot.index(), "remote job left pending");
            return make_failure(slot.agent_id(),
                                tollgate::schema::error_code::executor_failure,
                                "remote job " + pending.remote_job_id +
                                    " left pending");
          },
      },
      status);
}

bool agent_router::rehabilitate(std::string_view agent_id) {
  auto lock = std::scoped_lock{mutex_};
  auto index = find_agent(agent_id);
  if (!index) {
    return false;
  }
  auto& agent = agents_[*index].descriptor;
  agent.isolated = false;
  agent.health = tollgate::schema::agent_health_t::healthy;
  agent.last_error.reset();
  spdlog::info("agent {} rehabilitated", agent_id);
  return true;
}

bool agent_router::isolate(std::string_view agent_id, std::string_view reason) {
  auto lock = std::scoped_lock{mutex_};
  auto index = find_agent(agent_id);
  if (!index) {
    return false;
  }
  auto& agent = agents_[*index].descriptor;
  agent.isolated = true;
  agent.last_error = std::string{reason};
  spdlog::warn("agent {} isolated: {}", agent_id, reason);
  return true;
}

std::vector<tollgate::schema::agent_descriptor_t> agent_router::snapshot()
    const {
  auto lock = std::scoped_lock{mutex_};
  auto agents = std::vector<tollgate::schema::agent_descriptor_t>{};
  agents.reserve(agents_.size());
  for (const auto& entry : agents_) {
    agents.push_back(entry.descriptor);
  }
  return agents;
}

void agent_router::cancel() { timer_.cancel(); }

std::optional<std::size_t> agent_router::find_eligible(
    std::string_view kind) const {
  auto route = routes_.find(kind);
  if (route == std::end(routes_)) {
    return std::nullopt;
  }
  for (const auto index : route->second) {
    if (is_eligible(agents_[index].descriptor)) {
      return index;
    }
  }
  return std::nullopt;
}

std::optional<std::size_t> agent_router::find_agent(
    std::string_view agent_id) const {
  for (auto i = std::size_t{0}; i < agents_.size(); ++i) {
    if (agents_[i].descriptor.agent_id == agent_id) {
      return i;
    }
  }
  return std::nullopt;
}

void agent_router::release(const std::size_t index) {
  auto lock = std::scoped_lock{mutex_};
  auto& agent = agents_[index].descriptor;
  if (agent.load > 0) {
    --agent.load;
  }
}

void agent_router::record_success(const std::size_t index) {
  auto lock = std::scoped_lock{mutex_};
  auto& agent = agents_[index].descriptor;
  agent.health = tollgate::schema::agent_health_t::healthy;
  ++agent.success_count;
  agent.last_error.reset();
}

void agent_router::record_failure(const std::size_t index,
                                  const std::string& reason) {
  auto lock = std::scoped_lock{mutex_};
  auto& agent = agents_[index].descriptor;
  agent.health = tollgate::schema::agent_health_t::unhealthy;
  agent.isolated = true;
  ++agent.failure_count;
  agent.last_error = reason;
  spdlog::warn("agent {} marked unhealthy and isolated: {}", agent.agent_id,
               reason);
}

}  // namespace tollgate::routing
