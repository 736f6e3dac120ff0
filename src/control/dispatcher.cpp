#include "control/dispatcher.hpp"

#include <exception>
#include <thread>
#include <utility>

namespace pwr_agent::control {

Dispatcher::Dispatcher(core::ActuationConfig config) noexcept : config_(config) {}

template <typename Call>
model::action_result Dispatcher::with_retry(Call&& call, std::uint32_t& attempts) const {
  model::action_result result{false, "not attempted"};
  const std::uint32_t max_attempts = config_.max_retries + 1;
  auto backoff = config_.backoff;

  for (std::uint32_t attempt = 0; attempt < max_attempts; ++attempt) {
    if (attempt > 0 && backoff.count() > 0) {
      std::this_thread::sleep_for(backoff);
      backoff *= 2;
    }
    ++attempts;
    try {
      result = call();
    } catch (const std::exception& error) {
      result = {false, error.what()};
    }
    if (result.success) {
      return result;
    }
  }
  return result;
}

model::action_result Dispatcher::apply(actuators::Actuator& actuator, const model::optimization_action& action,
                                       std::uint32_t& attempts) const {
  return with_retry([&] { return actuator.apply(action); }, attempts);
}

model::action_result Dispatcher::revert(actuators::Actuator& actuator, const std::string& action_id,
                                        std::uint32_t& attempts) const {
  return with_retry([&] { return actuator.revert(action_id); }, attempts);
}

DispatchResult Dispatcher::run(actuators::Actuator& actuator, const DispatchJob& job) const {
  DispatchResult result{};

  if (job.kind == job_kind::REVERT || job.kind == job_kind::REPLACE) {
    const model::action_result reverted = revert(actuator, job.previous.id, result.attempts);
    result.revert_ok = reverted.success;
    result.message = reverted.message;
    if (!reverted.success) {
      // A replacement never stacks a second action on an unreverted target.
      result.apply_ok = false;
      return result;
    }
  }

  if (job.kind == job_kind::ISSUE || job.kind == job_kind::REPLACE) {
    const model::action_result applied = apply(actuator, job.next, result.attempts);
    result.apply_ok = applied.success;
    result.message = applied.message;
  }
  return result;
}

}  // namespace pwr_agent::control
