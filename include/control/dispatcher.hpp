#pragma once

#include <cstdint>
#include <string>

#include "actuators/actuator.hpp"
#include "core/config.hpp"
#include "model/optimization_action.hpp"

namespace pwr_agent::control {

enum class job_kind : std::uint8_t {
  ISSUE,
  REVERT,
  // Revert the previous action, then issue the next one.
  REPLACE,
};

struct DispatchJob {
  job_kind kind{job_kind::ISSUE};
  std::string target{};
  model::optimization_action previous{};
  model::optimization_action next{};
};

struct DispatchResult {
  bool revert_ok{true};
  bool apply_ok{true};
  std::uint32_t attempts{0};
  std::string message{};
};

// Runs one job against an actuator, retrying each call with exponential
// backoff. Blocking; the controller runs jobs on futures.
class Dispatcher {
 public:
  explicit Dispatcher(core::ActuationConfig config = {}) noexcept;

  [[nodiscard]] DispatchResult run(actuators::Actuator& actuator, const DispatchJob& job) const;

  model::action_result apply(actuators::Actuator& actuator, const model::optimization_action& action,
                             std::uint32_t& attempts) const;
  model::action_result revert(actuators::Actuator& actuator, const std::string& action_id,
                              std::uint32_t& attempts) const;

 private:
  template <typename Call>
  model::action_result with_retry(Call&& call, std::uint32_t& attempts) const;

  core::ActuationConfig config_{};
};

}  // namespace pwr_agent::control
