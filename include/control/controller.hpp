#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "actuators/registry.hpp"
#include "control/dispatcher.hpp"
#include "control/status.hpp"
#include "core/config.hpp"
#include "core/timestamp.hpp"
#include "learning/feedback_learner.hpp"
#include "model/feedback.hpp"
#include "model/optimization_action.hpp"
#include "monitor/monitor.hpp"
#include "policy/policy_filter.hpp"
#include "reasoning/context_analyzer.hpp"
#include "reasoning/decision_engine.hpp"
#include "store/state_store.hpp"

namespace pwr_agent::control {

struct ActiveEntry {
  model::optimization_action action{};
  // EMERGENCY for actions issued under critical battery.
  model::decision_source issued_by{model::decision_source::RULE};
  // Last revert attempt failed; the action is still believed in effect.
  bool stuck{false};
};

// Owns the tick loop, the active-action map and the state machine. All
// commands and tick() are serialized; status() and active_actions() return
// copies and never wait on a tick.
class Controller {
 public:
  Controller(core::AgentConfig config, std::shared_ptr<monitor::Monitor> monitor,
             std::shared_ptr<actuators::ActuatorRegistry> actuators, std::shared_ptr<store::StateStore> store,
             std::shared_ptr<learning::FeedbackLearner> learner, core::Clock clock = core::system_clock_ms());
  ~Controller();

  Controller(const Controller&) = delete;
  Controller& operator=(const Controller&) = delete;

  // stopped -> running. Reloads the persisted active table, keeps entries
  // the actuators still report and reverts orphans. Never throws.
  void start();
  void tick();
  // Runs ticks at the decision interval. Zero runs until request_stop().
  ControllerStatus run_for_ticks(std::size_t total_ticks);
  void request_stop() noexcept { stop_requested_.store(true); }
  // any -> stopped. Reverts every active action.
  void shutdown();

  bool pause();
  bool resume();
  // Returns the number of actions reverted.
  std::size_t revert_all();
  std::size_t emergency_revert();
  void set_mode(model::mode_name mode);
  // Links to the latest decision when feedback.decision_id is empty.
  // Returns false when there is no decision to link to.
  bool submit_feedback(model::feedback_record feedback);

  [[nodiscard]] ControllerStatus status() const;
  [[nodiscard]] std::vector<model::optimization_action> active_actions() const;
  [[nodiscard]] controller_state state() const;

 private:
  struct PendingJob {
    DispatchJob job;
    model::decision_source source;
    std::future<DispatchResult> result;
  };

  void reload_active_table();
  void reconcile(const std::vector<model::optimization_action>& approved, model::decision_source source,
                 std::uint64_t now_ms);
  void dispatch(std::vector<DispatchJob> jobs, model::decision_source source, bool wait_all);
  void apply_result(const DispatchJob& job, model::decision_source source, const DispatchResult& result);
  void poll_pending(bool wait_all);
  void retry_stuck_reverts();
  std::size_t revert_all_locked();
  void transition(controller_state next, const char* reason);
  [[nodiscard]] bool has_emergency_entries() const noexcept;
  void record_outcome(const model::system_snapshot& snapshot, const model::context_state& context,
                      const reasoning::Decision& decision, model::decision_source source,
                      std::vector<std::string> issued, std::uint64_t now_ms);
  void persist_active_table();
  void publish_status();
  [[nodiscard]] std::string next_action_id(std::uint64_t now_ms);

  core::AgentConfig config_;
  std::shared_ptr<monitor::Monitor> monitor_;
  std::shared_ptr<actuators::ActuatorRegistry> actuators_;
  std::shared_ptr<store::StateStore> store_;
  std::shared_ptr<learning::FeedbackLearner> learner_;
  core::Clock clock_;

  reasoning::ContextAnalyzer analyzer_;
  reasoning::DecisionEngine engine_;
  policy::PolicyFilter filter_;
  Dispatcher dispatcher_;

  mutable std::mutex mutex_{};
  controller_state state_{controller_state::STOPPED};
  model::mode_name mode_{model::mode_name::BALANCED};
  reasoning::SnapshotWindow history_{};
  std::unordered_map<std::string, ActiveEntry> active_{};
  std::unordered_map<std::string, PendingJob> pending_{};
  // Target -> action whose apply failed after all retries; not reissued while the decision is unchanged.
  std::unordered_map<std::string, model::optimization_action> failed_applies_{};
  std::optional<float> previous_power_draw_{};
  std::uint64_t last_snapshot_ms_{0};
  std::uint64_t id_counter_{0};
  std::string last_decision_id_{};
  bool feed_was_ok_{true};
  bool table_dirty_{false};
  bool table_unread_{false};
  ControllerStatus counters_{};

  mutable std::mutex status_mutex_{};
  ControllerStatus status_{};
  std::vector<model::optimization_action> active_copy_{};

  std::atomic<bool> stop_requested_{false};
  std::chrono::steady_clock::time_point next_wakeup_{};
  bool first_tick_{true};
};

}  // namespace pwr_agent::control
