#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>

#include "model/optimization_action.hpp"

namespace pwr_agent::core {

struct ModeLimits {
  float max_intensity{0.6F};
  float min_confidence{0.7F};
};

struct ContextConfig {
  float critical_battery_pct{5.0F};
  float low_battery_pct{30.0F};
  float medium_battery_pct{60.0F};
  float full_battery_pct{95.0F};
  float heavy_demand_pct{80.0F};
  float moderate_demand_pct{50.0F};
  float light_demand_pct{20.0F};
  float near_zero_cpu_pct{5.0F};
  float near_zero_app_cpu_pct{2.0F};
  std::chrono::milliseconds away_after{300000};
  float idle_cpu_pct{10.0F};
  float idle_app_cpu_pct{5.0F};
  std::uint8_t night_start_hour{23};
  std::uint8_t night_end_hour{6};
  float power_draw_deadband_w{0.5F};
};

struct DecisionConfig {
  float rule_confidence{0.75F};
  float probability_floor{0.55F};
  std::size_t min_model_samples{50};
  float emergency_confidence_boost{1.25F};
  float score_floor{0.75F};
  float interp_low{0.85F};
  float interp_high{1.15F};
  float aggressive_battery_pct{15.0F};
  float moderate_battery_pct{30.0F};
  float light_battery_pct{60.0F};
  float light_cpu_pct{70.0F};
  float min_brightness_for_dimming{20.0F};
  float critical_app_cpu_pct{20.0F};
  // Traffic above which an away machine also gets its network limited.
  float away_network_mib{1.0F};
};

struct PolicyConfig {
  std::size_t max_actions_per_cycle{3};
  float max_performance_impact{0.7F};
  float emergency_min_confidence{0.3F};
};

struct ActuationConfig {
  std::uint32_t max_retries{3};
  std::chrono::milliseconds backoff{50};
  std::chrono::milliseconds dispatch_timeout{250};
  float intensity_tolerance{0.05F};
};

struct LearnerConfig {
  std::size_t buffer_capacity{1000};
  std::size_t retrain_sample_threshold{20};
  std::chrono::milliseconds retrain_interval{3600000};
  std::size_t bootstrap_samples{1000};
  std::uint32_t bootstrap_seed{42};
  float accuracy_alpha{0.1F};
  float live_sample_weight{3.0F};
  std::size_t training_epochs{300};
  float learning_rate{0.5F};
  float l2_penalty{0.001F};
  std::size_t persist_every{10};
};

struct StoreConfig {
  std::string backend{"file"};
  std::string path{"/var/lib/pwr-agent"};
  std::string key_prefix{"pwr:agent"};
};

struct MonitorConfig {
  std::string replay_path{};
  bool loop{true};
};

struct RedisConfig {
  std::string host{"127.0.0.1"};
  std::uint16_t port{6379};
  std::string unix_socket{};
  bool enabled{false};
};

struct AgentConfig {
  std::chrono::milliseconds decision_interval{10000};
  std::chrono::milliseconds sampling_interval{2000};
  std::size_t history_window{300};
  model::mode_name mode{model::mode_name::BALANCED};
  // Indexed by model::mode_name.
  std::array<ModeLimits, 3> modes{{{0.3F, 0.8F}, {0.6F, 0.7F}, {0.9F, 0.6F}}};
  bool stdout_debug{true};
  bool publish_metrics{true};
  ContextConfig context{};
  DecisionConfig decision{};
  PolicyConfig policy{};
  ActuationConfig actuation{};
  LearnerConfig learner{};
  StoreConfig store{};
  MonitorConfig monitor{};
  RedisConfig redis{};
  std::unordered_map<std::string, bool> target_enabled{};
};

AgentConfig load_agent_config(const std::string& path);

model::optimization_mode mode_settings(const AgentConfig& config, model::mode_name name) noexcept;

}  // namespace pwr_agent::core
