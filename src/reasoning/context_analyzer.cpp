#include "reasoning/context_analyzer.hpp"

#include <cmath>

#include "core/math.hpp"
#include "core/timestamp.hpp"

namespace pwr_agent::reasoning {

namespace {

constexpr float kBatteryWeight = 0.50F;
constexpr float kDemandWeight = 0.20F;
constexpr float kActivityWeight = 0.15F;
constexpr float kSourceWeight = 0.15F;

float battery_severity(const model::battery_level level) noexcept {
  switch (level) {
    case model::battery_level::CRITICAL:
      return 1.0F;
    case model::battery_level::LOW:
      return 0.75F;
    case model::battery_level::MEDIUM:
      return 0.5F;
    case model::battery_level::HIGH:
      return 0.25F;
    case model::battery_level::FULL:
      return 0.0F;
  }
  return 0.5F;
}

float demand_severity(const model::performance_demand demand) noexcept {
  return static_cast<float>(static_cast<std::uint8_t>(demand)) / 3.0F;
}

float activity_severity(const model::user_activity activity) noexcept {
  return static_cast<float>(static_cast<std::uint8_t>(activity)) / 2.0F;
}

}  // namespace

ContextAnalyzer::ContextAnalyzer(core::ContextConfig config) noexcept : config_(config) {}

model::context_state ContextAnalyzer::analyze(const model::system_snapshot& snapshot,
                                              const SnapshotWindow& recent_history) const noexcept {
  model::context_state context{};
  context.timestamp_ms = snapshot.timestamp_ms;
  context.hour_of_day = core::local_hour_of_day(snapshot.timestamp_ms);
  context.source = classify_power_source(snapshot.power_plugged, snapshot.battery_power_draw);
  context.battery = classify_battery(snapshot.battery_percent, context.source);
  context.demand = classify_demand(snapshot.cpu_percent, snapshot.gpu_percent);
  context.activity = classify_activity(snapshot, recent_history, context.hour_of_day);
  context.context_score = context_score(context.battery, context.demand, context.activity, context.source);
  return context;
}

model::battery_level ContextAnalyzer::classify_battery(const float battery_percent,
                                                       const model::power_source source) const noexcept {
  if (battery_percent <= config_.critical_battery_pct) {
    return model::battery_level::CRITICAL;
  }
  if (battery_percent <= config_.low_battery_pct) {
    return model::battery_level::LOW;
  }
  if (battery_percent <= config_.medium_battery_pct) {
    return model::battery_level::MEDIUM;
  }
  // A pack only reports full while it is topped up from the wall.
  if (battery_percent >= config_.full_battery_pct && source == model::power_source::PLUGGED) {
    return model::battery_level::FULL;
  }
  return model::battery_level::HIGH;
}

model::performance_demand ContextAnalyzer::classify_demand(const float cpu_percent,
                                                           const float gpu_percent) const noexcept {
  const float total = cpu_percent + gpu_percent;
  if (total > config_.heavy_demand_pct) {
    return model::performance_demand::HEAVY;
  }
  if (total > config_.moderate_demand_pct) {
    return model::performance_demand::MODERATE;
  }
  if (total > config_.light_demand_pct) {
    return model::performance_demand::LIGHT;
  }
  return model::performance_demand::IDLE;
}

model::power_source ContextAnalyzer::classify_power_source(const bool plugged, const float power_draw_w) const noexcept {
  if (std::fabs(power_draw_w) > config_.power_draw_deadband_w) {
    const bool charging = power_draw_w < 0.0F;
    if (charging != plugged) {
      return charging ? model::power_source::PLUGGED : model::power_source::BATTERY;
    }
  }
  return plugged ? model::power_source::PLUGGED : model::power_source::BATTERY;
}

model::user_activity ContextAnalyzer::classify_activity(const model::system_snapshot& snapshot,
                                                        const SnapshotWindow& recent_history,
                                                        const std::uint8_t hour_of_day) const noexcept {
  if (near_zero_activity(snapshot)) {
    std::uint64_t quiet_since_ms = snapshot.timestamp_ms;
    for (auto it = recent_history.rbegin(); it != recent_history.rend(); ++it) {
      if (it->timestamp_ms > snapshot.timestamp_ms) {
        continue;
      }
      if (!near_zero_activity(*it)) {
        break;
      }
      quiet_since_ms = it->timestamp_ms;
    }

    const auto away_after_ms = static_cast<std::uint64_t>(config_.away_after.count());
    if (snapshot.timestamp_ms - quiet_since_ms >= away_after_ms) {
      return model::user_activity::AWAY;
    }
  }

  const float scale = is_night(hour_of_day) ? 2.0F : 1.0F;
  if (snapshot.cpu_percent < config_.idle_cpu_pct * scale && snapshot.target_app_cpu < config_.idle_app_cpu_pct * scale) {
    return model::user_activity::IDLE;
  }
  return model::user_activity::ACTIVE;
}

float ContextAnalyzer::context_score(const model::battery_level battery, const model::performance_demand demand,
                                     const model::user_activity activity, const model::power_source source) noexcept {
  const float source_severity = source == model::power_source::BATTERY ? 1.0F : 0.0F;
  const float weighted = (kBatteryWeight * battery_severity(battery)) + (kDemandWeight * demand_severity(demand)) +
                         (kActivityWeight * activity_severity(activity)) + (kSourceWeight * source_severity);
  return core::clamp_range(3.0F * weighted, 0.0F, 3.0F);
}

bool ContextAnalyzer::near_zero_activity(const model::system_snapshot& snapshot) const noexcept {
  return snapshot.cpu_percent < config_.near_zero_cpu_pct && snapshot.target_app_cpu < config_.near_zero_app_cpu_pct;
}

bool ContextAnalyzer::is_night(const std::uint8_t hour_of_day) const noexcept {
  if (config_.night_start_hour <= config_.night_end_hour) {
    return hour_of_day >= config_.night_start_hour && hour_of_day <= config_.night_end_hour;
  }
  return hour_of_day >= config_.night_start_hour || hour_of_day <= config_.night_end_hour;
}

}  // namespace pwr_agent::reasoning
