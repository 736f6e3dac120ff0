#include "learning/bootstrap.hpp"

#include <random>

#include "reasoning/features.hpp"

namespace pwr_agent::learning {

model::severity bootstrap_label(const float battery_percent, const float cpu_percent, const float memory_percent,
                                const bool plugged) noexcept {
  if (plugged) {
    return model::severity::NONE;
  }
  if (battery_percent < 15.0F) {
    return model::severity::AGGRESSIVE;
  }
  if (battery_percent < 30.0F) {
    return (cpu_percent > 70.0F || memory_percent > 80.0F) ? model::severity::MODERATE : model::severity::LIGHT;
  }
  if (battery_percent < 60.0F) {
    return cpu_percent > 90.0F ? model::severity::LIGHT : model::severity::NONE;
  }
  return model::severity::NONE;
}

std::vector<reasoning::TrainingSample> generate_bootstrap(const std::size_t count, const std::uint32_t seed,
                                                          const reasoning::ContextAnalyzer& analyzer) {
  constexpr float kBytesPerMiB = 1024.0F * 1024.0F;

  std::mt19937 rng(seed);
  std::uniform_real_distribution<float> battery(5.0F, 100.0F);
  std::uniform_real_distribution<float> cpu(0.0F, 100.0F);
  std::uniform_real_distribution<float> memory(20.0F, 95.0F);
  std::uniform_real_distribution<float> gpu(0.0F, 80.0F);
  std::uniform_real_distribution<float> network_mib(0.0F, 100.0F);
  std::uniform_real_distribution<float> brightness(10.0F, 100.0F);
  std::uniform_int_distribution<int> hour(0, 23);
  std::uniform_int_distribution<int> plugged(0, 1);
  std::uniform_real_distribution<float> app_cpu(0.0F, 50.0F);
  std::uniform_real_distribution<float> app_memory(0.0F, 30.0F);

  const reasoning::SnapshotWindow no_history;
  std::vector<reasoning::TrainingSample> samples;
  samples.reserve(count);

  for (std::size_t i = 0; i < count; ++i) {
    model::system_snapshot snapshot{};
    snapshot.battery_percent = battery(rng);
    snapshot.cpu_percent = cpu(rng);
    snapshot.memory_percent = memory(rng);
    snapshot.gpu_percent = gpu(rng);
    snapshot.network_bytes_recv = static_cast<std::uint64_t>(network_mib(rng) * kBytesPerMiB);
    snapshot.screen_brightness = brightness(rng);
    const auto hour_of_day = static_cast<std::uint8_t>(hour(rng));
    snapshot.power_plugged = plugged(rng) == 1;
    snapshot.target_app_cpu = app_cpu(rng);
    snapshot.target_app_memory = app_memory(rng);
    snapshot.battery_power_draw = snapshot.power_plugged ? -5.0F : 10.0F;

    model::context_state context{};
    context.hour_of_day = hour_of_day;
    context.source = analyzer.classify_power_source(snapshot.power_plugged, snapshot.battery_power_draw);
    context.battery = analyzer.classify_battery(snapshot.battery_percent, context.source);
    context.demand = analyzer.classify_demand(snapshot.cpu_percent, snapshot.gpu_percent);
    context.activity = analyzer.classify_activity(snapshot, no_history, hour_of_day);
    context.context_score =
        reasoning::ContextAnalyzer::context_score(context.battery, context.demand, context.activity, context.source);

    reasoning::TrainingSample sample{};
    sample.features = reasoning::extract_features(snapshot, context);
    sample.label = bootstrap_label(snapshot.battery_percent, snapshot.cpu_percent, snapshot.memory_percent,
                                   snapshot.power_plugged);
    samples.push_back(sample);
  }
  return samples;
}

}  // namespace pwr_agent::learning
