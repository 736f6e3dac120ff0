#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "model/optimization_action.hpp"
#include "reasoning/classifier.hpp"
#include "reasoning/context_analyzer.hpp"

namespace pwr_agent::learning {

// Label assigned to synthetic samples. Plugged machines need nothing;
// otherwise severity follows the battery band, raised by a busy cpu or
// memory inside the low band.
model::severity bootstrap_label(float battery_percent, float cpu_percent, float memory_percent, bool plugged) noexcept;

// Deterministic for a given seed.
std::vector<reasoning::TrainingSample> generate_bootstrap(std::size_t count, std::uint32_t seed,
                                                          const reasoning::ContextAnalyzer& analyzer);

}  // namespace pwr_agent::learning
