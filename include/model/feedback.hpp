#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "model/optimization_action.hpp"
#include "model/snapshot.hpp"

namespace pwr_agent::model {

enum class decision_source : std::uint8_t {
    RULE = 0,
    LEARNED = 1,
    EMERGENCY = 2,
};

struct feedback_record {
    float satisfaction{0.0F};
    bool performance_acceptable{true};
    bool battery_improvement{false};
    std::string comments{};
    std::string decision_id{};
    std::uint64_t timestamp_ms{0};
};

struct decision_outcome {
    std::string decision_id{};
    system_snapshot snapshot{};
    float context_score{0.0F};
    severity decided{severity::NONE};
    decision_source source{decision_source::RULE};
    std::vector<std::string> actions_applied{};
    float observed_savings{0.0F};
    float observed_satisfaction{0.0F};
    std::uint64_t timestamp_ms{0};
};

inline constexpr const char* to_string(const decision_source source) noexcept {
    switch (source) {
        case decision_source::RULE:
            return "rule";
        case decision_source::LEARNED:
            return "learned";
        case decision_source::EMERGENCY:
            return "emergency";
    }
    return "unknown";
}

} // namespace pwr_agent::model
