#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace pwr_agent::model {

enum class action_type : std::uint8_t {
    CPU_THROTTLE = 0,
    BRIGHTNESS_ADJUST = 1,
    NETWORK_LIMIT = 2,
    APP_THROTTLE = 3,
    PROCESS_PRIORITY = 4,
};

// Ordinal optimization aggressiveness.
enum class severity : std::uint8_t {
    NONE = 0,
    LIGHT = 1,
    MODERATE = 2,
    AGGRESSIVE = 3,
};

inline constexpr std::size_t kSeverityClasses = 4;

enum class mode_name : std::uint8_t {
    CONSERVATIVE = 0,
    BALANCED = 1,
    AGGRESSIVE = 2,
};

struct optimization_mode {
    mode_name name{mode_name::BALANCED};
    float max_intensity{0.6F};
    float min_confidence{0.7F};
};

struct optimization_action {
    std::string id{};
    action_type type{action_type::CPU_THROTTLE};
    float intensity{0.0F};
    std::string target_component{};
    // Percent of battery life.
    float estimated_savings{0.0F};
    float performance_impact{0.0F};
    float confidence{0.0F};
    std::uint64_t created_at_ms{0};
};

struct action_result {
    bool success{false};
    std::string message{};
};

inline constexpr const char* to_string(const action_type type) noexcept {
    switch (type) {
        case action_type::CPU_THROTTLE:
            return "cpu_throttle";
        case action_type::BRIGHTNESS_ADJUST:
            return "brightness_adjust";
        case action_type::NETWORK_LIMIT:
            return "network_limit";
        case action_type::APP_THROTTLE:
            return "app_throttle";
        case action_type::PROCESS_PRIORITY:
            return "process_priority";
    }
    return "unknown";
}

inline constexpr const char* to_string(const mode_name name) noexcept {
    switch (name) {
        case mode_name::CONSERVATIVE:
            return "conservative";
        case mode_name::BALANCED:
            return "balanced";
        case mode_name::AGGRESSIVE:
            return "aggressive";
    }
    return "unknown";
}

inline constexpr const char* to_string(const severity level) noexcept {
    switch (level) {
        case severity::NONE:
            return "none";
        case severity::LIGHT:
            return "light";
        case severity::MODERATE:
            return "moderate";
        case severity::AGGRESSIVE:
            return "aggressive";
    }
    return "unknown";
}

inline std::optional<action_type> parse_action_type(const std::string_view value) noexcept {
    for (std::uint8_t raw = 0; raw <= static_cast<std::uint8_t>(action_type::PROCESS_PRIORITY); ++raw) {
        const auto candidate = static_cast<action_type>(raw);
        if (value == to_string(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

inline std::optional<mode_name> parse_mode_name(const std::string_view value) noexcept {
    for (std::uint8_t raw = 0; raw <= static_cast<std::uint8_t>(mode_name::AGGRESSIVE); ++raw) {
        const auto candidate = static_cast<mode_name>(raw);
        if (value == to_string(candidate)) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace pwr_agent::model
