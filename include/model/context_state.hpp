#pragma once

#include <cstdint>

namespace pwr_agent::model {

enum class battery_level : std::uint8_t {
    CRITICAL = 0,
    LOW = 1,
    MEDIUM = 2,
    HIGH = 3,
    FULL = 4,
};

enum class performance_demand : std::uint8_t {
    IDLE = 0,
    LIGHT = 1,
    MODERATE = 2,
    HEAVY = 3,
};

enum class user_activity : std::uint8_t {
    ACTIVE = 0,
    IDLE = 1,
    AWAY = 2,
};

enum class power_source : std::uint8_t {
    BATTERY = 0,
    PLUGGED = 1,
};

struct context_state {
    battery_level battery{battery_level::MEDIUM};
    performance_demand demand{performance_demand::IDLE};
    user_activity activity{user_activity::ACTIVE};
    power_source source{power_source::BATTERY};
    // Weighted severity of the fields above, in [0, 3].
    float context_score{0.0F};
    std::uint8_t hour_of_day{0};
    std::uint64_t timestamp_ms{0};
};

inline constexpr const char* to_string(const battery_level level) noexcept {
    switch (level) {
        case battery_level::CRITICAL:
            return "critical";
        case battery_level::LOW:
            return "low";
        case battery_level::MEDIUM:
            return "medium";
        case battery_level::HIGH:
            return "high";
        case battery_level::FULL:
            return "full";
    }
    return "unknown";
}

inline constexpr const char* to_string(const performance_demand demand) noexcept {
    switch (demand) {
        case performance_demand::IDLE:
            return "idle";
        case performance_demand::LIGHT:
            return "light";
        case performance_demand::MODERATE:
            return "moderate";
        case performance_demand::HEAVY:
            return "heavy";
    }
    return "unknown";
}

inline constexpr const char* to_string(const user_activity activity) noexcept {
    switch (activity) {
        case user_activity::ACTIVE:
            return "active";
        case user_activity::IDLE:
            return "idle";
        case user_activity::AWAY:
            return "away";
    }
    return "unknown";
}

inline constexpr const char* to_string(const power_source source) noexcept {
    return source == power_source::PLUGGED ? "plugged" : "battery";
}

} // namespace pwr_agent::model
