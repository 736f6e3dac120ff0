#pragma once

#include <cstdint>
#include <type_traits>

namespace pwr_agent::model {

// Bits set in system_snapshot::unavailable when the producer substituted a
// default because the metric could not be read.
enum metric_flag : std::uint32_t {
    METRIC_BATTERY = 1U << 0U,
    METRIC_POWER_DRAW = 1U << 1U,
    METRIC_CPU = 1U << 2U,
    METRIC_CPU_FREQ = 1U << 3U,
    METRIC_MEMORY = 1U << 4U,
    METRIC_GPU = 1U << 5U,
    METRIC_NETWORK = 1U << 6U,
    METRIC_DISK = 1U << 7U,
    METRIC_BRIGHTNESS = 1U << 8U,
    METRIC_PROCESSES = 1U << 9U,
    METRIC_TARGET_APP = 1U << 10U,
    METRIC_POWER_SOURCE = 1U << 11U,
};

// One Monitor sample. Immutable once published.
// POD layout: one timestamp + packed metrics + substitution mask.
struct system_snapshot {
    std::uint64_t timestamp_ms;

    float battery_percent;
    // Watts. Positive while discharging, negative while charging.
    float battery_power_draw;
    float cpu_percent;
    float cpu_freq_mhz;
    float memory_percent;
    float gpu_percent;
    float gpu_memory_percent;

    std::uint64_t network_bytes_sent;
    std::uint64_t network_bytes_recv;
    std::uint64_t disk_io_read;
    std::uint64_t disk_io_write;

    float screen_brightness;
    std::uint32_t active_process_count;
    float target_app_cpu;
    float target_app_memory;

    bool power_plugged;

    std::uint32_t unavailable;
};

static_assert(std::is_standard_layout_v<system_snapshot>, "system_snapshot must be standard layout");
static_assert(std::is_trivial_v<system_snapshot>, "system_snapshot must be trivial");

} // namespace pwr_agent::model
