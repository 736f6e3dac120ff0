#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "core/timestamp.hpp"
#include "model/snapshot.hpp"
#include "monitor/monitor.hpp"

namespace pwr_agent::monitor {

// Replays recorded snapshots from a JSON-lines file, one per sampling
// interval, stamping each with the current clock.
class ReplayMonitor final : public Monitor {
 public:
  ReplayMonitor(std::string path, std::chrono::milliseconds interval, bool loop, core::Clock clock = core::system_clock_ms());
  ~ReplayMonitor() override;

  ReplayMonitor(const ReplayMonitor&) = delete;
  ReplayMonitor& operator=(const ReplayMonitor&) = delete;

  // Loads the file and starts the producer thread. Throws
  // std::runtime_error if the file cannot be read or holds no snapshots.
  void start();
  void stop();

  [[nodiscard]] std::optional<model::system_snapshot> latest_snapshot() const override;

  [[nodiscard]] std::size_t frames_loaded() const noexcept { return frames_.size(); }
  [[nodiscard]] std::size_t unavailable_metrics() const noexcept { return unavailable_metrics_.load(); }

  // Parses JSON lines; blank lines and lines starting with '#' are skipped.
  static std::vector<model::system_snapshot> load_frames(const std::string& path);

 private:
  void run();
  bool publish_next();

  std::string path_;
  std::chrono::milliseconds interval_;
  bool loop_{true};
  core::Clock clock_;
  std::vector<model::system_snapshot> frames_{};
  std::size_t cursor_{0};
  SnapshotCell cell_{};
  std::atomic<std::size_t> unavailable_metrics_{0};
  std::mutex mutex_{};
  std::condition_variable wake_{};
  bool stopping_{false};
  std::thread worker_{};
};

}  // namespace pwr_agent::monitor
