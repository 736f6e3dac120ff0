#pragma once

#include <mutex>
#include <optional>

#include "model/snapshot.hpp"

namespace pwr_agent::monitor {

// Read side of a snapshot producer. Must never block on sampling.
class Monitor {
 public:
  virtual ~Monitor() = default;

  [[nodiscard]] virtual std::optional<model::system_snapshot> latest_snapshot() const = 0;
};

// Single-slot, last-write-wins hand-off between a producer thread and the
// control loop.
class SnapshotCell final : public Monitor {
 public:
  void publish(const model::system_snapshot& snapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    latest_ = snapshot;
  }

  [[nodiscard]] std::optional<model::system_snapshot> latest_snapshot() const override {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_;
  }

 private:
  mutable std::mutex mutex_{};
  std::optional<model::system_snapshot> latest_{};
};

}  // namespace pwr_agent::monitor
