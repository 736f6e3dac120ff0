#include "sinks/stdout_debug.hpp"

#include <cstdio>

namespace pwr_agent::sinks {

void StdoutDebugSink::publish(const control::ControllerStatus& status) const {
  std::printf("[status] state=%s mode=%s battery=%.1f score=%.2f severity=%s source=%s active=%zu savings=%.1f "
              "satisfaction=%.2f stale=%zu stuck=%zu\n",
              control::to_string(status.state), model::to_string(status.mode), status.battery_percent,
              status.context_score, model::to_string(status.last_severity), model::to_string(status.last_source),
              status.active_count, status.aggregate_savings, status.running_satisfaction, status.stale_snapshots,
              status.stuck_actions);
}

}  // namespace pwr_agent::sinks
