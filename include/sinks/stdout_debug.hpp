#pragma once

#include "control/status.hpp"

namespace pwr_agent::sinks {

class StdoutDebugSink {
 public:
  void publish(const control::ControllerStatus& status) const;
};

}  // namespace pwr_agent::sinks
