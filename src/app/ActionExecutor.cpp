#include "app/ActionExecutor.h"

#include "app/Log.h"

namespace {
constexpr const char* TAG = "ACT";
}

uint8_t ActionExecutor::lightsOn() {
  if (!lighting_) return 0;
  const uint8_t n = lighting_->activate();
  if (n > 0) {
    LOG_INFO(TAG, "activated %u emergency lights", (unsigned)n);
    if (observer_) observer_->onLightingChanged(true, lighting_->activeCount());
  }
  return n;
}

uint8_t ActionExecutor::lightsOff() {
  if (!lighting_) return 0;
  const uint8_t n = lighting_->deactivate();
  if (n > 0) {
    LOG_INFO(TAG, "emergency lighting deactivated (%u)", (unsigned)n);
    if (observer_) observer_->onLightingChanged(false, 0);
  }
  return n;
}

bool ActionExecutor::run(ActionKind kind, const std::string& description, const std::string& incidentId) {
  switch (kind) {
    case ActionKind::advisory:
      return true;
    case ActionKind::emergency_lighting:
      if (!lighting_) return false;
      lightsOn();
      return lighting_->anyActive();
    default:
      break;
  }
  if (!sink_) return true;
  ++stats_.forwarded;
  return sink_->perform(kind, description, incidentId);
}

StepStatus ActionExecutor::execute(ActionKind kind, const std::string& description, const std::string& incidentId) {
  if (run(kind, description, incidentId)) {
    ++stats_.executed;
    LOG_DEBUG(TAG, "%s: %s", toString(kind), description.c_str());
    return StepStatus::executed;
  }
  ++stats_.failed;
  LOG_WARN(TAG, "%s failed: %s", toString(kind), description.c_str());
  return StepStatus::failed;
}
