#include "app/SafetyModeController.h"

#include "app/IncidentManager.h"
#include "app/Log.h"

namespace {
constexpr const char* TAG = "SAFETY";

struct LockdownStep {
  ActionKind kind;
  const char* description;
};

const LockdownStep kLockdownSteps[] = {
  {ActionKind::lock_doors,      "Lock all exterior doors"},
  {ActionKind::close_shutters,  "Close all motorized windows"},
  {ActionKind::record_cameras,  "Activate security cameras to record"},
  {ActionKind::arm_perimeter,   "Enable perimeter alarm"},
  {ActionKind::lock_doors,      "Lock garage doors"},
  {ActionKind::exterior_lights, "Activate exterior lights"},
  {ActionKind::arm_perimeter,   "Arm all security zones"},
  {ActionKind::lock_safe_room,  "Enable safe room access"},
  {ActionKind::lock_doors,      "Disable guest access codes"},
  {ActionKind::monitor_sensors, "Activate monitoring mode on all sensors"},
};
} // namespace

bool SafetyModeController::activateLockdown(const std::string& reason, uint32_t nowMs) {
  if (lockdown_) {
    LOG_DEBUG(TAG, "lockdown already active");
    return false;
  }

  lockdown_ = true;
  lockdownReason_ = reason;
  lockdownSinceMs_ = nowMs;
  ++lockdownActivations_;
  LOG_WARN(TAG, "LOCKDOWN ACTIVATED: %s", reason.c_str());

  lockdownActions_.clear();
  uint16_t step = 1;
  for (const LockdownStep& s : kLockdownSteps) {
    ActionRecord r;
    r.step = step++;
    r.kind = s.kind;
    r.description = s.description;
    r.automatic = true;
    r.executed_at_ms = nowMs;
    r.status = executor_ ? executor_->execute(s.kind, s.description, "lockdown") : StepStatus::failed;
    lockdownActions_.push_back(r);
  }
  if (executor_) executor_->lightsOn();

  if (observer_) observer_->onLockdownChanged(true, reason);
  return true;
}

bool SafetyModeController::deactivateLockdown(const std::string& reason, uint32_t nowMs) {
  (void)nowMs;
  if (!lockdown_) {
    LOG_DEBUG(TAG, "lockdown not active");
    return false;
  }

  lockdown_ = false;
  lockdownReason_.clear();
  LOG_WARN(TAG, "lockdown deactivated: %s", reason.c_str());
  if (executor_) executor_->lightsOff();

  if (observer_) observer_->onLockdownChanged(false, reason);
  return true;
}

SafetyModeController::PanicResult SafetyModeController::triggerPanicButton(const std::string& source,
                                                                           const std::string& details,
                                                                           uint32_t nowMs) {
  PanicResult res;
  const std::string src = source.empty() ? std::string("unknown") : source;
  if (!incidents_) {
    res.outcome = Outcome::not_found;
    return res;
  }

  panic_ = true;
  panicSource_ = src;
  ++panicActivations_;
  LOG_WARN(TAG, "PANIC BUTTON from %s", src.c_str());

  IncidentManager::TriggerTags tags;
  tags.panic_button = true;
  tags.source = src;
  const IncidentManager::TriggerResult tr =
    incidents_->trigger("medical", "Panic button activated from " + src, details, nowMs, &tags);

  res.outcome = tr.outcome;
  res.created = tr.created;
  res.incident_id = tr.incident_id;

  if (observer_) observer_->onPanicChanged(true, src);
  return res;
}

bool SafetyModeController::deactivatePanicButton() {
  if (!panic_) return false;
  panic_ = false;
  const std::string src = panicSource_;
  panicSource_.clear();
  LOG_INFO(TAG, "panic flag cleared");
  if (observer_) observer_->onPanicChanged(false, src);
  return true;
}

void SafetyModeController::reset() {
  lockdown_ = false;
  lockdownReason_.clear();
  panic_ = false;
  panicSource_.clear();
}
