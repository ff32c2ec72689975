#include "app/PowerBackupSupervisor.h"

#include "app/IncidentManager.h"
#include "app/Log.h"

namespace {
constexpr const char* TAG = "POWER";
constexpr const char* kPowerFailureType = "power-failure";

constexpr float UPS_DRAIN_PER_POLL = 0.5f;
constexpr float BATTERY_DRAIN_PER_POLL = 0.1f;
constexpr float FUEL_DRAIN_PER_POLL = 0.05f;
constexpr float UPS_CRITICAL_PCT = 20.0f;
constexpr float BATTERY_LOW_PCT = 15.0f;
constexpr float FUEL_LOW_PCT = 15.0f;

bool reached(uint32_t nowMs, uint32_t targetMs) {
  return (int32_t)(nowMs - targetMs) >= 0;
}

float drain(float level, float step) {
  const float next = level - step;
  return next < 0.0f ? 0.0f : next;
}

uint32_t runtimeLeft(const PowerBackupUnit& u) {
  return (uint32_t)(u.runtime_minutes * u.level / 100.0f + 0.5f);
}
} // namespace

void PowerBackupSupervisor::loadDefaults() {
  ups_ = PowerBackupUnit{};
  ups_.id = "ups";
  ups_.name = "UPS";
  ups_.kind = BackupKind::ups;
  ups_.level = 100.0f;
  ups_.runtime_minutes = 45;

  battery_ = PowerBackupUnit{};
  battery_.id = "battery_system";
  battery_.name = "Home Battery";
  battery_.kind = BackupKind::battery;
  battery_.level = 98.0f;
  battery_.runtime_minutes = 240;

  generator_ = PowerBackupUnit{};
  generator_.id = "generator";
  generator_.name = "Backup Generator";
  generator_.kind = BackupKind::generator;
  generator_.level = 85.0f;
  generator_.runtime_minutes = 18 * 60;
  generator_.auto_start = true;

  mainsLost_ = false;
  cancelTimers();
}

void PowerBackupSupervisor::configure(const Config& cfg) {
  autostartDelayMs_ = cfg.generator_autostart_delay_ms;
  cooldownMs_ = cfg.generator_cooldown_ms;
  minFuel_ = cfg.generator_min_fuel;
  optimalLevel_ = cfg.optimal_backup_level;
  generator_.auto_start = cfg.generator_auto_start;
}

PowerBackupUnit* PowerBackupSupervisor::unit(BackupKind kind) {
  switch (kind) {
    case BackupKind::ups:       return &ups_;
    case BackupKind::battery:   return &battery_;
    case BackupKind::generator: return &generator_;
    default:                    return nullptr;
  }
}

bool PowerBackupSupervisor::setLevel(BackupKind kind, float level) {
  PowerBackupUnit* u = unit(kind);
  if (!u) return false;
  if (level < 0.0f) level = 0.0f;
  if (level > 100.0f) level = 100.0f;
  u->level = level;
  return true;
}

bool PowerBackupSupervisor::canStartGenerator() const {
  return generator_.auto_start &&
         generator_.status == BackupStatus::standby &&
         generator_.level > (float)minFuel_;
}

void PowerBackupSupervisor::startGenerator(const char* why) {
  startPending_ = false;
  generator_.status = BackupStatus::running;
  ++generatorStarts_;
  LOG_WARN(TAG, "generator started (%s), est. runtime %lu min",
           why, (unsigned long)runtimeLeft(generator_));
  if (executor_) executor_->execute(ActionKind::start_generator, "Start backup generator", "power");
  if (observer_) observer_->onGeneratorStarted(generator_);
}

Outcome PowerBackupSupervisor::handlePowerFailure(uint32_t nowMs, std::string* outIncidentId) {
  const bool firstLoss = !mainsLost_;
  mainsLost_ = true;

  if (firstLoss) {
    ++failures_;
    ups_.status = BackupStatus::active;
    battery_.status = BackupStatus::discharging;
    LOG_WARN(TAG, "mains lost: UPS ~%lu min, battery ~%lu min",
             (unsigned long)runtimeLeft(ups_), (unsigned long)runtimeLeft(battery_));
    if (executor_) executor_->lightsOn();
  }

  // A repeated report re-arms the start when a stop dropped the timer.
  if (!startPending_ && canStartGenerator()) {
    if (autostartDelayMs_ == 0) {
      startGenerator("mains lost");
    } else {
      startPending_ = true;
      startAtMs_ = nowMs + autostartDelayMs_;
      LOG_INFO(TAG, "generator start in %lu ms", (unsigned long)autostartDelayMs_);
    }
  }

  if (!incidents_) return Outcome::not_found;
  const std::string details = std::string("ups=") + toString(ups_.status) +
                              " battery=" + std::to_string((int)(battery_.level + 0.5f)) +
                              " generator=" + toString(generator_.status);
  const IncidentManager::TriggerResult tr =
    incidents_->trigger(kPowerFailureType, "Main power failure detected", details, nowMs);
  if (outIncidentId) *outIncidentId = tr.incident_id;
  return tr.outcome;
}

Outcome PowerBackupSupervisor::handlePowerRestored(uint32_t nowMs) {
  if (!mainsLost_) {
    LOG_WARN(TAG, "restore ignored: mains not lost");
    return Outcome::invalid_transition;
  }
  mainsLost_ = false;
  LOG_INFO(TAG, "power restored, switching back to mains");

  ups_.status = BackupStatus::standby;
  battery_.status = BackupStatus::charging;
  if (startPending_) {
    startPending_ = false;
    LOG_INFO(TAG, "pending generator start cancelled");
  }
  if (generator_.status == BackupStatus::running) {
    generator_.status = BackupStatus::cooldown;
    cooling_ = true;
    cooldownUntilMs_ = nowMs + cooldownMs_;
  }

  if (incidents_) {
    const Incident* open = incidents_->findActiveByType(kPowerFailureType);
    if (open) {
      const std::string id = open->id;
      incidents_->resolve(id, "Power restored to mains", nowMs);
    }
  }
  return Outcome::ok;
}

void PowerBackupSupervisor::poll(uint32_t nowMs) {
  if (ups_.status == BackupStatus::active) {
    ups_.level = drain(ups_.level, UPS_DRAIN_PER_POLL);
    if (ups_.level < UPS_CRITICAL_PCT) {
      LOG_WARN(TAG, "UPS battery critical: %d%%", (int)(ups_.level + 0.5f));
      if (observer_) observer_->onPowerAlert(PowerAlert::ups_critical, ups_);
      if (canStartGenerator()) startGenerator("ups critical");
    }
  }

  if (battery_.status == BackupStatus::discharging) {
    battery_.level = drain(battery_.level, BATTERY_DRAIN_PER_POLL);
    if (battery_.level < BATTERY_LOW_PCT) {
      LOG_WARN(TAG, "battery backup low: %d%%", (int)(battery_.level + 0.5f));
      if (observer_) observer_->onPowerAlert(PowerAlert::battery_low, battery_);
    }
  }

  if (generator_.status == BackupStatus::running) {
    generator_.level = drain(generator_.level, FUEL_DRAIN_PER_POLL);
    if (generator_.level < FUEL_LOW_PCT) {
      LOG_WARN(TAG, "generator fuel low: %d%%", (int)(generator_.level + 0.5f));
      if (observer_) observer_->onPowerAlert(PowerAlert::fuel_low, generator_);
    }
  }
}

void PowerBackupSupervisor::update(uint32_t nowMs) {
  if (startPending_ && reached(nowMs, startAtMs_)) {
    startPending_ = false;
    if (mainsLost_ && canStartGenerator()) startGenerator("auto-start delay elapsed");
  }
  if (cooling_ && reached(nowMs, cooldownUntilMs_)) {
    cooling_ = false;
    if (generator_.status == BackupStatus::cooldown) {
      generator_.status = BackupStatus::standby;
      LOG_INFO(TAG, "generator cooled down and ready");
    }
  }
}

bool PowerBackupSupervisor::optimal() const {
  const float min = (float)optimalLevel_;
  return ups_.level > min && battery_.level > min && generator_.level > min;
}

uint32_t PowerBackupSupervisor::estimatedRuntimeMinutes() const {
  return runtimeLeft(ups_) + runtimeLeft(battery_) + runtimeLeft(generator_);
}

void PowerBackupSupervisor::snapshot(PowerBackupStatus& out) const {
  out.mains_lost = mainsLost_;
  out.optimal = optimal();
  out.generator_start_pending = startPending_;
  out.estimated_runtime_minutes = estimatedRuntimeMinutes();
  out.ups = ups_;
  out.battery = battery_;
  out.generator = generator_;
}

void PowerBackupSupervisor::cancelTimers() {
  startPending_ = false;
  startAtMs_ = 0;
  if (cooling_ && generator_.status == BackupStatus::cooldown) {
    generator_.status = BackupStatus::standby;
  }
  cooling_ = false;
  cooldownUntilMs_ = 0;
}
