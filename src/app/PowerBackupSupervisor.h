#pragma once

#include <stdint.h>

#include <string>

#include "app/ActionExecutor.h"
#include "app/Config.h"
#include "app/EngineObserver.h"
#include "app/Outcome.h"

class IncidentManager;

enum class BackupKind : uint8_t {
  ups,
  battery,
  generator
};

enum class BackupStatus : uint8_t {
  standby,
  active,
  discharging,
  charging,
  running,
  cooldown
};

static const char* toString(BackupKind k) {
  switch (k) {
    case BackupKind::ups:       return "ups";
    case BackupKind::battery:   return "battery";
    case BackupKind::generator: return "generator";
    default:                    return "unknown";
  }
}

static const char* toString(BackupStatus s) {
  switch (s) {
    case BackupStatus::standby:     return "standby";
    case BackupStatus::active:      return "active";
    case BackupStatus::discharging: return "discharging";
    case BackupStatus::charging:    return "charging";
    case BackupStatus::running:     return "running";
    case BackupStatus::cooldown:    return "cooldown";
    default:                        return "unknown";
  }
}

// Battery charge for ups/battery, fuel for the generator.
struct PowerBackupUnit {
  std::string id;
  std::string name;
  BackupKind kind = BackupKind::ups;
  BackupStatus status = BackupStatus::standby;
  float level = 100.0f;
  uint16_t runtime_minutes = 0;
  bool auto_start = false;
};

struct PowerBackupStatus {
  bool mains_lost = false;
  bool optimal = true;
  bool generator_start_pending = false;
  uint32_t estimated_runtime_minutes = 0;
  PowerBackupUnit ups;
  PowerBackupUnit battery;
  PowerBackupUnit generator;
};

class PowerBackupSupervisor {
public:
  void loadDefaults();
  void configure(const Config& cfg);

  void attachIncidents(IncidentManager* incidents) { incidents_ = incidents; }
  void attachExecutor(ActionExecutor* executor) { executor_ = executor; }
  void attachObserver(EngineObserver* observer) { observer_ = observer; }

  // Opens (or updates) the power-failure incident. outIncidentId may be null.
  Outcome handlePowerFailure(uint32_t nowMs, std::string* outIncidentId = nullptr);
  // invalid_transition when mains was not lost.
  Outcome handlePowerRestored(uint32_t nowMs);

  // Drains units on backup and raises level alerts. Runs on the power cadence.
  void poll(uint32_t nowMs);
  // Deferred generator start and cooldown expiry. Runs on every engine tick.
  void update(uint32_t nowMs);

  bool setLevel(BackupKind kind, float level);

  bool mainsLost() const { return mainsLost_; }
  bool generatorStartPending() const { return startPending_; }
  bool optimal() const;
  const char* overallStatus() const { return optimal() ? "optimal" : "degraded"; }
  uint32_t estimatedRuntimeMinutes() const;
  void snapshot(PowerBackupStatus& out) const;

  const PowerBackupUnit& ups() const { return ups_; }
  const PowerBackupUnit& battery() const { return battery_; }
  const PowerBackupUnit& generator() const { return generator_; }
  uint32_t failures() const { return failures_; }
  uint32_t generatorStarts() const { return generatorStarts_; }

  // Drops the pending start and ends any cooldown early.
  void cancelTimers();

private:
  bool canStartGenerator() const;
  void startGenerator(const char* why);
  PowerBackupUnit* unit(BackupKind kind);

  IncidentManager* incidents_ = nullptr;
  ActionExecutor* executor_ = nullptr;
  EngineObserver* observer_ = nullptr;

  PowerBackupUnit ups_;
  PowerBackupUnit battery_;
  PowerBackupUnit generator_;

  bool mainsLost_ = false;
  bool startPending_ = false;
  uint32_t startAtMs_ = 0;
  bool cooling_ = false;
  uint32_t cooldownUntilMs_ = 0;

  uint32_t autostartDelayMs_ = 30000;
  uint32_t cooldownMs_ = 300000;
  uint8_t minFuel_ = 5;
  uint8_t optimalLevel_ = 50;

  uint32_t failures_ = 0;
  uint32_t generatorStarts_ = 0;
};
