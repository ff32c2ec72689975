#include <iostream>

#include "app/EmergencyEngine.h"

namespace {

#define CHECK(cond) \
  do { \
    if (!(cond)) { \
      std::cerr << "CHECK failed: " #cond << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
      return false; \
    } \
  } while (0)

struct SafetyObserver : public EngineObserver {
  int lockdownOn = 0;
  int lockdownOff = 0;
  std::string lastLockdownReason;
  int panicOn = 0;
  int panicOff = 0;
  int generatorStarts = 0;
  int wellbeingScheduled = 0;
  int wellbeingOverdue = 0;
  int upsCritical = 0;
  int batteryLow = 0;
  int fuelLow = 0;

  void onLockdownChanged(bool active, const std::string& reason) override {
    if (active) {
      ++lockdownOn;
    } else {
      ++lockdownOff;
    }
    lastLockdownReason = reason;
  }
  void onPanicChanged(bool active, const std::string&) override {
    if (active) {
      ++panicOn;
    } else {
      ++panicOff;
    }
  }
  void onGeneratorStarted(const PowerBackupUnit&) override { ++generatorStarts; }
  void onWellbeingScheduled(const WellbeingCheck&) override { ++wellbeingScheduled; }
  void onWellbeingOverdue(const WellbeingCheck&) override { ++wellbeingOverdue; }
  void onPowerAlert(PowerAlert alert, const PowerBackupUnit&) override {
    switch (alert) {
      case PowerAlert::ups_critical: ++upsCritical; break;
      case PowerAlert::battery_low:  ++batteryLow; break;
      case PowerAlert::fuel_low:     ++fuelLow; break;
      default: break;
    }
  }
};

bool test_lockdown_toggles_are_idempotent() {
  EmergencyEngine engine;
  SafetyObserver obs;
  engine.attachObserver(&obs);

  CHECK(engine.activateLockdown("Suspicious activity", 1000));
  CHECK(!engine.activateLockdown("Again", 1100));
  CHECK(obs.lockdownOn == 1);

  const SafetyModeController& safety = engine.safety();
  CHECK(safety.lockdownActive());
  CHECK(safety.lockdownReason() == "Suspicious activity");
  CHECK(safety.lockdownSinceMs() == 1000);
  CHECK(safety.lockdownActions().size() == 10);
  CHECK(safety.lockdownActions()[0].kind == ActionKind::lock_doors);
  CHECK(safety.lockdownActions()[9].step == 10);
  CHECK(engine.lighting().activeCount() == 8);

  CHECK(engine.deactivateLockdown("All clear", 2000));
  CHECK(!engine.deactivateLockdown("All clear", 2100));
  CHECK(obs.lockdownOff == 1);
  CHECK(!safety.lockdownActive());
  CHECK(engine.lighting().activeCount() == 0);
  CHECK(safety.lockdownActivations() == 1);
  return true;
}

bool test_last_resolution_lifts_lockdown() {
  EmergencyEngine engine;
  SafetyObserver obs;
  engine.attachObserver(&obs);

  engine.activateLockdown("Break-in", 0);
  engine.triggerEmergency("intruder", "Glass break", "", 10);
  engine.triggerEmergency("medical", "Injury", "", 20);

  engine.resolveEmergency("incident-1", nullptr, 100);
  CHECK(engine.safety().lockdownActive());
  CHECK(engine.lighting().activeCount() == 8);

  engine.resolveEmergency("incident-2", nullptr, 200);
  CHECK(!engine.safety().lockdownActive());
  CHECK(obs.lockdownOff == 1);
  CHECK(obs.lastLockdownReason == "All emergencies resolved");
  CHECK(engine.lighting().activeCount() == 0);
  CHECK(engine.incidents().stats().lockdown_lifts == 1);
  return true;
}

bool test_panic_button_opens_tagged_medical_incident() {
  EmergencyEngine engine;
  SafetyObserver obs;
  engine.attachObserver(&obs);

  const SafetyModeController::PanicResult r = engine.triggerPanicButton("bedroom", "", 1000);
  CHECK(r.outcome == Outcome::ok);
  CHECK(r.created);
  CHECK(r.incident_id == "incident-1");
  CHECK(engine.safety().panicActive());
  CHECK(engine.safety().panicSource() == "bedroom");

  const Incident* inc = engine.incidents().find("incident-1");
  CHECK(inc->type_id == "medical");
  CHECK(inc->panic_button);
  CHECK(inc->source == "bedroom");
  CHECK(inc->reason == "Panic button activated from bedroom");

  const SafetyModeController::PanicResult again = engine.triggerPanicButton("", "", 2000);
  CHECK(!again.created);
  CHECK(again.incident_id == "incident-1");
  CHECK(inc->source == "unknown");
  CHECK(inc->updates.size() == 1);
  CHECK(obs.panicOn == 2);

  CHECK(engine.deactivatePanicButton());
  CHECK(!engine.deactivatePanicButton());
  CHECK(obs.panicOff == 1);

  // The flag is independent of the incident.
  CHECK(engine.incidents().activeCount() == 1);

  EngineStatistics st;
  engine.getStatistics(st);
  CHECK(st.panic_incidents == 1);
  CHECK(!st.panic_active);
  return true;
}

bool test_panic_without_incident_manager_is_not_found() {
  SafetyModeController safety;
  const SafetyModeController::PanicResult r = safety.triggerPanicButton("hall", "", 0);
  CHECK(r.outcome == Outcome::not_found);
  CHECK(!safety.panicActive());
  return true;
}

bool test_power_failure_and_restore_without_generator() {
  Config cfg;
  cfg.generator_auto_start = false;
  EmergencyEngine engine(cfg);

  std::string id;
  CHECK(engine.handlePowerFailure(1000, &id) == Outcome::ok);
  CHECK(id == "incident-1");

  PowerBackupStatus ps;
  engine.getPowerBackupStatus(ps);
  CHECK(ps.mains_lost);
  CHECK(!ps.generator_start_pending);
  CHECK(ps.ups.status == BackupStatus::active);
  CHECK(ps.battery.status == BackupStatus::discharging);
  CHECK(ps.generator.status == BackupStatus::standby);
  CHECK(engine.lighting().activeCount() == 8);
  CHECK(engine.incidents().find("incident-1")->type_id == "power-failure");

  std::string again;
  CHECK(engine.handlePowerFailure(2000, &again) == Outcome::ok);
  CHECK(again == "incident-1");
  CHECK(engine.power().failures() == 1);

  CHECK(engine.handlePowerRestored(5000) == Outcome::ok);
  engine.getPowerBackupStatus(ps);
  CHECK(!ps.mains_lost);
  CHECK(ps.ups.status == BackupStatus::standby);
  CHECK(ps.battery.status == BackupStatus::charging);
  CHECK(engine.incidents().find("incident-1")->status == IncidentStatus::resolved);
  CHECK(engine.incidents().find("incident-1")->resolution == "Power restored to mains");
  CHECK(engine.lighting().activeCount() == 0);

  CHECK(engine.handlePowerRestored(6000) == Outcome::invalid_transition);
  return true;
}

bool test_generator_starts_after_delay_then_cools_down() {
  EmergencyEngine engine;
  SafetyObserver obs;
  engine.attachObserver(&obs);
  engine.begin(0);

  engine.handlePowerFailure(1000);
  CHECK(engine.power().generatorStartPending());

  engine.tick(30999);
  CHECK(engine.power().generator().status == BackupStatus::standby);

  engine.tick(31000);
  CHECK(engine.power().generator().status == BackupStatus::running);
  CHECK(engine.power().generatorStarts() == 1);
  CHECK(obs.generatorStarts == 1);
  CHECK(!engine.power().generatorStartPending());

  engine.handlePowerRestored(40000);
  CHECK(engine.power().generator().status == BackupStatus::cooldown);

  engine.tick(339999);
  CHECK(engine.power().generator().status == BackupStatus::cooldown);
  engine.tick(340000);
  CHECK(engine.power().generator().status == BackupStatus::standby);
  return true;
}

bool test_restore_cancels_pending_generator_start() {
  EmergencyEngine engine;
  engine.begin(0);

  engine.handlePowerFailure(1000);
  engine.handlePowerRestored(2000);
  CHECK(!engine.power().generatorStartPending());

  engine.tick(31000);
  CHECK(engine.power().generator().status == BackupStatus::standby);
  CHECK(engine.power().generatorStarts() == 0);
  return true;
}

bool test_zero_delay_starts_generator_immediately() {
  Config cfg;
  cfg.generator_autostart_delay_ms = 0;
  EmergencyEngine engine(cfg);

  engine.handlePowerFailure(500);
  CHECK(engine.power().generator().status == BackupStatus::running);
  CHECK(engine.power().generatorStarts() == 1);
  return true;
}

bool test_low_fuel_blocks_generator() {
  Config cfg;
  cfg.generator_autostart_delay_ms = 0;
  EmergencyEngine engine(cfg);
  CHECK(engine.power().setLevel(BackupKind::generator, 4.0f));

  engine.handlePowerFailure(500);
  CHECK(engine.power().generator().status == BackupStatus::standby);

  PowerBackupStatus ps;
  engine.getPowerBackupStatus(ps);
  CHECK(!ps.optimal);
  return true;
}

bool test_failure_after_restart_rearms_generator_start() {
  EmergencyEngine engine;
  engine.begin(0);

  engine.handlePowerFailure(1000);
  CHECK(engine.power().generatorStartPending());
  engine.stop();
  CHECK(!engine.power().generatorStartPending());

  engine.begin(2000);
  std::string id;
  CHECK(engine.handlePowerFailure(3000, &id) == Outcome::ok);
  CHECK(id == "incident-2");
  CHECK(engine.power().generatorStartPending());
  CHECK(engine.power().failures() == 1);

  // A repeat while the start is pending keeps the original deadline.
  engine.handlePowerFailure(10000);
  engine.tick(32999);
  CHECK(engine.power().generator().status == BackupStatus::standby);
  engine.tick(33000);
  CHECK(engine.power().generator().status == BackupStatus::running);
  CHECK(engine.power().generatorStarts() == 1);
  return true;
}

bool test_power_poll_drains_and_raises_level_alerts() {
  Config cfg;
  cfg.power_poll_ms = 1000;
  cfg.generator_autostart_delay_ms = 60000;
  EmergencyEngine engine(cfg);
  SafetyObserver obs;
  engine.attachObserver(&obs);
  engine.begin(0);

  engine.handlePowerFailure(100);
  CHECK(engine.power().setLevel(BackupKind::ups, 20.2f));

  engine.tick(999);
  CHECK(engine.power().ups().level > 20.0f);
  CHECK(obs.upsCritical == 0);

  engine.tick(1000);
  CHECK(engine.power().ups().level < 20.0f);
  CHECK(engine.power().battery().level < 98.0f);
  CHECK(obs.upsCritical == 1);
  CHECK(obs.batteryLow == 0);
  CHECK(obs.fuelLow == 0);
  CHECK(engine.power().generator().status == BackupStatus::running);
  CHECK(engine.power().generatorStarts() == 1);
  CHECK(!engine.power().generatorStartPending());

  CHECK(engine.power().setLevel(BackupKind::battery, 15.05f));
  CHECK(engine.power().setLevel(BackupKind::generator, 15.02f));
  engine.tick(2000);
  CHECK(obs.upsCritical == 2);
  CHECK(obs.batteryLow == 1);
  CHECK(obs.fuelLow == 1);
  CHECK(engine.power().generator().level < 15.0f);
  CHECK(engine.power().generatorStarts() == 1);

  // Units on mains do not drain.
  CHECK(engine.handlePowerRestored(2500) == Outcome::ok);
  const float ups = engine.power().ups().level;
  engine.tick(3000);
  CHECK(engine.power().ups().level == ups);
  CHECK(obs.upsCritical == 2);
  return true;
}

bool test_config_change_keeps_generator_auto_start_setting() {
  Config cfg;
  cfg.generator_auto_start = false;
  cfg.generator_autostart_delay_ms = 0;
  EmergencyEngine engine(cfg);
  CHECK(!engine.power().generator().auto_start);

  Config next = cfg;
  next.correlation_window_ms = 5000;
  engine.configure(next);
  CHECK(!engine.power().generator().auto_start);

  engine.handlePowerFailure(100);
  CHECK(engine.power().generator().status == BackupStatus::standby);

  next.generator_auto_start = true;
  engine.configure(next);
  CHECK(engine.power().generator().auto_start);
  engine.handlePowerFailure(200);
  CHECK(engine.power().generator().status == BackupStatus::running);
  return true;
}

bool test_overdue_wellbeing_check_escalates_once() {
  Config cfg;
  cfg.wellbeing_poll_ms = 1000;
  cfg.wellbeing_overdue_ms = 10000;
  EmergencyEngine engine(cfg);
  SafetyObserver obs;
  engine.attachObserver(&obs);
  engine.begin(0);

  engine.triggerEmergency("storm", "High winds", "", 100);
  engine.resolveEmergency("incident-1", nullptr, 200);
  CHECK(obs.wellbeingScheduled == 1);

  engine.tick(5000);
  CHECK(obs.wellbeingOverdue == 0);

  engine.tick(10200);
  CHECK(obs.wellbeingOverdue == 1);
  CHECK(engine.wellbeing().pending()[0].escalated);

  engine.tick(20000);
  CHECK(obs.wellbeingOverdue == 1);
  CHECK(engine.wellbeing().escalations() == 1);

  CHECK(engine.respondToWellbeingCheck("wellbeing-1", "All safe", 20000) == Outcome::ok);
  CHECK(engine.respondToWellbeingCheck("wellbeing-1", "All safe", 20001) == Outcome::not_found);

  std::vector<WellbeingCheck> done;
  engine.getCompletedWellbeingChecks(done);
  CHECK(done.size() == 1);
  CHECK(done[0].status == CheckStatus::completed);
  CHECK(done[0].response == "All safe");
  CHECK(done[0].responded_at_ms == 20000);
  CHECK(engine.wellbeing().pending().empty());
  return true;
}

bool test_route_recommendation_prefers_accessible_cleared_routes() {
  EmergencyEngine engine;
  EvacuationRoute r;

  CHECK(engine.recommendEvacuationRoute("", r) == Outcome::ok);
  CHECK(r.id == "front_door");

  CHECK(engine.setEvacuationRouteClearance("front_door", false) == Outcome::ok);
  CHECK(engine.recommendEvacuationRoute("", r) == Outcome::ok);
  CHECK(r.id == "back_door");
  CHECK(engine.recommendEvacuationRoute("front_door", r) == Outcome::invalid_transition);
  CHECK(engine.recommendEvacuationRoute("garage_exit", r) == Outcome::ok);
  CHECK(r.id == "garage_exit");
  CHECK(engine.recommendEvacuationRoute("window", r) == Outcome::not_found);
  CHECK(engine.setEvacuationRouteClearance("window", true) == Outcome::not_found);

  engine.setEvacuationRouteClearance("back_door", false);
  CHECK(engine.recommendEvacuationRoute("", r) == Outcome::ok);
  CHECK(r.id == "garage_exit");

  engine.setEvacuationRouteClearance("garage_exit", false);
  CHECK(engine.recommendEvacuationRoute("", r) == Outcome::not_found);
  CHECK(engine.routes().clearedCount() == 0);
  return true;
}

bool test_contacts_validate_and_remove() {
  EmergencyEngine engine;
  const size_t before = engine.contacts().contacts().size();

  EmergencyContact bad;
  bad.name = "No Number";
  bad.type = "family";
  std::string id;
  CHECK(engine.addContact(bad, id) == Outcome::validation_failure);
  CHECK(engine.contacts().contacts().size() == before);

  EmergencyContact good;
  good.name = "Karin";
  good.number = "+46-70-111-2222";
  good.type = "family";
  good.priority = 0;
  CHECK(engine.addContact(good, id) == Outcome::ok);
  CHECK(id == "contact-1");
  CHECK(engine.contacts().find(id)->priority == 5);

  CHECK(engine.removeContact(id) == Outcome::ok);
  CHECK(engine.removeContact(id) == Outcome::not_found);
  CHECK(engine.contacts().contacts().size() == before);
  return true;
}

bool test_low_battery_lights_are_skipped() {
  EmergencyEngine engine;
  CHECK(engine.lighting().setBattery("emlight_garage", 5));
  CHECK(!engine.lighting().setBattery("emlight_roof", 50));

  engine.activateLockdown("Drill", 0);
  CHECK(engine.lighting().activeCount() == 7);
  CHECK(engine.lighting().usableCount() == 7);
  return true;
}

} // namespace

int main() {
  bool ok = true;

  ok &= test_lockdown_toggles_are_idempotent();
  ok &= test_last_resolution_lifts_lockdown();
  ok &= test_panic_button_opens_tagged_medical_incident();
  ok &= test_panic_without_incident_manager_is_not_found();
  ok &= test_power_failure_and_restore_without_generator();
  ok &= test_generator_starts_after_delay_then_cools_down();
  ok &= test_restore_cancels_pending_generator_start();
  ok &= test_zero_delay_starts_generator_immediately();
  ok &= test_low_fuel_blocks_generator();
  ok &= test_failure_after_restart_rearms_generator_start();
  ok &= test_power_poll_drains_and_raises_level_alerts();
  ok &= test_config_change_keeps_generator_auto_start_setting();
  ok &= test_overdue_wellbeing_check_escalates_once();
  ok &= test_route_recommendation_prefers_accessible_cleared_routes();
  ok &= test_contacts_validate_and_remove();
  ok &= test_low_battery_lights_are_skipped();

  if (!ok) return 1;

  std::cout << "native_safety tests passed\n";
  return 0;
}
