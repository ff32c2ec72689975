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

struct CountingObserver : public EngineObserver {
  int created = 0;
  int updated = 0;
  int resolved = 0;
  int recoverySteps = 0;
  bool lastHadPlan = false;

  void onIncidentCreated(const Incident&) override { ++created; }
  void onIncidentUpdated(const Incident&, const IncidentUpdate&) override { ++updated; }
  void onIncidentResolved(const Incident&, const RecoveryPlan* plan) override {
    ++resolved;
    lastHadPlan = plan != nullptr;
  }
  void onRecoveryStepCompleted(const RecoveryPlan&, const RecoveryStep&) override { ++recoverySteps; }
};

// Fails every HVAC cutoff; everything else succeeds.
struct HvacFaultSink : public ActionSink {
  int calls = 0;

  bool perform(ActionKind kind, const std::string&, const std::string&) override {
    ++calls;
    return kind != ActionKind::cut_hvac;
  }
};

bool test_catalog_defaults() {
  EmergencyCatalog catalog;
  catalog.loadDefaults();

  CHECK(catalog.types().size() == 10);
  const EmergencyType* fire = catalog.find("fire");
  CHECK(fire != nullptr);
  CHECK(fire->severity == 5);
  CHECK(fire->protocol.size() == 10);
  CHECK(fire->auto_actions.size() == 4);
  CHECK(fire->recovery_steps.size() == 6);

  const EmergencyType* power = catalog.find("power-failure");
  CHECK(power != nullptr);
  CHECK(power->severity == 2);
  CHECK(catalog.find("volcano") == nullptr);

  EmergencyType dup;
  dup.id = "fire";
  CHECK(!catalog.add(dup));
  return true;
}

bool test_trigger_runs_protocol_then_alerts_then_auto_actions() {
  EmergencyEngine engine;
  CountingObserver obs;
  engine.attachObserver(&obs);

  const IncidentManager::TriggerResult r = engine.triggerEmergency("fire", "Manual trigger", "kitchen", 1000);
  CHECK(r.outcome == Outcome::ok);
  CHECK(r.created);
  CHECK(r.incident_id == "incident-1");
  CHECK(obs.created == 1);

  const Incident* inc = engine.incidents().find("incident-1");
  CHECK(inc != nullptr);
  CHECK(inc->status == IncidentStatus::active);
  CHECK(inc->severity == 5);
  CHECK(inc->label == "Fire");
  CHECK(inc->triggered_at_ms == 1000);

  CHECK(inc->actions_executed.size() == 14);
  for (size_t i = 0; i < inc->actions_executed.size(); ++i) {
    const ActionRecord& a = inc->actions_executed[i];
    CHECK(a.step == i + 1);
    CHECK(a.status == StepStatus::executed);
    CHECK(a.automatic == (i >= 10));
  }
  CHECK(inc->actions_executed[0].kind == ActionKind::siren);

  // Seven channels at severity 5, then every contact.
  CHECK(inc->alerts_sent.size() == 17);
  CHECK(inc->alerts_sent[0].channel_id == "push");
  CHECK(inc->alerts_sent[6].channel_id == "phone_call");
  CHECK(inc->alerts_sent[6].escalation_level == 3);
  CHECK(inc->alerts_sent[4].message.find("Call 112 if needed.") != std::string::npos);
  CHECK(inc->alerts_sent[7].channel_id == AlertDispatcher::kContactChannelId);

  CHECK(engine.lighting().activeCount() == 8);
  return true;
}

bool test_contacts_are_notified_in_priority_order() {
  EmergencyEngine engine;
  EmergencyContact c;
  c.name = "Night Nurse";
  c.number = "+46-70-000-0000";
  c.type = "medical";
  c.priority = 1;
  std::string id;
  CHECK(engine.addContact(c, id) == Outcome::ok);

  engine.triggerEmergency("flood", "Basement leak", "", 500);
  const Incident* inc = engine.incidents().find("incident-1");
  CHECK(inc != nullptr);
  CHECK(inc->alerts_sent.size() == 18);

  const std::vector<AlertRecord>& a = inc->alerts_sent;
  CHECK(a[7].contact_name == "SOS Alarm");
  CHECK(a[7].status == AlertStatus::auto_called);
  CHECK(a[8].contact_name == "Brandkaaren");
  CHECK(a[9].contact_name == "Ambulans");
  CHECK(a[10].contact_name == "Night Nurse");
  CHECK(a[10].status == AlertStatus::notified);
  CHECK(a[11].contact_name == "Polisen");
  CHECK(a[17].contact_name == "Maria Svensson (Neighbor)");
  return true;
}

bool test_low_severity_skips_high_channels_and_contacts() {
  EmergencyEngine engine;
  engine.triggerEmergency("power-failure", "Grid down", "", 0);

  const Incident* inc = engine.incidents().find("incident-1");
  CHECK(inc != nullptr);
  CHECK(inc->alerts_sent.size() == 6);
  for (const AlertRecord& a : inc->alerts_sent) {
    CHECK(a.channel_id != "phone_call");
    CHECK(a.channel_id != AlertDispatcher::kContactChannelId);
    CHECK(a.escalation_level <= 2);
  }
  return true;
}

bool test_duplicate_trigger_appends_update() {
  EmergencyEngine engine;
  CountingObserver obs;
  engine.attachObserver(&obs);

  engine.triggerEmergency("fire", "First", "", 1000);
  const IncidentManager::TriggerResult r = engine.triggerEmergency("fire", "Second", "attic", 2000);

  CHECK(r.outcome == Outcome::ok);
  CHECK(!r.created);
  CHECK(r.incident_id == "incident-1");
  CHECK(obs.created == 1);
  CHECK(obs.updated == 1);

  const Incident* inc = engine.incidents().find("incident-1");
  CHECK(inc->updates.size() == 1);
  CHECK(inc->updates[0].reason == "Second");
  CHECK(inc->updates[0].details == "attic");
  CHECK(inc->updates[0].ts_ms == 2000);
  CHECK(inc->reason == "Second");
  CHECK(inc->actions_executed.size() == 14);

  CHECK(engine.incidents().log().size() == 1);
  CHECK(engine.incidents().activeCount() == 1);
  CHECK(engine.incidents().stats().deduplicated == 1);

  // A different type is its own incident.
  const IncidentManager::TriggerResult other = engine.triggerEmergency("flood", "Leak", "", 2500);
  CHECK(other.created);
  CHECK(other.incident_id == "incident-2");
  CHECK(engine.incidents().activeCount() == 2);
  return true;
}

bool test_unknown_type_is_rejected() {
  EmergencyEngine engine;
  const IncidentManager::TriggerResult r = engine.triggerEmergency("volcano", "Lava", "", 0);

  CHECK(r.outcome == Outcome::not_found);
  CHECK(!r.created);
  CHECK(r.incident_id.empty());
  CHECK(engine.incidents().log().empty());
  CHECK(engine.incidents().stats().rejected == 1);
  return true;
}

bool test_resolve_records_response_and_builds_recovery_plan() {
  EmergencyEngine engine;
  CountingObserver obs;
  engine.attachObserver(&obs);

  engine.triggerEmergency("fire", "Manual", "", 1000);
  const IncidentManager::ResolveResult r = engine.resolveEmergency("incident-1", nullptr, 61000);

  CHECK(r.outcome == Outcome::ok);
  CHECK(r.incident.status == IncidentStatus::resolved);
  CHECK(r.incident.has_resolution);
  CHECK(r.incident.resolved_at_ms == 61000);
  CHECK(r.incident.response_time_ms == 60000);
  CHECK(r.incident.resolution == "Manually resolved");
  CHECK(r.has_recovery);
  CHECK(r.recovery.steps.size() == 6);
  CHECK(r.recovery.steps[0].step == 1);
  CHECK(r.recovery.steps[0].description == "Wait for fire department clearance");
  CHECK(!r.recovery.complete);

  CHECK(obs.resolved == 1);
  CHECK(obs.lastHadPlan);
  CHECK(engine.incidents().activeCount() == 0);
  CHECK(engine.lighting().activeCount() == 0);

  std::vector<WellbeingCheck> pending;
  engine.getPendingWellbeingChecks(pending);
  CHECK(pending.size() == 1);
  CHECK(pending[0].incident_id == "incident-1");
  CHECK(pending[0].type_id == "fire");

  EngineStatistics st;
  engine.getStatistics(st);
  CHECK(st.incidents_resolved == 1);
  CHECK(st.avg_response_ms == 60000);
  CHECK(st.recovery_plans == 1);
  return true;
}

bool test_resolve_rejects_unknown_and_repeat() {
  EmergencyEngine engine;
  engine.triggerEmergency("medical", "Fall", "", 0);

  CHECK(engine.resolveEmergency("incident-99", nullptr, 10).outcome == Outcome::not_found);
  CHECK(engine.resolveEmergency("incident-1", "Paramedics left", 20).outcome == Outcome::ok);

  const IncidentManager::ResolveResult again = engine.resolveEmergency("incident-1", nullptr, 30);
  CHECK(again.outcome == Outcome::invalid_transition);

  const Incident* inc = engine.incidents().find("incident-1");
  CHECK(inc->resolution == "Paramedics left");
  CHECK(inc->resolved_at_ms == 20);
  CHECK(engine.incidents().recoveryPlans().size() == 1);
  return true;
}

bool test_lights_stay_on_while_another_incident_is_active() {
  EmergencyEngine engine;
  engine.triggerEmergency("fire", "Smoke", "", 0);
  engine.triggerEmergency("flood", "Leak", "", 10);

  engine.resolveEmergency("incident-1", nullptr, 100);
  CHECK(engine.lighting().activeCount() == 8);

  engine.resolveEmergency("incident-2", nullptr, 200);
  CHECK(engine.lighting().activeCount() == 0);
  return true;
}

bool test_recovery_steps_complete_once() {
  EmergencyEngine engine;
  CountingObserver obs;
  engine.attachObserver(&obs);

  engine.triggerEmergency("fire", "Manual", "", 0);
  CHECK(engine.completeRecoveryStep("incident-1", 1, 5) == Outcome::not_found);
  engine.resolveEmergency("incident-1", nullptr, 100);

  CHECK(engine.completeRecoveryStep("incident-1", 1, 200) == Outcome::ok);
  CHECK(engine.completeRecoveryStep("incident-1", 1, 210) == Outcome::invalid_transition);
  CHECK(engine.completeRecoveryStep("incident-1", 7, 220) == Outcome::not_found);
  CHECK(engine.completeRecoveryStep("incident-9", 1, 230) == Outcome::not_found);

  const RecoveryPlan* plan = engine.incidents().recoveryPlan("incident-1");
  CHECK(plan != nullptr);
  CHECK(plan->steps[0].status == RecoveryStepStatus::completed);
  CHECK(plan->steps[0].completed_at_ms == 200);
  CHECK(!plan->complete);

  for (uint16_t s = 2; s <= 6; ++s) {
    CHECK(engine.completeRecoveryStep("incident-1", s, 300 + s) == Outcome::ok);
  }
  CHECK(plan->complete);
  CHECK(obs.recoverySteps == 6);

  EngineStatistics st;
  engine.getStatistics(st);
  CHECK(st.recovery_plans_complete == 1);
  return true;
}

bool test_history_is_newest_first() {
  EmergencyEngine engine;
  engine.triggerEmergency("fire", "a", "", 0);
  engine.triggerEmergency("flood", "b", "", 10);
  engine.triggerEmergency("medical", "c", "", 20);
  engine.resolveEmergency("incident-2", nullptr, 30);

  std::vector<Incident> all;
  engine.getIncidentHistory(0, all);
  CHECK(all.size() == 3);
  CHECK(all[0].id == "incident-3");
  CHECK(all[1].id == "incident-2");
  CHECK(all[1].status == IncidentStatus::resolved);
  CHECK(all[2].id == "incident-1");

  std::vector<Incident> two;
  engine.getIncidentHistory(2, two);
  CHECK(two.size() == 2);
  CHECK(two[1].id == "incident-2");

  std::vector<Incident> active;
  engine.getActiveEmergencies(active);
  CHECK(active.size() == 2);
  CHECK(active[0].id == "incident-1");
  CHECK(active[1].id == "incident-3");
  return true;
}

bool test_failed_actions_are_recorded() {
  EmergencyEngine engine;
  HvacFaultSink sink;
  engine.attachActionSink(&sink);

  engine.triggerEmergency("fire", "Manual", "", 0);
  const Incident* inc = engine.incidents().find("incident-1");
  CHECK(inc != nullptr);

  int failed = 0;
  for (const ActionRecord& a : inc->actions_executed) {
    if (a.status == StepStatus::failed) {
      CHECK(a.kind == ActionKind::cut_hvac);
      ++failed;
    }
  }
  CHECK(failed == 2);
  CHECK(inc->actions_executed[1].status == StepStatus::failed);
  CHECK(sink.calls > 0);

  EngineStatistics st;
  engine.getStatistics(st);
  CHECK(st.actions_failed == 2);
  CHECK(st.actions_executed == 12);
  return true;
}

bool test_contact_threshold_follows_config() {
  Config cfg;
  cfg.contact_severity_threshold = 5;
  EmergencyEngine engine(cfg);

  engine.triggerEmergency("flood", "Leak", "", 0);
  CHECK(engine.incidents().find("incident-1")->alerts_sent.size() == 7);

  engine.triggerEmergency("fire", "Smoke", "", 10);
  CHECK(engine.incidents().find("incident-2")->alerts_sent.size() == 17);
  return true;
}

} // namespace

int main() {
  bool ok = true;

  ok &= test_catalog_defaults();
  ok &= test_trigger_runs_protocol_then_alerts_then_auto_actions();
  ok &= test_contacts_are_notified_in_priority_order();
  ok &= test_low_severity_skips_high_channels_and_contacts();
  ok &= test_duplicate_trigger_appends_update();
  ok &= test_unknown_type_is_rejected();
  ok &= test_resolve_records_response_and_builds_recovery_plan();
  ok &= test_resolve_rejects_unknown_and_repeat();
  ok &= test_lights_stay_on_while_another_incident_is_active();
  ok &= test_recovery_steps_complete_once();
  ok &= test_history_is_newest_first();
  ok &= test_failed_actions_are_recorded();
  ok &= test_contact_threshold_follows_config();

  if (!ok) return 1;

  std::cout << "native_incident tests passed\n";
  return 0;
}
