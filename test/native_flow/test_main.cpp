#include <cstdio>
#include <iostream>
#include <vector>

#include "app/CommandParser.h"
#include "app/ConfigKeys.h"
#include "app/EmergencyEngine.h"
#include "app/Log.h"
#include "services/PublishStore.h"

namespace {

#define CHECK(cond) \
  do { \
    if (!(cond)) { \
      std::cerr << "CHECK failed: " #cond << " at " << __FILE__ << ":" << __LINE__ << "\n"; \
      return false; \
    } \
  } while (0)

struct FlowObserver : public EngineObserver {
  int warnings = 0;
  int created = 0;
  std::string lastCreatedType;

  void onSensorWarning(const SensorEvent&) override { ++warnings; }
  void onIncidentCreated(const Incident& incident) override {
    ++created;
    lastCreatedType = incident.type_id;
  }
};

int gLogLines = 0;
LogLevel gLastLevel = LogLevel::debug;

void countingSink(LogLevel level, const char*, const char*) {
  ++gLogLines;
  gLastLevel = level;
}

bool test_sensor_reports_correlate_into_fire_on_tick() {
  EmergencyEngine engine;
  FlowObserver obs;
  engine.attachObserver(&obs);
  engine.begin(0);

  CHECK(engine.reportSensorEvent("smoke_detector_living", "alarm", "", 1000).outcome == Outcome::ok);
  CHECK(engine.reportSensorEvent("temp_extreme_attic", "high", "68C", 2000).outcome == Outcome::ok);
  CHECK(obs.warnings == 2);
  CHECK(obs.created == 0);

  engine.tick(4999);
  CHECK(obs.created == 0);

  engine.tick(5000);
  CHECK(obs.created == 1);
  CHECK(obs.lastCreatedType == "fire");

  std::vector<Incident> active;
  engine.getActiveEmergencies(active);
  CHECK(active.size() == 1);
  CHECK(active[0].severity == 5);
  CHECK(active[0].reason == "Multi-sensor correlation: smoke and extreme heat detected");
  CHECK(active[0].triggered_at_ms == 5000);
  CHECK(engine.lighting().activeCount() == 8);

  EngineStatistics st;
  engine.getStatistics(st);
  CHECK(st.sensor_events == 2);
  CHECK(st.sensor_warnings == 2);
  CHECK(st.correlation_matches == 1);
  CHECK(st.buffered_events == 0);
  CHECK(st.incidents_total == 1);
  CHECK(st.incidents_active == 1);
  CHECK(st.sensors_total == 20);
  CHECK(st.lights_active == 8);
  CHECK(st.alerts_sent == 17);
  return true;
}

bool test_single_sensor_stays_a_warning() {
  EmergencyEngine engine;
  FlowObserver obs;
  engine.attachObserver(&obs);
  engine.begin(0);

  engine.reportSensorEvent("glass_break_back", "break", "", 100);
  engine.tick(5000);
  engine.tick(10000);

  CHECK(obs.warnings == 1);
  CHECK(obs.created == 0);
  CHECK(engine.incidents().log().empty());

  CHECK(engine.reportSensorEvent("mystery", "alarm", "", 200).outcome == Outcome::not_found);
  EngineStatistics st;
  engine.getStatistics(st);
  CHECK(st.sensor_events_rejected == 1);
  return true;
}

bool test_tick_before_begin_does_nothing() {
  EmergencyEngine engine;
  engine.reportSensorEvent("flood_sensor_basement", "leak", "", 100);
  engine.reportSensorEvent("flood_sensor_bathroom", "leak", "", 200);

  CHECK(!engine.running());
  engine.tick(10000);
  CHECK(engine.incidents().log().empty());
  CHECK(engine.correlation().events().size() == 2);
  return true;
}

bool test_stop_keeps_log_and_clears_transient_state() {
  EmergencyEngine engine;
  engine.begin(0);
  engine.activateLockdown("Night", 0);
  engine.triggerEmergency("intruder", "Motion", "", 100);
  engine.reportSensorEvent("motion_sensor_front", "motion", "", 200);

  engine.stop();
  CHECK(!engine.running());

  std::vector<Incident> active;
  engine.getActiveEmergencies(active);
  CHECK(active.empty());

  std::vector<Incident> history;
  engine.getIncidentHistory(0, history);
  CHECK(history.size() == 1);
  CHECK(history[0].status == IncidentStatus::active);

  CHECK(engine.resolveEmergency("incident-1", nullptr, 300).outcome == Outcome::invalid_transition);
  CHECK(!engine.safety().lockdownActive());
  CHECK(engine.lighting().activeCount() == 0);
  CHECK(engine.correlation().events().empty());

  // Restart continues numbering.
  engine.begin(1000);
  const IncidentManager::TriggerResult r = engine.triggerEmergency("intruder", "Again", "", 1100);
  CHECK(r.created);
  CHECK(r.incident_id == "incident-2");
  return true;
}

bool test_configure_applies_new_window() {
  EmergencyEngine engine;
  Config cfg = engine.config();
  CHECK(ConfigKeys::apply(cfg, "window_ms", 5000) == Outcome::ok);
  engine.configure(cfg);
  CHECK(engine.correlation().windowMs() == 5000);

  engine.begin(0);
  engine.reportSensorEvent("smoke_detector_living", "alarm", "", 0);
  engine.reportSensorEvent("temp_extreme_attic", "high", "", 100);
  engine.tick(5000);
  CHECK(engine.incidents().log().empty());
  CHECK(engine.correlation().events().size() == 1);
  return true;
}

bool test_config_keys_validate_ranges() {
  Config cfg;
  CHECK(ConfigKeys::count() == 14);
  CHECK(ConfigKeys::name(0) != nullptr);
  CHECK(ConfigKeys::name(ConfigKeys::count()) == nullptr);

  CHECK(ConfigKeys::apply(cfg, "window_ms", 999) == Outcome::validation_failure);
  CHECK(ConfigKeys::apply(cfg, "contact_sev", 6) == Outcome::validation_failure);
  CHECK(ConfigKeys::apply(cfg, "no_such_key", 1) == Outcome::validation_failure);
  CHECK(cfg.correlation_window_ms == 30000);

  CHECK(ConfigKeys::apply(cfg, "gen_auto", 0) == Outcome::ok);
  CHECK(!cfg.generator_auto_start);
  CHECK(ConfigKeys::apply(cfg, "contact_sev", 5) == Outcome::ok);
  CHECK(cfg.contact_severity_threshold == 5);

  uint32_t v = 0;
  CHECK(ConfigKeys::read(cfg, "contact_sev", v));
  CHECK(v == 5);
  CHECK(ConfigKeys::read(cfg, "tick_ms", v));
  CHECK(v == 5000);
  CHECK(!ConfigKeys::read(cfg, "no_such_key", v));
  return true;
}

bool test_parser_accepts_command_grammar() {
  Command cmd;
  std::string err;

  CHECK(CommandParser::parse("TRIGGER Fire Smoke in Kitchen", cmd, err));
  CHECK(cmd.kind == CommandKind::trigger);
  CHECK(cmd.id == "fire");
  CHECK(cmd.text == "Smoke in Kitchen");

  CHECK(CommandParser::parse("sensor smoke_detector_living ALARM ppm=300", cmd, err));
  CHECK(cmd.kind == CommandKind::sensor);
  CHECK(cmd.id == "smoke_detector_living");
  CHECK(cmd.arg == "alarm");
  CHECK(cmd.text == "ppm=300");

  CHECK(CommandParser::parse("recovery incident-1 3", cmd, err));
  CHECK(cmd.kind == CommandKind::recovery);
  CHECK(cmd.step == 3);

  CHECK(CommandParser::parse("Panic OFF", cmd, err));
  CHECK(cmd.kind == CommandKind::panic_off);
  CHECK(CommandParser::parse("panic front door", cmd, err));
  CHECK(cmd.kind == CommandKind::panic);
  CHECK(cmd.text == "front door");

  CHECK(CommandParser::parse("lockdown on Intruder outside", cmd, err));
  CHECK(cmd.kind == CommandKind::lockdown_on);
  CHECK(cmd.text == "Intruder outside");

  CHECK(CommandParser::parse("power fail", cmd, err));
  CHECK(cmd.kind == CommandKind::power_fail);
  CHECK(CommandParser::parse("  power   restored  ", cmd, err));
  CHECK(cmd.kind == CommandKind::power_restored);

  CHECK(CommandParser::parse("wellbeing wellbeing-1 Everyone OK", cmd, err));
  CHECK(cmd.kind == CommandKind::wellbeing);
  CHECK(cmd.text == "Everyone OK");

  CHECK(CommandParser::parse("route front_door blocked", cmd, err));
  CHECK(cmd.kind == CommandKind::route_set);
  CHECK(cmd.id == "front_door");
  CHECK(!cmd.cleared);
  CHECK(CommandParser::parse("route best back_door", cmd, err));
  CHECK(cmd.kind == CommandKind::route_best);
  CHECK(cmd.id == "back_door");

  CHECK(CommandParser::parse("config window_ms 60000", cmd, err));
  CHECK(cmd.kind == CommandKind::config_set);
  CHECK(cmd.value == 60000);

  CHECK(CommandParser::parse("?", cmd, err));
  CHECK(cmd.kind == CommandKind::help);
  CHECK(CommandParser::parse("STATUS", cmd, err));
  CHECK(cmd.kind == CommandKind::status);
  return true;
}

bool test_parser_rejects_malformed_lines() {
  Command cmd;
  std::string err;

  CHECK(!CommandParser::parse("   ", cmd, err));
  CHECK(err == "empty command");
  CHECK(!CommandParser::parse("dance now", cmd, err));
  CHECK(err == "unsupported command");
  CHECK(cmd.kind == CommandKind::none);

  CHECK(!CommandParser::parse("recovery incident-1 0", cmd, err));
  CHECK(err == "usage: recovery <incident> <step>");
  CHECK(!CommandParser::parse("recovery incident-1 70000", cmd, err));
  CHECK(!CommandParser::parse("recovery incident-1 3 extra", cmd, err));
  CHECK(!CommandParser::parse("lockdown maybe", cmd, err));
  CHECK(!CommandParser::parse("power restored now", cmd, err));
  CHECK(err == "usage: power fail|restored");
  CHECK(!CommandParser::parse("wellbeing wellbeing-1", cmd, err));
  CHECK(!CommandParser::parse("route front_door open", cmd, err));
  CHECK(!CommandParser::parse("config window_ms -1", cmd, err));
  CHECK(err == "usage: config <key> <value>");
  CHECK(!CommandParser::parse("trigger", cmd, err));

  uint32_t v = 0;
  CHECK(!CommandParser::parseUint32Strict("4294967296", v));
  CHECK(CommandParser::parseUint32Strict("4294967295", v));
  CHECK(v == 4294967295u);
  return true;
}

bool test_remote_authorization() {
  std::string line;

  CHECK(CommandParser::authorize(" status ", "", false, line) == AuthResult::ok);
  CHECK(line == "status");
  CHECK(CommandParser::authorize("trigger fire", "", false, line) == AuthResult::token_required);
  CHECK(line.empty());
  CHECK(CommandParser::authorize("trigger fire", "", true, line) == AuthResult::ok);
  CHECK(line == "trigger fire");

  CHECK(CommandParser::authorize("SECRET|panic kitchen", "secret", false, line) == AuthResult::ok);
  CHECK(line == "panic kitchen");
  CHECK(CommandParser::authorize("wrong|status", "secret", false, line) == AuthResult::unauthorized);
  CHECK(CommandParser::authorize("status", "secret", false, line) == AuthResult::unauthorized);
  CHECK(CommandParser::authorize("|status", "secret", false, line) == AuthResult::unauthorized);
  CHECK(CommandParser::authorize("secret|   ", "secret", false, line) == AuthResult::unauthorized);
  return true;
}

bool test_log_sink_respects_level() {
  Log::setSink(countingSink);
  Log::setLevel(LogLevel::warn);
  gLogLines = 0;

  LOG_INFO("TEST", "dropped %d", 1);
  CHECK(gLogLines == 0);
  LOG_ERROR("TEST", "kept %s", "line");
  CHECK(gLogLines == 1);
  CHECK(gLastLevel == LogLevel::error);

  EmergencyEngine engine;
  engine.triggerEmergency("volcano", "", "", 0);
  CHECK(gLogLines == 2);

  Log::setSink(nullptr);
  Log::setLevel(LogLevel::info);
  return true;
}

PublishMsg makeMsg(PublishKind kind, const char* id, uint32_t ts = 0) {
  PublishMsg m;
  m.kind = kind;
  m.ts_ms = ts;
  std::snprintf(m.id, sizeof(m.id), "%s", id);
  return m;
}

struct MemoryBackend : public PublishStore::Backend {
  std::vector<PublishMsg> slots;
  std::vector<bool> written;
  uint32_t head = 0;
  uint32_t tail = 0;
  uint32_t count = 0;
  int slotWrites = 0;
  int metaWrites = 0;

  explicit MemoryBackend(uint32_t cap) : slots(cap), written(cap, false) {}

  bool loadMeta(uint32_t& h, uint32_t& t, uint32_t& c) override {
    h = head;
    t = tail;
    c = count;
    return true;
  }
  bool loadSlot(uint32_t idx, PublishMsg& out) override {
    if (idx >= slots.size() || !written[idx]) return false;
    out = slots[idx];
    return true;
  }
  void saveMeta(uint32_t h, uint32_t t, uint32_t c) override {
    head = h;
    tail = t;
    count = c;
    ++metaWrites;
  }
  void saveSlot(uint32_t idx, const PublishMsg& msg) override {
    slots[idx] = msg;
    written[idx] = true;
    ++slotWrites;
  }
};

bool test_offline_store_keeps_incident_traffic_over_heartbeats() {
  PublishStore store(4);

  CHECK(store.push(makeMsg(PublishKind::status, "status", 1)) == StoreResult::stored);
  CHECK(store.push(makeMsg(PublishKind::status, "status", 2)) == StoreResult::coalesced);
  CHECK(store.size() == 1);
  PublishMsg head;
  CHECK(store.peek(head));
  CHECK(head.ts_ms == 2);

  CHECK(store.push(makeMsg(PublishKind::incident, "incident-1")) == StoreResult::stored);
  CHECK(store.push(makeMsg(PublishKind::alert, "alert-1")) == StoreResult::stored);
  CHECK(store.push(makeMsg(PublishKind::action, "action-1")) == StoreResult::stored);
  CHECK(store.size() == 4);

  CHECK(store.push(makeMsg(PublishKind::alert, "alert-2")) == StoreResult::evicted_status);
  CHECK(store.size() == 4);
  CHECK(store.evictions() == 1);

  // Full of incident traffic: later messages of any kind are dropped.
  CHECK(store.push(makeMsg(PublishKind::status, "status", 3)) == StoreResult::dropped);
  CHECK(store.push(makeMsg(PublishKind::action, "action-2")) == StoreResult::dropped);
  CHECK(store.drops() == 2);

  const char* expected[] = {"incident-1", "alert-1", "action-1", "alert-2"};
  for (const char* id : expected) {
    CHECK(store.peek(head));
    CHECK(std::string(head.id) == id);
    store.pop();
  }
  CHECK(store.empty());
  CHECK(!store.peek(head));
  return true;
}

bool test_offline_store_restores_from_backend() {
  MemoryBackend nvs(4);
  {
    PublishStore store(4);
    store.attachBackend(&nvs);
    CHECK(store.restore() == 0);
    store.push(makeMsg(PublishKind::incident, "incident-1"));
    store.push(makeMsg(PublishKind::status, "status", 10));
    const int metaBefore = nvs.metaWrites;
    const int slotsBefore = nvs.slotWrites;
    CHECK(store.push(makeMsg(PublishKind::status, "status", 20)) == StoreResult::coalesced);
    CHECK(nvs.slotWrites == slotsBefore + 1);
    CHECK(nvs.metaWrites == metaBefore);
  }

  PublishStore rebooted(4);
  rebooted.attachBackend(&nvs);
  CHECK(rebooted.restore() == 2);
  PublishMsg m;
  CHECK(rebooted.peek(m));
  CHECK(std::string(m.id) == "incident-1");
  rebooted.pop();
  CHECK(rebooted.peek(m));
  CHECK(m.kind == PublishKind::status);
  CHECK(m.ts_ms == 20);

  nvs.count = 5;
  PublishStore corrupt(4);
  corrupt.attachBackend(&nvs);
  CHECK(corrupt.restore() == 0);
  CHECK(corrupt.empty());
  CHECK(nvs.count == 0);
  return true;
}

} // namespace

int main() {
  bool ok = true;

  ok &= test_sensor_reports_correlate_into_fire_on_tick();
  ok &= test_single_sensor_stays_a_warning();
  ok &= test_tick_before_begin_does_nothing();
  ok &= test_stop_keeps_log_and_clears_transient_state();
  ok &= test_configure_applies_new_window();
  ok &= test_config_keys_validate_ranges();
  ok &= test_parser_accepts_command_grammar();
  ok &= test_parser_rejects_malformed_lines();
  ok &= test_remote_authorization();
  ok &= test_log_sink_respects_level();
  ok &= test_offline_store_keeps_incident_traffic_over_heartbeats();
  ok &= test_offline_store_restores_from_backend();

  if (!ok) return 1;

  std::cout << "native_flow tests passed\n";
  return 0;
}
