#pragma once

#include <stdint.h>

#include <string>
#include <vector>

#include "app/EmergencyCatalog.h"

enum class IncidentStatus : uint8_t {
  active,
  resolved
};

enum class StepStatus : uint8_t {
  executed,
  failed
};

enum class AlertStatus : uint8_t {
  sent,
  notified,
  auto_called
};

static const char* toString(IncidentStatus s) {
  switch (s) {
    case IncidentStatus::active:   return "active";
    case IncidentStatus::resolved: return "resolved";
    default:                       return "unknown";
  }
}

static const char* toString(StepStatus s) {
  switch (s) {
    case StepStatus::executed: return "executed";
    case StepStatus::failed:   return "failed";
    default:                   return "unknown";
  }
}

static const char* toString(AlertStatus s) {
  switch (s) {
    case AlertStatus::sent:        return "sent";
    case AlertStatus::notified:    return "notified";
    case AlertStatus::auto_called: return "auto_called";
    default:                       return "unknown";
  }
}

struct ActionRecord {
  uint16_t step = 0;
  ActionKind kind = ActionKind::advisory;
  std::string description;
  bool automatic = false;
  StepStatus status = StepStatus::executed;
  uint32_t executed_at_ms = 0;
};

struct AlertRecord {
  std::string channel_id;
  std::string channel_name;
  uint8_t escalation_level = 0;
  uint16_t delay_s = 0;
  std::string message;
  uint32_t sent_at_ms = 0;
  std::string contact_name;
  std::string contact_number;
  std::string contact_type;
  AlertStatus status = AlertStatus::sent;
};

struct IncidentUpdate {
  std::string reason;
  std::string details;
  uint32_t ts_ms = 0;
};

struct Incident {
  std::string id;
  std::string type_id;
  std::string label;
  uint8_t severity = 0;
  IncidentStatus status = IncidentStatus::active;
  std::string reason;
  std::string details;
  uint32_t triggered_at_ms = 0;

  // Set once, on resolution.
  bool has_resolution = false;
  uint32_t resolved_at_ms = 0;
  uint32_t response_time_ms = 0;
  std::string resolution;

  bool panic_button = false;
  std::string source;

  std::vector<ActionRecord> actions_executed;
  std::vector<AlertRecord> alerts_sent;
  std::vector<IncidentUpdate> updates;
};

enum class RecoveryStepStatus : uint8_t {
  pending,
  completed
};

static const char* toString(RecoveryStepStatus s) {
  switch (s) {
    case RecoveryStepStatus::pending:   return "pending";
    case RecoveryStepStatus::completed: return "completed";
    default:                            return "unknown";
  }
}

struct RecoveryStep {
  uint16_t step = 0;
  std::string description;
  RecoveryStepStatus status = RecoveryStepStatus::pending;
  uint32_t completed_at_ms = 0;
};

struct RecoveryPlan {
  std::string incident_id;
  std::string type_id;
  uint32_t created_at_ms = 0;
  std::vector<RecoveryStep> steps;
  bool complete = false;
};
