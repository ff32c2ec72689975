#pragma once

#include <stdint.h>

#include <string>
#include <vector>

#include "app/EngineObserver.h"
#include "app/Outcome.h"

enum class CheckStatus : uint8_t {
  pending,
  completed
};

static const char* toString(CheckStatus s) {
  switch (s) {
    case CheckStatus::pending:   return "pending";
    case CheckStatus::completed: return "completed";
    default:                     return "unknown";
  }
}

struct WellbeingCheck {
  std::string id;
  std::string incident_id;
  std::string type_id;
  std::string person;
  uint32_t scheduled_at_ms = 0;
  CheckStatus status = CheckStatus::pending;
  bool escalated = false;
  std::string response;
  uint32_t responded_at_ms = 0;
};

// Post-incident occupant check-ins. Checks move from pending to completed
// and are never deleted.
class WellbeingScheduler {
public:
  void attachObserver(EngineObserver* observer) { observer_ = observer; }
  void setOverdueAfter(uint32_t ms) { overdueMs_ = ms; }

  const WellbeingCheck& schedule(const std::string& incidentId, const std::string& typeId, uint32_t nowMs);
  Outcome respond(const std::string& checkId, const std::string& response, uint32_t nowMs);

  // Escalates pending checks past the overdue limit, once each.
  uint16_t poll(uint32_t nowMs);

  const std::vector<WellbeingCheck>& pending() const { return pending_; }
  const std::vector<WellbeingCheck>& completed() const { return completed_; }
  uint32_t escalations() const { return escalations_; }

private:
  EngineObserver* observer_ = nullptr;
  std::vector<WellbeingCheck> pending_;
  std::vector<WellbeingCheck> completed_;
  uint32_t overdueMs_ = 1800000;
  uint32_t nextSeq_ = 1;
  uint32_t escalations_ = 0;
};
