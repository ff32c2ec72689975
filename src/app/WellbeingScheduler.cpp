#include "app/WellbeingScheduler.h"

#include "app/Log.h"

namespace {
constexpr const char* TAG = "WELL";

bool reached(uint32_t nowMs, uint32_t targetMs) {
  return (int32_t)(nowMs - targetMs) >= 0;
}
} // namespace

const WellbeingCheck& WellbeingScheduler::schedule(const std::string& incidentId,
                                                   const std::string& typeId,
                                                   uint32_t nowMs) {
  WellbeingCheck c;
  c.id = "wellbeing-" + std::to_string(nextSeq_++);
  c.incident_id = incidentId;
  c.type_id = typeId;
  c.person = "all_residents";
  c.scheduled_at_ms = nowMs;
  pending_.push_back(c);

  LOG_INFO(TAG, "check %s scheduled for %s", c.id.c_str(), incidentId.c_str());
  if (observer_) observer_->onWellbeingScheduled(pending_.back());
  return pending_.back();
}

Outcome WellbeingScheduler::respond(const std::string& checkId, const std::string& response, uint32_t nowMs) {
  for (size_t i = 0; i < pending_.size(); ++i) {
    if (pending_[i].id != checkId) continue;
    WellbeingCheck c = pending_[i];
    c.status = CheckStatus::completed;
    c.response = response;
    c.responded_at_ms = nowMs;
    pending_.erase(pending_.begin() + i);
    completed_.push_back(c);
    LOG_INFO(TAG, "check %s answered: %s", checkId.c_str(), response.c_str());
    return Outcome::ok;
  }
  LOG_WARN(TAG, "unknown check %s", checkId.c_str());
  return Outcome::not_found;
}

uint16_t WellbeingScheduler::poll(uint32_t nowMs) {
  uint16_t n = 0;
  for (WellbeingCheck& c : pending_) {
    if (c.escalated) continue;
    if (!reached(nowMs, c.scheduled_at_ms + overdueMs_)) continue;
    c.escalated = true;
    ++escalations_;
    ++n;
    LOG_WARN(TAG, "check %s overdue, escalating", c.id.c_str());
    if (observer_) observer_->onWellbeingOverdue(c);
  }
  return n;
}
