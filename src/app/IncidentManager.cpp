#include "app/IncidentManager.h"

#include "app/Log.h"
#include "app/SafetyModeController.h"
#include "app/WellbeingScheduler.h"

namespace {
constexpr const char* TAG = "INCIDENT";
constexpr const char* kDefaultResolution = "Manually resolved";
} // namespace

Incident* IncidentManager::findMutable(const std::string& incidentId) {
  for (Incident& i : log_) {
    if (i.id == incidentId) return &i;
  }
  return nullptr;
}

const Incident* IncidentManager::find(const std::string& incidentId) const {
  for (const Incident& i : log_) {
    if (i.id == incidentId) return &i;
  }
  return nullptr;
}

const Incident* IncidentManager::findActiveByType(const std::string& typeId) const {
  for (size_t idx : active_) {
    if (log_[idx].type_id == typeId) return &log_[idx];
  }
  return nullptr;
}

const RecoveryPlan* IncidentManager::recoveryPlan(const std::string& incidentId) const {
  for (const RecoveryPlan& p : plans_) {
    if (p.incident_id == incidentId) return &p;
  }
  return nullptr;
}

void IncidentManager::runProtocol(Incident& incident, const EmergencyType& type, uint32_t nowMs) {
  uint16_t step = 1;
  for (const ProtocolStep& s : type.protocol) {
    ActionRecord r;
    r.step = step++;
    r.kind = s.kind;
    r.description = s.description;
    r.executed_at_ms = nowMs;
    r.status = executor_ ? executor_->execute(s.kind, s.description, incident.id) : StepStatus::failed;
    incident.actions_executed.push_back(r);
  }
  LOG_INFO(TAG, "%s: %u protocol steps executed", incident.id.c_str(), (unsigned)type.protocol.size());

  if (dispatcher_) {
    const uint16_t n = dispatcher_->dispatch(incident, type, incident.alerts_sent);
    LOG_INFO(TAG, "%s: %u alerts sent", incident.id.c_str(), (unsigned)n);
  }

  for (const ProtocolStep& s : type.auto_actions) {
    ActionRecord r;
    r.step = step++;
    r.kind = s.kind;
    r.description = s.description;
    r.automatic = true;
    r.executed_at_ms = nowMs;
    r.status = executor_ ? executor_->execute(s.kind, s.description, incident.id) : StepStatus::failed;
    incident.actions_executed.push_back(r);
  }
}

IncidentManager::TriggerResult IncidentManager::trigger(const std::string& typeId,
                                                        const std::string& reason,
                                                        const std::string& details,
                                                        uint32_t nowMs,
                                                        const TriggerTags* tags) {
  TriggerResult res;
  const EmergencyType* type = catalog_ ? catalog_->find(typeId) : nullptr;
  if (!type) {
    ++stats_.rejected;
    res.outcome = Outcome::not_found;
    LOG_ERROR(TAG, "unknown emergency type %s", typeId.c_str());
    return res;
  }

  for (size_t idx : active_) {
    Incident& existing = log_[idx];
    if (existing.type_id != typeId) continue;

    IncidentUpdate u;
    u.reason = reason;
    u.details = details;
    u.ts_ms = nowMs;
    existing.updates.push_back(u);
    existing.reason = reason;
    if (tags && tags->panic_button) {
      existing.panic_button = true;
      existing.source = tags->source;
    }
    ++stats_.deduplicated;
    LOG_INFO(TAG, "%s already active as %s, update appended", typeId.c_str(), existing.id.c_str());
    if (observer_) observer_->onIncidentUpdated(existing, existing.updates.back());

    res.incident_id = existing.id;
    return res;
  }

  Incident inc;
  inc.id = "incident-" + std::to_string(nextSeq_++);
  inc.type_id = type->id;
  inc.label = type->label;
  inc.severity = type->severity;
  inc.reason = reason;
  inc.details = details;
  inc.triggered_at_ms = nowMs;
  if (tags) {
    inc.panic_button = tags->panic_button;
    inc.source = tags->source;
  }

  log_.push_back(inc);
  const size_t idx = log_.size() - 1;
  active_.push_back(idx);
  ++stats_.created;

  LOG_WARN(TAG, "*** EMERGENCY: %s (severity %u) %s ***",
           type->label.c_str(), (unsigned)type->severity, log_[idx].id.c_str());
  LOG_WARN(TAG, "reason: %s", reason.c_str());

  runProtocol(log_[idx], *type, nowMs);

  if (observer_) observer_->onIncidentCreated(log_[idx]);

  res.created = true;
  res.incident_id = log_[idx].id;
  return res;
}

bool IncidentManager::buildRecoveryPlan(const Incident& incident, const EmergencyType& type, uint32_t nowMs) {
  if (type.recovery_steps.empty()) return false;

  RecoveryPlan plan;
  plan.incident_id = incident.id;
  plan.type_id = incident.type_id;
  plan.created_at_ms = nowMs;
  uint16_t n = 1;
  for (const std::string& s : type.recovery_steps) {
    RecoveryStep step;
    step.step = n++;
    step.description = s;
    plan.steps.push_back(step);
  }
  plans_.push_back(plan);
  LOG_INFO(TAG, "%s: recovery plan with %u steps", incident.id.c_str(), (unsigned)plan.steps.size());
  return true;
}

IncidentManager::ResolveResult IncidentManager::resolve(const std::string& incidentId,
                                                        const char* resolution,
                                                        uint32_t nowMs) {
  ResolveResult res;
  Incident* inc = findMutable(incidentId);
  if (!inc) {
    res.outcome = Outcome::not_found;
    LOG_WARN(TAG, "resolve: unknown incident %s", incidentId.c_str());
    return res;
  }
  if (inc->status == IncidentStatus::resolved) {
    res.outcome = Outcome::invalid_transition;
    LOG_WARN(TAG, "resolve: %s already resolved", incidentId.c_str());
    return res;
  }

  bool wasActive = false;
  for (size_t i = 0; i < active_.size(); ++i) {
    if (log_[active_[i]].id != incidentId) continue;
    active_.erase(active_.begin() + i);
    wasActive = true;
    break;
  }
  if (!wasActive) {
    // Dropped by an engine stop; it can no longer be resolved.
    res.outcome = Outcome::invalid_transition;
    LOG_WARN(TAG, "resolve: %s is not in the active set", incidentId.c_str());
    return res;
  }

  inc->status = IncidentStatus::resolved;
  inc->has_resolution = true;
  inc->resolved_at_ms = nowMs;
  inc->response_time_ms = (uint32_t)(nowMs - inc->triggered_at_ms);
  inc->resolution = resolution ? std::string(resolution) : std::string(kDefaultResolution);
  ++stats_.resolved;

  LOG_INFO(TAG, "%s resolved after %lu ms: %s",
           inc->id.c_str(), (unsigned long)inc->response_time_ms, inc->resolution.c_str());

  const std::string typeId = inc->type_id;
  const bool nothingLeft = active_.empty();

  // Lights stay on while any incident or lockdown still needs them.
  const bool lockdown = safety_ && safety_->lockdownActive();
  if (nothingLeft && !lockdown && executor_) executor_->lightsOff();

  if (wellbeing_) wellbeing_->schedule(incidentId, typeId, nowMs);

  if (nothingLeft && lockdown) {
    safety_->deactivateLockdown("All emergencies resolved", nowMs);
    ++stats_.lockdown_lifts;
  }

  const EmergencyType* type = catalog_ ? catalog_->find(typeId) : nullptr;
  const Incident* done = find(incidentId);
  res.incident = *done;
  if (type && buildRecoveryPlan(*done, *type, nowMs)) {
    res.has_recovery = true;
    res.recovery = plans_.back();
  }

  if (observer_) observer_->onIncidentResolved(*done, res.has_recovery ? &plans_.back() : nullptr);
  return res;
}

Outcome IncidentManager::completeRecoveryStep(const std::string& incidentId, uint16_t step, uint32_t nowMs) {
  RecoveryPlan* plan = nullptr;
  for (RecoveryPlan& p : plans_) {
    if (p.incident_id == incidentId) {
      plan = &p;
      break;
    }
  }
  if (!plan) return Outcome::not_found;

  RecoveryStep* target = nullptr;
  for (RecoveryStep& s : plan->steps) {
    if (s.step == step) {
      target = &s;
      break;
    }
  }
  if (!target) return Outcome::not_found;
  if (target->status == RecoveryStepStatus::completed) return Outcome::invalid_transition;

  target->status = RecoveryStepStatus::completed;
  target->completed_at_ms = nowMs;

  bool all = true;
  for (const RecoveryStep& s : plan->steps) {
    if (s.status != RecoveryStepStatus::completed) {
      all = false;
      break;
    }
  }
  plan->complete = all;

  LOG_INFO(TAG, "%s recovery step %u done%s", incidentId.c_str(), (unsigned)step, all ? ", plan complete" : "");
  if (observer_) observer_->onRecoveryStepCompleted(*plan, *target);
  return Outcome::ok;
}

void IncidentManager::activeIncidents(std::vector<Incident>& out) const {
  out.clear();
  for (size_t idx : active_) out.push_back(log_[idx]);
}

void IncidentManager::history(size_t limit, std::vector<Incident>& out) const {
  out.clear();
  for (size_t i = log_.size(); i > 0; --i) {
    if (limit != 0 && out.size() >= limit) break;
    out.push_back(log_[i - 1]);
  }
}
