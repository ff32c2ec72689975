#include "app/CorrelationBuffer.h"

#include "app/Log.h"

namespace {
constexpr const char* TAG = "CORR";

bool before(uint32_t a, uint32_t b) {
  return (int32_t)(a - b) < 0;
}
} // namespace

bool CorrelationBuffer::inWindow(uint32_t nowMs, uint32_t tsMs) const {
  if (before(nowMs, tsMs)) return true;
  return (uint32_t)(nowMs - tsMs) < windowMs_;
}

CorrelationBuffer::ReportResult CorrelationBuffer::report(const std::string& sensorId,
                                                          const std::string& eventType,
                                                          const std::string& payload,
                                                          uint32_t nowMs) {
  ReportResult res;
  const SensorRecord* sensor = registry_ ? registry_->find(sensorId) : nullptr;
  if (!sensor) {
    ++stats_.rejected;
    res.outcome = Outcome::not_found;
    LOG_WARN(TAG, "unknown sensor %s", sensorId.c_str());
    return res;
  }

  // Keep insertion order monotonic even if the caller's clock steps back.
  uint32_t ts = nowMs;
  if (!events_.empty() && before(ts, events_.back().ts_ms)) {
    ts = events_.back().ts_ms;
  }

  registry_->markTriggered(sensorId, ts);

  SensorEvent e;
  e.sensor_id = sensor->id;
  e.sensor_type = sensor->type;
  e.location = sensor->location;
  e.floor = sensor->floor;
  e.event_type = eventType;
  e.payload = payload;
  e.ts_ms = ts;
  events_.push_back(e);
  ++stats_.accepted;

  LOG_INFO(TAG, "%s at %s - %s", toString(e.sensor_type), e.location.c_str(), eventType.c_str());

  uint16_t sameType = 0;
  for (const SensorEvent& b : events_) {
    if (b.sensor_type == e.sensor_type && inWindow(ts, b.ts_ms)) ++sameType;
  }
  if (sameType == 1) {
    res.single_sensor_warning = true;
    ++stats_.warnings;
    LOG_INFO(TAG, "single %s trigger, monitoring for confirmation", toString(e.sensor_type));
  }

  res.event = e;
  return res;
}

void CorrelationBuffer::prune(uint32_t nowMs) {
  size_t keep = 0;
  for (size_t i = 0; i < events_.size(); ++i) {
    if (!inWindow(nowMs, events_[i].ts_ms)) {
      ++stats_.pruned;
      continue;
    }
    if (keep != i) events_[keep] = events_[i];
    ++keep;
  }
  events_.resize(keep);
}

void CorrelationBuffer::tick(uint32_t nowMs, std::vector<CorrelationMatch>& out) {
  prune(nowMs);
  if (events_.size() < 2) return;

  for (const CorrelationRule& rule : rules_) {
    CorrelationMatch m;
    if (!CorrelationRules::evaluate(rule, events_, m)) continue;

    ++stats_.matched;
    LOG_INFO(TAG, "rule %s matched -> %s", rule.id.c_str(), rule.emergency_type.c_str());
    out.push_back(m);

    size_t keep = 0;
    for (size_t i = 0; i < events_.size(); ++i) {
      if (CorrelationRules::consumes(rule, events_[i])) continue;
      if (keep != i) events_[keep] = events_[i];
      ++keep;
    }
    events_.resize(keep);
    if (events_.size() < 2) break;
  }
}
