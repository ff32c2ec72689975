#include "app/AlertDispatcher.h"

#include <stdio.h>

#include "app/Log.h"

namespace {
constexpr const char* TAG = "ALERT";

struct DefaultChannel {
  const char* id;
  const char* name;
  uint8_t level;
  uint16_t delayS;
};

// Escalation level doubles as the severity threshold. The level adds its own delay.
const DefaultChannel kDefaultChannels[] = {
  {"push",          "Push Notification",   1, 0},
  {"siren",         "Indoor Siren",        1, 0},
  {"voice",         "Voice Announcement",  1, 2},
  {"smart_display", "Smart Display Alert", 1, 0},
  {"sms",           "SMS Message",         2, 5},
  {"email",         "Email Alert",         2, 10},
  {"phone_call",    "Phone Call",          3, 30},
};

uint16_t levelDelayS(uint8_t level) {
  switch (level) {
    case 1: return 0;
    case 2: return 15;
    case 3: return 60;
    default: return 120;
  }
}

std::string timeText(uint32_t ms) {
  char buf[24];
  snprintf(buf, sizeof(buf), "T+%lus", (unsigned long)(ms / 1000u));
  return std::string(buf);
}
} // namespace

void AlertDispatcher::loadDefaults() {
  channels_.clear();
  for (const DefaultChannel& d : kDefaultChannels) {
    AlertChannel c;
    c.id = d.id;
    c.name = d.name;
    c.priority_threshold = d.level;
    c.delay_s = d.delayS;
    channels_.push_back(c);
  }
}

bool AlertDispatcher::setEnabled(const std::string& channelId, bool enabled) {
  for (AlertChannel& c : channels_) {
    if (c.id != channelId) continue;
    c.enabled = enabled;
    return true;
  }
  return false;
}

std::string AlertDispatcher::formatMessage(const AlertChannel& channel,
                                           const Incident& incident,
                                           const EmergencyType& type) const {
  const std::string base = "EMERGENCY: " + type.label + " (Severity " +
                           std::to_string((unsigned)type.severity) + "/5) - ";
  const std::string reason = "Reason: " + incident.reason;

  if (channel.id == "sms") {
    const std::string number = type.emergency_number.empty() ? std::string("112") : type.emergency_number;
    return base + reason + " Call " + number + " if needed.";
  }
  if (channel.id == "voice") {
    return "Attention! " + type.label + " emergency detected. " + incident.reason +
           ". Please follow evacuation procedures.";
  }
  if (channel.id == "smart_display") {
    return base + reason + " Time: " + timeText(incident.triggered_at_ms) +
           " Color: " + type.color_code + " Evacuation routes displayed.";
  }
  return base + reason + " Time: " + timeText(incident.triggered_at_ms) + " Follow emergency protocol.";
}

uint16_t AlertDispatcher::dispatch(const Incident& incident,
                                   const EmergencyType& type,
                                   std::vector<AlertRecord>& out) const {
  uint16_t n = 0;
  for (const AlertChannel& c : channels_) {
    if (!c.enabled) continue;
    if (incident.severity < c.priority_threshold) continue;

    AlertRecord r;
    r.channel_id = c.id;
    r.channel_name = c.name;
    r.escalation_level = c.priority_threshold;
    r.delay_s = (uint16_t)(c.delay_s + levelDelayS(c.priority_threshold));
    r.message = formatMessage(c, incident, type);
    r.sent_at_ms = incident.triggered_at_ms;
    r.status = AlertStatus::sent;
    out.push_back(r);
    ++n;
    LOG_INFO(TAG, "[L%u] %s: %s", (unsigned)c.priority_threshold, c.name.c_str(), type.label.c_str());
  }

  if (incident.severity < contactThreshold_ || !contacts_) return n;

  std::vector<EmergencyContact> ordered;
  contacts_->sorted(ordered);
  for (const EmergencyContact& contact : ordered) {
    AlertRecord r;
    r.channel_id = kContactChannelId;
    r.channel_name = "Contact Notification";
    r.contact_name = contact.name;
    r.contact_number = contact.number;
    r.contact_type = contact.type;
    r.sent_at_ms = incident.triggered_at_ms;
    r.status = contact.auto_call ? AlertStatus::auto_called : AlertStatus::notified;
    out.push_back(r);
    ++n;
    LOG_INFO(TAG, "contact %s (%s) %s", contact.name.c_str(), contact.number.c_str(), toString(r.status));
  }
  return n;
}
