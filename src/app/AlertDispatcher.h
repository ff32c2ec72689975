#pragma once

#include <stdint.h>

#include <string>
#include <vector>

#include "app/ContactBook.h"
#include "app/EmergencyCatalog.h"
#include "app/Incident.h"

struct AlertChannel {
  std::string id;
  std::string name;
  uint8_t priority_threshold = 1;
  uint16_t delay_s = 0;
  bool enabled = true;
};

class AlertDispatcher {
public:
  static constexpr const char* kContactChannelId = "contact_notification";

  void loadDefaults();
  void attachContacts(const ContactBook* contacts) { contacts_ = contacts; }
  void setContactThreshold(uint8_t severity) { contactThreshold_ = severity; }

  bool setEnabled(const std::string& channelId, bool enabled);
  const std::vector<AlertChannel>& channels() const { return channels_; }

  // Appends one record per fired channel, then one per contact when the
  // severity reaches the contact threshold. Returns the number appended.
  uint16_t dispatch(const Incident& incident, const EmergencyType& type, std::vector<AlertRecord>& out) const;

  std::string formatMessage(const AlertChannel& channel, const Incident& incident, const EmergencyType& type) const;

private:
  std::vector<AlertChannel> channels_;
  const ContactBook* contacts_ = nullptr;
  uint8_t contactThreshold_ = 4;
};
