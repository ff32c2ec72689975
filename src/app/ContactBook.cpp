#include "app/ContactBook.h"

#include <algorithm>

#include "app/Log.h"

namespace {
constexpr const char* TAG = "CONTACT";
constexpr uint8_t kDefaultPriority = 5;

struct DefaultContact {
  const char* id;
  const char* name;
  const char* number;
  const char* type;
  uint8_t priority;
  bool autoCall;
};

const DefaultContact kDefaultContacts[] = {
  {"sos",       "SOS Alarm",                        "112",             "emergency", 1, true},
  {"police",    "Polisen",                          "114 14",          "police",    2, false},
  {"fire_dept", "Brandkaaren",                      "112",             "fire",      1, true},
  {"ambulance", "Ambulans",                         "112",             "medical",   1, true},
  {"poison",    "Giftinformationscentralen",        "010-456 67 00",   "poison",    3, false},
  {"hospital",  "Karolinska Universitetssjukhuset", "08-517 700 00",   "hospital",  3, false},
  {"family1",   "Erik Johansson (Brother)",         "+46-70-123-4567", "family",    2, false},
  {"family2",   "Anna Lindstroem (Mother)",         "+46-73-987-6543", "family",    2, false},
  {"neighbor1", "Lars Nilsson (Neighbor)",          "+46-70-555-1234", "neighbor",  4, false},
  {"neighbor2", "Maria Svensson (Neighbor)",        "+46-70-555-5678", "neighbor",  4, false},
};
} // namespace

void ContactBook::loadDefaults() {
  contacts_.clear();
  for (const DefaultContact& d : kDefaultContacts) {
    EmergencyContact c;
    c.id = d.id;
    c.name = d.name;
    c.number = d.number;
    c.type = d.type;
    c.priority = d.priority;
    c.auto_call = d.autoCall;
    contacts_.push_back(c);
  }
}

Outcome ContactBook::add(const EmergencyContact& contact, std::string& outId) {
  if (contact.name.empty() || contact.number.empty() || contact.type.empty()) {
    LOG_WARN(TAG, "rejected contact: name, number and type are required");
    return Outcome::validation_failure;
  }

  EmergencyContact c = contact;
  if (c.id.empty() || find(c.id)) {
    do {
      c.id = "contact-" + std::to_string(nextSeq_++);
    } while (find(c.id));
  }
  if (c.priority == 0) c.priority = kDefaultPriority;

  contacts_.push_back(c);
  outId = c.id;
  LOG_INFO(TAG, "added %s (%s)", c.name.c_str(), c.id.c_str());
  return Outcome::ok;
}

Outcome ContactBook::remove(const std::string& id) {
  for (size_t i = 0; i < contacts_.size(); ++i) {
    if (contacts_[i].id != id) continue;
    contacts_.erase(contacts_.begin() + i);
    return Outcome::ok;
  }
  return Outcome::not_found;
}

const EmergencyContact* ContactBook::find(const std::string& id) const {
  for (const EmergencyContact& c : contacts_) {
    if (c.id == id) return &c;
  }
  return nullptr;
}

void ContactBook::sorted(std::vector<EmergencyContact>& out) const {
  out = contacts_;
  std::stable_sort(out.begin(), out.end(), [](const EmergencyContact& a, const EmergencyContact& b) {
    return a.priority < b.priority;
  });
}
