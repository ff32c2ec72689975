#pragma once

#include <stdint.h>

#include <string>
#include <vector>

#include "app/Outcome.h"

struct EmergencyContact {
  std::string id;
  std::string name;
  std::string number;
  std::string type;
  uint8_t priority = 5;
  bool auto_call = false;
};

class ContactBook {
public:
  void loadDefaults();

  // Rejects contacts without name, number or type. A priority of 0 means default (5).
  Outcome add(const EmergencyContact& contact, std::string& outId);
  Outcome remove(const std::string& id);
  const EmergencyContact* find(const std::string& id) const;

  // Ascending priority; ties keep insertion order.
  void sorted(std::vector<EmergencyContact>& out) const;
  const std::vector<EmergencyContact>& contacts() const { return contacts_; }

private:
  std::vector<EmergencyContact> contacts_;
  uint32_t nextSeq_ = 1;
};
