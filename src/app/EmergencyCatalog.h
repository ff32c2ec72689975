#pragma once

#include <stdint.h>

#include <string>
#include <vector>

// What a protocol step does. advisory steps carry guidance text only.
enum class ActionKind : uint8_t {
  advisory,
  siren,
  emergency_lighting,
  unlock_doors,
  lock_doors,
  cut_hvac,
  sprinklers,
  notify_residents,
  call_emergency_services,
  notify_contacts,
  display_evacuation,
  shut_water_main,
  cut_power,
  sump_pump,
  cut_gas,
  open_ventilation,
  evacuate,
  record_cameras,
  lock_safe_room,
  exterior_lights,
  ups_switchover,
  start_generator,
  reduce_load,
  close_shutters,
  arm_perimeter,
  monitor_sensors
};

static const char* toString(ActionKind k) {
  switch (k) {
    case ActionKind::advisory:                return "advisory";
    case ActionKind::siren:                   return "siren";
    case ActionKind::emergency_lighting:      return "emergency_lighting";
    case ActionKind::unlock_doors:            return "unlock_doors";
    case ActionKind::lock_doors:              return "lock_doors";
    case ActionKind::cut_hvac:                return "cut_hvac";
    case ActionKind::sprinklers:              return "sprinklers";
    case ActionKind::notify_residents:        return "notify_residents";
    case ActionKind::call_emergency_services: return "call_emergency_services";
    case ActionKind::notify_contacts:         return "notify_contacts";
    case ActionKind::display_evacuation:      return "display_evacuation";
    case ActionKind::shut_water_main:         return "shut_water_main";
    case ActionKind::cut_power:               return "cut_power";
    case ActionKind::sump_pump:               return "sump_pump";
    case ActionKind::cut_gas:                 return "cut_gas";
    case ActionKind::open_ventilation:        return "open_ventilation";
    case ActionKind::evacuate:                return "evacuate";
    case ActionKind::record_cameras:          return "record_cameras";
    case ActionKind::lock_safe_room:          return "lock_safe_room";
    case ActionKind::exterior_lights:         return "exterior_lights";
    case ActionKind::ups_switchover:          return "ups_switchover";
    case ActionKind::start_generator:         return "start_generator";
    case ActionKind::reduce_load:             return "reduce_load";
    case ActionKind::close_shutters:          return "close_shutters";
    case ActionKind::arm_perimeter:           return "arm_perimeter";
    case ActionKind::monitor_sensors:         return "monitor_sensors";
    default:                                  return "unknown";
  }
}

struct ProtocolStep {
  ActionKind kind = ActionKind::advisory;
  std::string description;
};

struct EmergencyType {
  std::string id;
  std::string label;
  uint8_t severity = 3;
  std::string color_code;
  std::string emergency_number;
  std::vector<ProtocolStep> protocol;
  std::vector<ProtocolStep> auto_actions;
  std::vector<std::string> recovery_steps;
};

class EmergencyCatalog {
public:
  void loadDefaults();

  bool add(const EmergencyType& type);
  const EmergencyType* find(const std::string& id) const;
  const std::vector<EmergencyType>& types() const { return types_; }

private:
  std::vector<EmergencyType> types_;
};
