#include "app/EmergencyCatalog.h"

#include <initializer_list>

namespace {
using K = ActionKind;

EmergencyType makeType(const char* id,
                       const char* label,
                       uint8_t severity,
                       const char* color,
                       const char* number,
                       std::initializer_list<ProtocolStep> protocol,
                       std::initializer_list<ProtocolStep> autoActions,
                       std::initializer_list<const char*> recovery) {
  EmergencyType t;
  t.id = id;
  t.label = label;
  t.severity = severity;
  t.color_code = color;
  t.emergency_number = number;
  t.protocol.assign(protocol.begin(), protocol.end());
  t.auto_actions.assign(autoActions.begin(), autoActions.end());
  for (const char* step : recovery) t.recovery_steps.push_back(step);
  return t;
}
} // namespace

void EmergencyCatalog::loadDefaults() {
  types_.clear();

  types_.push_back(makeType(
    "fire", "Fire", 5, "#FF0000", "112",
    {
      {K::siren, "Activate fire alarm sirens on all floors"},
      {K::cut_hvac, "Cut HVAC system to prevent smoke spread"},
      {K::unlock_doors, "Unlock all exterior doors for evacuation"},
      {K::emergency_lighting, "Activate emergency lighting on evacuation routes"},
      {K::sprinklers, "Activate sprinkler system in affected zone"},
      {K::notify_residents, "Send push notification to all residents"},
      {K::call_emergency_services, "Call emergency services (112)"},
      {K::notify_contacts, "Send SMS to emergency contacts"},
      {K::display_evacuation, "Display evacuation route on smart displays"},
      {K::monitor_sensors, "Monitor temperature sensors for fire spread"},
    },
    {
      {K::sprinklers, "activate_sprinklers"},
      {K::unlock_doors, "unlock_doors"},
      {K::cut_hvac, "cut_hvac"},
      {K::emergency_lighting, "activate_emergency_lighting"},
    },
    {
      "Wait for fire department clearance",
      "Ventilate affected areas",
      "Inspect structural damage",
      "Check electrical systems",
      "Document damage for insurance",
      "Schedule professional cleaning",
    }));

  types_.push_back(makeType(
    "flood", "Flood / Water Leak", 4, "#0066FF", "112",
    {
      {K::shut_water_main, "Shut off main water valve automatically"},
      {K::cut_power, "Cut power to affected zones to prevent electrocution"},
      {K::sump_pump, "Activate sump pumps if available"},
      {K::notify_residents, "Send immediate alert to all residents"},
      {K::notify_contacts, "Notify water damage restoration service"},
      {K::advisory, "Document water levels and affected areas"},
      {K::advisory, "Move valuable items if time permits"},
      {K::advisory, "Contact insurance provider"},
    },
    {
      {K::shut_water_main, "shut_water_main"},
      {K::cut_power, "cut_power_affected"},
      {K::sump_pump, "activate_sump_pump"},
      {K::emergency_lighting, "activate_emergency_lighting"},
    },
    {
      "Assess water damage extent",
      "Remove standing water",
      "Run dehumidifiers",
      "Inspect for mold growth",
      "Restore power after safety check",
      "Document all damages",
    }));

  types_.push_back(makeType(
    "gas-leak", "Gas Leak", 5, "#FFAA00", "112",
    {
      {K::cut_gas, "Immediately shut off gas supply valve"},
      {K::cut_power, "Cut all electrical power to prevent ignition"},
      {K::open_ventilation, "Open all windows and ventilation automatically"},
      {K::siren, "Sound evacuation alarm"},
      {K::advisory, "Do NOT use any electrical switches"},
      {K::evacuate, "Evacuate all residents immediately"},
      {K::call_emergency_services, "Call emergency services (112)"},
      {K::notify_contacts, "Call gas company emergency line"},
      {K::advisory, "Wait outside for professional clearance"},
      {K::advisory, "Do not re-enter until declared safe"},
    },
    {
      {K::cut_gas, "cut_gas_supply"},
      {K::cut_power, "cut_power"},
      {K::open_ventilation, "open_ventilation"},
      {K::evacuate, "evacuate"},
      {K::emergency_lighting, "activate_emergency_lighting"},
    },
    {
      "Wait for gas company clearance",
      "Professional gas line inspection",
      "Ventilate entire home thoroughly",
      "Relight pilot lights professionally",
      "Test all gas appliances",
      "Install additional gas detectors if needed",
    }));

  types_.push_back(makeType(
    "carbon-monoxide", "Carbon Monoxide", 5, "#FF6600", "112",
    {
      {K::siren, "Sound CO alarm on all floors"},
      {K::cut_hvac, "Shut down all combustion appliances"},
      {K::open_ventilation, "Open all windows and doors for ventilation"},
      {K::evacuate, "Evacuate all residents immediately"},
      {K::call_emergency_services, "Call emergency services (112)"},
      {K::advisory, "Account for all household members"},
      {K::advisory, "Seek medical attention for anyone with symptoms"},
      {K::advisory, "Do not re-enter until CO levels are safe"},
      {K::advisory, "Have professional inspect heating system"},
    },
    {
      {K::cut_hvac, "cut_heating"},
      {K::open_ventilation, "open_ventilation"},
      {K::evacuate, "evacuate"},
      {K::emergency_lighting, "activate_emergency_lighting"},
    },
    {
      "Professional HVAC inspection",
      "Check all combustion appliances",
      "Verify CO detector functionality",
      "Medical follow-up for exposed persons",
      "Install additional CO detectors",
      "Service or replace faulty equipment",
    }));

  types_.push_back(makeType(
    "intruder", "Intruder / Break-in", 4, "#FF00FF", "114 14",
    {
      {K::siren, "Activate intruder alarm siren"},
      {K::lock_safe_room, "Lock safe room automatically"},
      {K::exterior_lights, "Turn on all exterior and interior lights"},
      {K::record_cameras, "Begin recording on all security cameras"},
      {K::notify_residents, "Send silent alert to residents"},
      {K::call_emergency_services, "Call police (114 14)"},
      {K::notify_residents, "Send camera snapshots to residents"},
      {K::exterior_lights, "Activate strobe lights on exterior"},
      {K::lock_doors, "Lock all exterior doors"},
      {K::monitor_sensors, "Track motion sensor activity"},
    },
    {
      {K::siren, "activate_alarm"},
      {K::lock_safe_room, "lock_safe_room"},
      {K::record_cameras, "record_cameras"},
      {K::emergency_lighting, "activate_lights"},
    },
    {
      "Wait for police clearance",
      "Check all entry points",
      "Review security camera footage",
      "Document any damage or theft",
      "File police report",
      "Upgrade security if needed",
      "Change access codes",
    }));

  types_.push_back(makeType(
    "medical", "Medical Emergency", 5, "#00CC00", "112",
    {
      {K::call_emergency_services, "Call emergency services (112) immediately"},
      {K::unlock_doors, "Unlock front door for paramedic access"},
      {K::emergency_lighting, "Turn on all path lighting to front door"},
      {K::exterior_lights, "Flash exterior lights for ambulance visibility"},
      {K::notify_contacts, "Send GPS coordinates to emergency contacts"},
      {K::display_evacuation, "Prepare medical information display"},
      {K::advisory, "Clear path for stretcher access"},
      {K::notify_contacts, "Notify emergency contacts via SMS"},
      {K::emergency_lighting, "Activate emergency lighting"},
      {K::advisory, "Open garage door if needed for ambulance"},
    },
    {
      {K::unlock_doors, "unlock_front_door"},
      {K::emergency_lighting, "activate_path_lighting"},
      {K::notify_contacts, "send_location"},
    },
    {
      "Follow up with medical provider",
      "Update medical information",
      "Check emergency supply inventory",
      "Review response effectiveness",
      "Update emergency contacts if needed",
    }));

  types_.push_back(makeType(
    "power-failure", "Power Failure", 2, "#333333", "",
    {
      {K::ups_switchover, "Switch to UPS power for critical systems"},
      {K::start_generator, "Start backup generator if extended outage"},
      {K::reduce_load, "Reduce power consumption to essentials"},
      {K::emergency_lighting, "Activate emergency lighting"},
      {K::notify_residents, "Notify residents of power status"},
      {K::monitor_sensors, "Monitor refrigeration temperatures"},
      {K::advisory, "Check security system backup power"},
      {K::advisory, "Contact power company for outage info"},
      {K::advisory, "Estimate backup runtime remaining"},
      {K::advisory, "Prioritize critical medical devices"},
    },
    {
      {K::ups_switchover, "activate_ups"},
      {K::reduce_load, "reduce_power_usage"},
      {K::emergency_lighting, "activate_emergency_lighting"},
    },
    {
      "Verify stable power restoration",
      "Switch back from backup power",
      "Reset tripped breakers",
      "Check all smart devices reconnected",
      "Verify security system operational",
      "Recharge backup systems",
      "Check food safety in refrigerators",
    }));

  types_.push_back(makeType(
    "storm", "Severe Weather", 3, "#4B0082", "112",
    {
      {K::close_shutters, "Close all motorized shutters and blinds"},
      {K::close_shutters, "Retract all awnings and outdoor covers"},
      {K::notify_residents, "Send weather warning to all residents"},
      {K::advisory, "Secure outdoor furniture and items"},
      {K::advisory, "Check backup power systems"},
      {K::advisory, "Fill emergency water supply"},
      {K::advisory, "Charge all portable devices"},
      {K::advisory, "Move vehicles to garage if possible"},
      {K::advisory, "Stay away from windows"},
      {K::monitor_sensors, "Monitor weather updates continuously"},
    },
    {
      {K::close_shutters, "close_shutters"},
      {K::close_shutters, "retract_awnings"},
      {K::emergency_lighting, "activate_emergency_lighting"},
    },
    {
      "Inspect exterior for damage",
      "Check roof and gutters",
      "Clear debris from property",
      "Restore outdoor items",
      "Check for water intrusion",
      "Resume normal automation",
    }));

  types_.push_back(makeType(
    "earthquake", "Earthquake", 5, "#8B4513", "112",
    {
      {K::siren, "Sound earthquake alarm"},
      {K::display_evacuation, "Send DROP-COVER-HOLD instruction to all displays"},
      {K::cut_gas, "Shut off gas supply immediately"},
      {K::cut_power, "Cut power to non-essential systems"},
      {K::unlock_doors, "Unlock all exit doors"},
      {K::emergency_lighting, "Activate emergency lighting"},
      {K::advisory, "After shaking stops: check for injuries"},
      {K::advisory, "Check for gas leaks and structural damage"},
      {K::evacuate, "Evacuate if structural damage detected"},
      {K::call_emergency_services, "Call emergency services if needed"},
    },
    {
      {K::cut_gas, "cut_gas"},
      {K::cut_power, "cut_power_nonessential"},
      {K::unlock_doors, "unlock_doors"},
      {K::emergency_lighting, "activate_emergency_lighting"},
    },
    {
      "Professional structural inspection",
      "Check all utilities before restoring",
      "Inspect foundation and walls",
      "Check water pipes for damage",
      "Restore systems gradually",
      "Prepare for aftershocks",
    }));

  // Catch-all for manual triggers that fit no other category.
  types_.push_back(makeType(
    "generic", "General Emergency", 3, "#800000", "112",
    {
      {K::siren, "Sound evacuation alarm"},
      {K::notify_residents, "Send push notification to all residents"},
      {K::emergency_lighting, "Activate emergency lighting"},
      {K::advisory, "Account for all household members"},
      {K::call_emergency_services, "Call emergency services if needed"},
      {K::advisory, "Document the situation"},
    },
    {
      {K::emergency_lighting, "activate_emergency_lighting"},
    },
    {
      "Confirm the situation is under control",
      "Document what happened",
      "Review response effectiveness",
    }));
}

bool EmergencyCatalog::add(const EmergencyType& type) {
  if (type.id.empty()) return false;
  if (type.severity < 1 || type.severity > 5) return false;
  if (find(type.id)) return false;
  types_.push_back(type);
  return true;
}

const EmergencyType* EmergencyCatalog::find(const std::string& id) const {
  for (const EmergencyType& t : types_) {
    if (t.id == id) return &t;
  }
  return nullptr;
}
