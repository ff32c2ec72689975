#include "app/EvacuationRoutes.h"

#include "app/Log.h"

namespace {
constexpr const char* TAG = "EVAC";

bool betterThan(const EvacuationRoute& a, const EvacuationRoute& b) {
  if (a.accessible != b.accessible) return a.accessible;
  if (a.lit != b.lit) return a.lit;
  return a.estimated_s < b.estimated_s;
}
} // namespace

void EvacuationRoutes::loadDefaults() {
  routes_.clear();

  EvacuationRoute front;
  front.id = "front_door";
  front.name = "Front Door";
  front.estimated_s = 45;
  front.assembly_point = "Front yard by mailbox";
  routes_.push_back(front);

  EvacuationRoute back;
  back.id = "back_door";
  back.name = "Back Door";
  back.estimated_s = 55;
  back.assembly_point = "Back garden gate";
  routes_.push_back(back);

  EvacuationRoute garage;
  garage.id = "garage_exit";
  garage.name = "Garage Exit";
  garage.lit = false;
  garage.accessible = false;
  garage.estimated_s = 60;
  garage.assembly_point = "Driveway";
  garage.floor = 0;
  routes_.push_back(garage);
}

const EvacuationRoute* EvacuationRoutes::find(const std::string& routeId) const {
  for (const EvacuationRoute& r : routes_) {
    if (r.id == routeId) return &r;
  }
  return nullptr;
}

Outcome EvacuationRoutes::setClearance(const std::string& routeId, bool cleared) {
  for (EvacuationRoute& r : routes_) {
    if (r.id != routeId) continue;
    r.cleared = cleared;
    LOG_INFO(TAG, "%s %s", routeId.c_str(), cleared ? "cleared" : "blocked");
    return Outcome::ok;
  }
  LOG_WARN(TAG, "unknown route %s", routeId.c_str());
  return Outcome::not_found;
}

Outcome EvacuationRoutes::recommend(const std::string& preferredId, EvacuationRoute& out) const {
  if (!preferredId.empty()) {
    const EvacuationRoute* r = find(preferredId);
    if (!r) return Outcome::not_found;
    if (!r->cleared) {
      LOG_WARN(TAG, "preferred route %s is blocked", preferredId.c_str());
      return Outcome::invalid_transition;
    }
    out = *r;
    return Outcome::ok;
  }

  const EvacuationRoute* best = nullptr;
  for (const EvacuationRoute& r : routes_) {
    if (!r.cleared) continue;
    if (!best || betterThan(r, *best)) best = &r;
  }
  if (!best) return Outcome::not_found;
  out = *best;
  return Outcome::ok;
}

uint8_t EvacuationRoutes::clearedCount() const {
  uint8_t n = 0;
  for (const EvacuationRoute& r : routes_) {
    if (r.cleared) ++n;
  }
  return n;
}
