#pragma once

#include <stdint.h>

#include <string>
#include <vector>

#include "app/Outcome.h"

struct EvacuationRoute {
  std::string id;
  std::string name;
  bool cleared = true;
  bool lit = true;
  bool accessible = true;
  uint16_t estimated_s = 60;
  std::string assembly_point;
  int8_t floor = 1;
};

class EvacuationRoutes {
public:
  void loadDefaults();

  Outcome setClearance(const std::string& routeId, bool cleared);

  // With a preferred id: that route if cleared, invalid_transition if blocked.
  // Without one: the best cleared route (accessible, lit, then fastest).
  Outcome recommend(const std::string& preferredId, EvacuationRoute& out) const;

  const EvacuationRoute* find(const std::string& routeId) const;
  const std::vector<EvacuationRoute>& routes() const { return routes_; }
  uint8_t clearedCount() const;

private:
  std::vector<EvacuationRoute> routes_;
};
