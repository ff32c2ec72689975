#include "app/App.h"

#include "app/EmergencyOrchestrator.h"

static EmergencyOrchestrator orchestrator;

void App::begin() {
  orchestrator.begin();
}

void App::tick(uint32_t nowMs) {
  orchestrator.tick(nowMs);
}
