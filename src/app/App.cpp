#include "app/App.h"

#include "app/SentryOrchestrator.h"

static SentryOrchestrator orchestrator;

void App::begin() {
  orchestrator.begin();
}

void App::tick(uint32_t nowMs) {
  orchestrator.tick(nowMs);
}
