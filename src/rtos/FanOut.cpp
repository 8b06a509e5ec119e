#include "rtos/FanOut.h"

#if defined(ARDUINO_ARCH_ESP32)
#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>
#include <freertos/task.h>

#include "services/Logger.h"
#endif

namespace FanOut {

#if defined(ARDUINO_ARCH_ESP32)
namespace {

struct Slot {
  Job* job = nullptr;
  SemaphoreHandle_t done = nullptr;
};

void jobTask(void* arg) {
  Slot* slot = static_cast<Slot*>(arg);
  (*slot->job)();
  xSemaphoreGive(slot->done);
  vTaskDelete(nullptr);
}

} // namespace

void run(std::vector<Job>& jobs) {
  if (jobs.empty()) return;
  if (jobs.size() == 1) {
    jobs[0]();
    return;
  }

  SemaphoreHandle_t done = xSemaphoreCreateCounting(jobs.size(), 0);
  if (!done) {
    Log::warn("RTOS", "fan-out semaphore unavailable, running %u jobs inline", (unsigned)jobs.size());
    for (auto& job : jobs) job();
    return;
  }

  std::vector<Slot> slots(jobs.size());
  size_t next = 0;
  size_t inFlight = 0;
  size_t finished = 0;

  while (finished < jobs.size()) {
    while (next < jobs.size() && inFlight < FANOUT_MAX_PARALLEL) {
      slots[next].job = &jobs[next];
      slots[next].done = done;
      if (xTaskCreate(jobTask, "fanout", FANOUT_TASK_STACK, &slots[next], tskIDLE_PRIORITY + 1, nullptr) != pdPASS) {
        // Out of heap for another task: do it here instead.
        jobs[next]();
        ++finished;
      } else {
        ++inFlight;
      }
      ++next;
    }

    if (inFlight == 0) continue;
    xSemaphoreTake(done, portMAX_DELAY);
    --inFlight;
    ++finished;
  }

  vSemaphoreDelete(done);
}

#else

void run(std::vector<Job>& jobs) {
  for (auto& job : jobs) job();
}

#endif

} // namespace FanOut
