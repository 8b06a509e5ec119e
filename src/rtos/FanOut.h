#pragma once

#include <stddef.h>
#include <functional>
#include <vector>

// Every job in flight may hold a TLS session (about 40 KB of heap), so keep
// this at or below HTTP_KEEPALIVE_SLOTS.
#ifndef FANOUT_MAX_PARALLEL
#define FANOUT_MAX_PARALLEL 2
#endif

#ifndef FANOUT_TASK_STACK
#define FANOUT_TASK_STACK 8192
#endif

namespace FanOut {

using Job = std::function<void()>;

// Runs every job and returns once all of them finished. On ESP32 each job
// gets its own task (at most FANOUT_MAX_PARALLEL at once); elsewhere the
// jobs run in order on the caller.
void run(std::vector<Job>& jobs);

} // namespace FanOut
