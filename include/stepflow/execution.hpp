#pragma once

// Execution substrate the workflow engine schedules branch tasks on:
//   - scheduler.hpp: scheduler concept and forward progress query
//   - schedulers.hpp: inline_scheduler, thread_pool, type-erased any_scheduler
//   - task_group.hpp: runtime-sized wait-for-all barrier

#include "execution/scheduler.hpp"   // Scheduler concept
#include "execution/schedulers.hpp"  // Standard scheduler implementations
#include "execution/task_group.hpp"  // Runtime-sized join barrier
