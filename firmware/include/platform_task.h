#pragma once
#include <stdint.h>
#include <stdbool.h>

// =====================================================
// Platform Task Abstraction
// =====================================================
// Starts a dedicated background task (FreeRTOS task on
// the board, std::thread on native builds).
//
// The entry function owns the task: when it returns the
// task is torn down by the platform layer.
// =====================================================

typedef void (*platform_task_entry_t)(void* arg);

// Start a task running entry(arg)
// name: short label used by the scheduler / debugger
// stackBytes: stack size (ignored on native builds)
// priority: scheduler priority (ignored on native builds)
// Returns: false if the task could not be created
bool platform_task_start(const char* name,
                         platform_task_entry_t entry,
                         void* arg,
                         uint32_t stackBytes,
                         uint32_t priority);
