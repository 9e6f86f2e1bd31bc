#pragma once

#include <cstdint>
#include <ctime>
#include <string>

#include "esp_err.h"
#include "core/poll_loop.hpp"
#include "core/slot.hpp"

namespace watcher {

// Snapshot of the polling task for the status endpoint.
struct Status {
    bool running = false;
    core::CycleState state = core::CycleState::Idle;
    std::uint32_t cycles = 0;
    core::CycleOutcome last_outcome = core::CycleOutcome::Pending;
    std::string last_error;
    int last_slot_count = 0;
    int last_failed_deliveries = 0;
    std::time_t last_cycle_time = 0;
    std::uint32_t notifications_sent = 0;
};

// Start the polling task. `cfg` must outlive the task.
esp_err_t start(const core::PollConfig& cfg);

// Ask the task to stop at its next transition; returns immediately.
void stop();

bool is_running();
Status status();

} // namespace watcher
