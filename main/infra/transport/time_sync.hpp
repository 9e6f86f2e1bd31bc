#pragma once

#include <ctime>

#include "esp_err.h"

namespace time_sync {

// Start SNTP against pool.ntp.org. Idempotent.
esp_err_t start();

// Block until the clock is past 2024-01-01 or `timeout_ms` elapses.
bool wait_valid(int timeout_ms);

bool is_valid();

// Wall clock in UTC seconds.
std::time_t now();

} // namespace time_sync
