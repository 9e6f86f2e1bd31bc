#pragma once

#include "esp_err.h"

#include "core/slot.hpp"

namespace config {

enum class Source {
    Embedded,
    Stored,
};

// Parse and validate the watcher settings once. YAML saved from the web UI
// wins over the copy embedded in the image; an invalid stored copy falls
// back to the embedded one.
esp_err_t load();

const core::PollConfig& watcher();
Source source();

// Reason the last load() failed, empty on success.
const char* last_error();

} // namespace config
