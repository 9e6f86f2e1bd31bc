#pragma once

#include "esp_err.h"

namespace event_logger
{

    // Log every APP_EVENTS event posted to the default loop.
    esp_err_t init();

} // namespace event_logger
