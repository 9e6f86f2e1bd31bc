#pragma once

#include "esp_err.h"

namespace config_server
{

    // Start the configuration HTTP server on port 80. Config mode only: the
    // handlers expose stored secrets and have no authentication.
    esp_err_t start();

    void stop();

} // namespace config_server
