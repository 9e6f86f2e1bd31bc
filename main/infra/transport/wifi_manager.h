#pragma once

#include "esp_err.h"
#include <stdbool.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

    // NVS, netif, default event loop and Wi-Fi driver in STA mode.
    esp_err_t wifi_manager_init(void);

    // Scan and join the strongest AP stored in config_store.
    esp_err_t wifi_manager_connect_best_known(int32_t min_rssi);
    bool wifi_manager_wait_ip(int wait_ms);

    // Background task that reconnects whenever the link drops.
    void wifi_manager_start_auto(int32_t min_rssi, int scan_interval_ms);

    // Soft AP for the configuration UI (STA stays up).
    esp_err_t wifi_manager_start_ap_config(const char *ssid, const char *password);
    bool wifi_manager_is_connected(void);

#ifdef __cplusplus
}
#endif
