#include "esp_err.h"
#include "esp_log.h"
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include "app/app_config.hpp"
#include "app/app_events.hpp"
#include "app/app_state.hpp"
#include "app/event_logger.hpp"
#include "config/config.hpp"
#include "config_server/config_server.hpp"
#include "config_server/config_store.hpp"
#include "infra/transport/time_sync.hpp"
#include "infra/transport/wifi_manager.h"
#include "services/watcher_service.hpp"

static const char *TAG_APP = "app";

AppState g_app_state = AppState::BootWifi;

const char *app_state_name(AppState state)
{
    switch (state)
    {
    case AppState::BootWifi:
        return "BootWifi";
    case AppState::BootTimeSync:
        return "BootTimeSync";
    case AppState::Watching:
        return "Watching";
    case AppState::ConfigMode:
        return "ConfigMode";
    }
    return "?";
}

static void set_app_state(AppState new_state)
{
    if (g_app_state == new_state)
    {
        return;
    }
    AppState old = g_app_state;
    g_app_state = new_state;
    (void)app_events::post_app_state_changed(old, new_state, esp_timer_get_time());
}

// Soft AP + HTTP config UI; the watcher never starts. Parks the main task.
static void enter_config_mode(const char *reason)
{
    set_app_state(AppState::ConfigMode);
    ESP_LOGW(TAG_APP, "Entering config mode: %s", reason);
    esp_err_t err = wifi_manager_start_ap_config(app_config::kSetupApSsid, nullptr);
    if (err != ESP_OK)
    {
        ESP_LOGE(TAG_APP, "Config AP failed: %s", esp_err_to_name(err));
    }
    err = config_server::start();
    if (err != ESP_OK)
    {
        ESP_LOGE(TAG_APP, "Config server failed: %s", esp_err_to_name(err));
    }
    ESP_LOGI(TAG_APP, "Config mode: AP '%s' with HTTP config server", app_config::kSetupApSsid);
    for (;;)
    {
        vTaskDelay(portMAX_DELAY);
    }
}

extern "C" void app_main(void)
{
    if (wifi_manager_init() != ESP_OK)
    {
        ESP_LOGE(TAG_APP, "WiFi manager init failed");
        return;
    }
    if (config_store::init() != ESP_OK)
    {
        ESP_LOGE(TAG_APP, "Config store init failed");
        return;
    }

    // Log all APP_EVENTS for inspection/debugging
    (void)event_logger::init();
    set_app_state(AppState::BootWifi);

    if (!config_store::has_basic_config())
    {
        enter_config_mode("no Wi-Fi network stored");
        return;
    }

    if (config::load() != ESP_OK)
    {
        enter_config_mode(config::last_error());
        return;
    }

    esp_err_t err = wifi_manager_connect_best_known(app_config::kMinRssi);
    if (err != ESP_OK)
    {
        ESP_LOGW(TAG_APP, "WiFi connect failed: %s", esp_err_to_name(err));
    }
    // Keep Wi-Fi connected in background; it also retries the first connect.
    wifi_manager_start_auto(app_config::kMinRssi, app_config::kWifiRescanIntervalMs);
    while (!wifi_manager_wait_ip(app_config::kWifiConnectTimeoutMs))
    {
        ESP_LOGW(TAG_APP, "Waiting for Wi-Fi...");
    }

    set_app_state(AppState::BootTimeSync);
    (void)time_sync::start();
    while (!time_sync::wait_valid(app_config::kTimeSyncTimeoutMs))
    {
        ESP_LOGW(TAG_APP, "Waiting for SNTP time...");
    }

    err = watcher::start(config::watcher());
    if (err != ESP_OK)
    {
        ESP_LOGE(TAG_APP, "Watcher start failed: %s", esp_err_to_name(err));
        return;
    }
    set_app_state(AppState::Watching);
}
