#include "infra/transport/wifi_manager.h"

#include <cstring>

#include "esp_check.h"
#include "esp_event.h"
#include "esp_log.h"
#include "esp_netif.h"
#include "esp_wifi.h"
#include "freertos/FreeRTOS.h"
#include "freertos/event_groups.h"
#include "freertos/task.h"
#include "nvs_flash.h"

#include "config_server/config_store.hpp"

namespace
{

    const char *TAG = "wifi_mgr";

    constexpr EventBits_t kConnectedBit = BIT0;
    constexpr std::size_t kMaxStoredAps = 8;
    constexpr uint16_t kMaxScanRecords = 20;

    EventGroupHandle_t s_events = nullptr;
    esp_netif_t *s_sta_netif = nullptr;
    esp_netif_t *s_ap_netif = nullptr;
    TaskHandle_t s_auto_task = nullptr;
    volatile bool s_connecting = false;

    struct AutoArgs
    {
        int32_t min_rssi;
        int scan_interval_ms;
    };
    AutoArgs s_auto_args{};

    void on_wifi_event(void * /*arg*/, esp_event_base_t base, int32_t id, void *data)
    {
        if (base == WIFI_EVENT && id == WIFI_EVENT_STA_DISCONNECTED)
        {
            auto *ev = static_cast<wifi_event_sta_disconnected_t *>(data);
            xEventGroupClearBits(s_events, kConnectedBit);
            s_connecting = false;
            ESP_LOGW(TAG, "STA disconnected (reason %d)", ev ? ev->reason : -1);
        }
        else if (base == WIFI_EVENT && id == WIFI_EVENT_AP_STACONNECTED)
        {
            ESP_LOGI(TAG, "Client joined config AP");
        }
        else if (base == IP_EVENT && id == IP_EVENT_STA_GOT_IP)
        {
            auto *ev = static_cast<ip_event_got_ip_t *>(data);
            ESP_LOGI(TAG, "Got IP " IPSTR, IP2STR(&ev->ip_info.ip));
            s_connecting = false;
            xEventGroupSetBits(s_events, kConnectedBit);
        }
    }

    void auto_task(void *arg)
    {
        const AutoArgs *args = static_cast<const AutoArgs *>(arg);
        for (;;)
        {
            if (!wifi_manager_is_connected() && !s_connecting)
            {
                esp_err_t err = wifi_manager_connect_best_known(args->min_rssi);
                if (err != ESP_OK)
                {
                    ESP_LOGW(TAG, "Reconnect failed: %s", esp_err_to_name(err));
                }
            }
            vTaskDelay(pdMS_TO_TICKS(args->scan_interval_ms));
        }
    }

} // namespace

extern "C" esp_err_t wifi_manager_init(void)
{
    if (s_events)
    {
        return ESP_OK;
    }

    esp_err_t err = nvs_flash_init();
    if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND)
    {
        ESP_LOGW(TAG, "NVS partition needs erase (%s)", esp_err_to_name(err));
        ESP_RETURN_ON_ERROR(nvs_flash_erase(), TAG, "nvs_flash_erase failed");
        err = nvs_flash_init();
    }
    ESP_RETURN_ON_ERROR(err, TAG, "nvs_flash_init failed");

    ESP_RETURN_ON_ERROR(esp_netif_init(), TAG, "esp_netif_init failed");
    err = esp_event_loop_create_default();
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE)
    {
        ESP_LOGE(TAG, "event loop create failed: %s", esp_err_to_name(err));
        return err;
    }

    s_sta_netif = esp_netif_create_default_wifi_sta();
    wifi_init_config_t init_cfg = WIFI_INIT_CONFIG_DEFAULT();
    ESP_RETURN_ON_ERROR(esp_wifi_init(&init_cfg), TAG, "esp_wifi_init failed");

    s_events = xEventGroupCreate();
    if (!s_events)
    {
        return ESP_ERR_NO_MEM;
    }

    ESP_RETURN_ON_ERROR(esp_event_handler_instance_register(WIFI_EVENT, ESP_EVENT_ANY_ID, &on_wifi_event, nullptr, nullptr),
                        TAG, "wifi handler register failed");
    ESP_RETURN_ON_ERROR(esp_event_handler_instance_register(IP_EVENT, IP_EVENT_STA_GOT_IP, &on_wifi_event, nullptr, nullptr),
                        TAG, "ip handler register failed");

    ESP_RETURN_ON_ERROR(esp_wifi_set_storage(WIFI_STORAGE_RAM), TAG, "set_storage failed");
    ESP_RETURN_ON_ERROR(esp_wifi_set_mode(WIFI_MODE_STA), TAG, "set_mode failed");
    ESP_RETURN_ON_ERROR(esp_wifi_start(), TAG, "esp_wifi_start failed");
    ESP_LOGI(TAG, "Wi-Fi started (STA)");
    return ESP_OK;
}

extern "C" esp_err_t wifi_manager_connect_best_known(int32_t min_rssi)
{
    if (!s_events)
    {
        return ESP_ERR_INVALID_STATE;
    }

    config_store::WifiAp known[kMaxStoredAps];
    std::size_t known_count = 0;
    ESP_RETURN_ON_ERROR(config_store::load_wifi(known, kMaxStoredAps, known_count), TAG, "load_wifi failed");
    if (known_count == 0)
    {
        ESP_LOGW(TAG, "No Wi-Fi networks configured");
        return ESP_ERR_NOT_FOUND;
    }

    wifi_scan_config_t scan_cfg{};
    scan_cfg.show_hidden = true;
    ESP_RETURN_ON_ERROR(esp_wifi_scan_start(&scan_cfg, true), TAG, "scan failed");

    uint16_t found = kMaxScanRecords;
    wifi_ap_record_t records[kMaxScanRecords];
    ESP_RETURN_ON_ERROR(esp_wifi_scan_get_ap_records(&found, records), TAG, "scan records failed");

    const config_store::WifiAp *best = nullptr;
    int best_rssi = -127;
    for (uint16_t i = 0; i < found; ++i)
    {
        const char *ssid = reinterpret_cast<const char *>(records[i].ssid);
        if (records[i].rssi < min_rssi || records[i].rssi <= best_rssi)
        {
            continue;
        }
        for (std::size_t k = 0; k < known_count; ++k)
        {
            if (std::strcmp(ssid, known[k].ssid) == 0)
            {
                best = &known[k];
                best_rssi = records[i].rssi;
                break;
            }
        }
    }

    if (!best)
    {
        ESP_LOGW(TAG, "No known AP in range (%u scanned)", static_cast<unsigned>(found));
        return ESP_ERR_NOT_FOUND;
    }

    wifi_config_t sta{};
    std::strncpy(reinterpret_cast<char *>(sta.sta.ssid), best->ssid, sizeof(sta.sta.ssid) - 1);
    std::strncpy(reinterpret_cast<char *>(sta.sta.password), best->password, sizeof(sta.sta.password) - 1);
    sta.sta.threshold.authmode = best->password[0] ? WIFI_AUTH_WPA2_PSK : WIFI_AUTH_OPEN;

    ESP_LOGI(TAG, "Connecting to '%s' (RSSI %d)", best->ssid, best_rssi);
    ESP_RETURN_ON_ERROR(esp_wifi_set_config(WIFI_IF_STA, &sta), TAG, "set_config failed");
    s_connecting = true;
    esp_err_t err = esp_wifi_connect();
    if (err != ESP_OK)
    {
        s_connecting = false;
    }
    return err;
}

extern "C" bool wifi_manager_wait_ip(int wait_ms)
{
    if (!s_events)
    {
        return false;
    }
    EventBits_t bits = xEventGroupWaitBits(s_events, kConnectedBit, pdFALSE, pdTRUE, pdMS_TO_TICKS(wait_ms));
    return (bits & kConnectedBit) != 0;
}

extern "C" void wifi_manager_start_auto(int32_t min_rssi, int scan_interval_ms)
{
    if (s_auto_task)
    {
        return;
    }
    s_auto_args.min_rssi = min_rssi;
    s_auto_args.scan_interval_ms = scan_interval_ms;
    if (xTaskCreate(auto_task, "wifi_auto", 4096, &s_auto_args, 3, &s_auto_task) != pdPASS)
    {
        ESP_LOGE(TAG, "Failed to start reconnect task");
        s_auto_task = nullptr;
    }
}

extern "C" esp_err_t wifi_manager_start_ap_config(const char *ssid, const char *password)
{
    if (!s_events || !ssid)
    {
        return ESP_ERR_INVALID_STATE;
    }
    if (!s_ap_netif)
    {
        s_ap_netif = esp_netif_create_default_wifi_ap();
    }

    wifi_config_t ap{};
    std::strncpy(reinterpret_cast<char *>(ap.ap.ssid), ssid, sizeof(ap.ap.ssid) - 1);
    ap.ap.ssid_len = static_cast<uint8_t>(std::strlen(reinterpret_cast<const char *>(ap.ap.ssid)));
    ap.ap.channel = 1;
    ap.ap.max_connection = 2;
    if (password && std::strlen(password) >= 8)
    {
        std::strncpy(reinterpret_cast<char *>(ap.ap.password), password, sizeof(ap.ap.password) - 1);
        ap.ap.authmode = WIFI_AUTH_WPA2_PSK;
    }
    else
    {
        ap.ap.authmode = WIFI_AUTH_OPEN;
    }

    ESP_RETURN_ON_ERROR(esp_wifi_set_mode(WIFI_MODE_APSTA), TAG, "set_mode APSTA failed");
    ESP_RETURN_ON_ERROR(esp_wifi_set_config(WIFI_IF_AP, &ap), TAG, "set AP config failed");
    ESP_LOGI(TAG, "Config AP '%s' up", ssid);
    return ESP_OK;
}

extern "C" bool wifi_manager_is_connected(void)
{
    return s_events && (xEventGroupGetBits(s_events) & kConnectedBit) != 0;
}
