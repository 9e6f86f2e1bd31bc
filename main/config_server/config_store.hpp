#pragma once

#include "esp_err.h"
#include <cstddef>
#include <string>

// NVS-backed runtime configuration: Wi-Fi networks and watcher settings YAML.
namespace config_store
{

    constexpr std::size_t kMaxWifiAps = 8;
    constexpr std::size_t kMaxWatcherYamlBytes = 4096;

    struct WifiAp
    {
        char ssid[33]{};
        char password[65]{};
    };

    // Must be called after nvs_flash_init() (done by wifi_manager_init()).
    esp_err_t init();

    esp_err_t load_wifi(WifiAp *aps, std::size_t max_count, std::size_t &out_count);

    // Replace the Wi-Fi AP list.
    esp_err_t save_wifi(const WifiAp *aps, std::size_t count);

    // ESP_ERR_NVS_NOT_FOUND when no settings were saved from the web UI.
    esp_err_t load_watcher_yaml(std::string &out);
    esp_err_t save_watcher_yaml(const std::string &yaml);
    esp_err_t erase_watcher_yaml();

    // True when at least one Wi-Fi network is stored.
    bool has_basic_config();

} // namespace config_store
