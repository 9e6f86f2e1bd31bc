#include "config_store.hpp"

#include <cstdio>

#include "esp_check.h"
#include "esp_log.h"
#include "nvs.h"
#include "nvs_flash.h"

namespace config_store
{

    namespace
    {
        const char *TAG = "cfg_store";
        const char *NS = "cfg";
        const char *kWatcherKey = "watcher_yaml";

        esp_err_t open_handle(nvs_handle_t &handle)
        {
            esp_err_t err = nvs_open(NS, NVS_READWRITE, &handle);
            if (err != ESP_OK)
            {
                ESP_LOGE(TAG, "nvs_open failed: %s", esp_err_to_name(err));
            }
            return err;
        }

        esp_err_t commit_and_close(nvs_handle_t handle)
        {
            esp_err_t err = nvs_commit(handle);
            if (err != ESP_OK)
            {
                ESP_LOGE(TAG, "nvs_commit failed: %s", esp_err_to_name(err));
            }
            nvs_close(handle);
            return err;
        }

    } // namespace

    esp_err_t init()
    {
        nvs_handle_t handle{};
        ESP_RETURN_ON_ERROR(open_handle(handle), TAG, "open_handle failed");
        nvs_close(handle);
        return ESP_OK;
    }

    esp_err_t load_wifi(WifiAp *aps, std::size_t max_count, std::size_t &out_count)
    {
        out_count = 0;
        nvs_handle_t handle{};
        ESP_RETURN_ON_ERROR(open_handle(handle), TAG, "open_handle failed");

        uint32_t count = 0;
        esp_err_t err = nvs_get_u32(handle, "wifi_count", &count);
        if (err == ESP_ERR_NVS_NOT_FOUND)
        {
            nvs_close(handle);
            return ESP_OK;
        }
        if (err != ESP_OK)
        {
            nvs_close(handle);
            ESP_LOGE(TAG, "nvs_get_u32 wifi_count failed: %s", esp_err_to_name(err));
            return err;
        }

        if (count > max_count)
        {
            count = static_cast<uint32_t>(max_count);
        }
        for (uint32_t i = 0; i < count; ++i)
        {
            char key[16];
            std::snprintf(key, sizeof(key), "wifi_%u", static_cast<unsigned>(i));
            size_t len = sizeof(WifiAp);
            err = nvs_get_blob(handle, key, &aps[i], &len);
            if (err != ESP_OK || len != sizeof(WifiAp))
            {
                ESP_LOGW(TAG, "nvs_get_blob %s failed: %s", key, esp_err_to_name(err));
                break;
            }
            aps[i].ssid[sizeof(aps[i].ssid) - 1] = '\0';
            aps[i].password[sizeof(aps[i].password) - 1] = '\0';
            ++out_count;
        }
        nvs_close(handle);
        return ESP_OK;
    }

    esp_err_t save_wifi(const WifiAp *aps, std::size_t count)
    {
        nvs_handle_t handle{};
        ESP_RETURN_ON_ERROR(open_handle(handle), TAG, "open_handle failed");

        esp_err_t err = nvs_set_u32(handle, "wifi_count", static_cast<uint32_t>(count));
        for (std::size_t i = 0; err == ESP_OK && i < count; ++i)
        {
            char key[16];
            std::snprintf(key, sizeof(key), "wifi_%u", static_cast<unsigned>(i));
            err = nvs_set_blob(handle, key, &aps[i], sizeof(WifiAp));
            if (err != ESP_OK)
            {
                ESP_LOGE(TAG, "nvs_set_blob %s failed: %s", key, esp_err_to_name(err));
            }
        }
        if (err != ESP_OK)
        {
            nvs_close(handle);
            return err;
        }
        return commit_and_close(handle);
    }

    esp_err_t load_watcher_yaml(std::string &out)
    {
        out.clear();
        nvs_handle_t handle{};
        ESP_RETURN_ON_ERROR(open_handle(handle), TAG, "open_handle failed");

        size_t len = 0;
        esp_err_t err = nvs_get_blob(handle, kWatcherKey, nullptr, &len);
        if (err == ESP_OK && len > 0)
        {
            out.resize(len);
            err = nvs_get_blob(handle, kWatcherKey, &out[0], &len);
            out.resize(err == ESP_OK ? len : 0);
        }
        else if (err == ESP_OK)
        {
            err = ESP_ERR_NVS_NOT_FOUND;
        }
        nvs_close(handle);
        return err;
    }

    esp_err_t save_watcher_yaml(const std::string &yaml)
    {
        if (yaml.empty() || yaml.size() > kMaxWatcherYamlBytes)
        {
            return ESP_ERR_INVALID_SIZE;
        }
        nvs_handle_t handle{};
        ESP_RETURN_ON_ERROR(open_handle(handle), TAG, "open_handle failed");
        esp_err_t err = nvs_set_blob(handle, kWatcherKey, yaml.data(), yaml.size());
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "nvs_set_blob %s failed: %s", kWatcherKey, esp_err_to_name(err));
            nvs_close(handle);
            return err;
        }
        return commit_and_close(handle);
    }

    esp_err_t erase_watcher_yaml()
    {
        nvs_handle_t handle{};
        ESP_RETURN_ON_ERROR(open_handle(handle), TAG, "open_handle failed");
        esp_err_t err = nvs_erase_key(handle, kWatcherKey);
        if (err == ESP_ERR_NVS_NOT_FOUND)
        {
            nvs_close(handle);
            return ESP_OK;
        }
        if (err != ESP_OK)
        {
            nvs_close(handle);
            return err;
        }
        return commit_and_close(handle);
    }

    bool has_basic_config()
    {
        WifiAp aps[1];
        std::size_t wifi_count = 0;
        if (load_wifi(aps, 1, wifi_count) != ESP_OK)
        {
            return false;
        }
        return wifi_count > 0;
    }

} // namespace config_store
