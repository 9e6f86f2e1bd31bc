#include "config/config.hpp"

#include <string>

#include "esp_log.h"

#include "config_server/config_store.hpp"
#include "core/settings.hpp"

namespace config
{

    namespace
    {

        extern "C"
        {
            extern const uint8_t _binary_watcher_yaml_start[];
            extern const uint8_t _binary_watcher_yaml_end[];
        }

        constexpr const char *TAG = "config";

        core::PollConfig s_cfg;
        Source s_source = Source::Embedded;
        std::string s_error;
        bool s_loaded = false;

        bool parse_and_validate(const char *text, size_t len, core::PollConfig &out, std::string &error)
        {
            core::PollConfig cfg;
            if (!core::parse_settings(text, len, cfg, error))
            {
                return false;
            }
            if (!core::validate_settings(cfg, error))
            {
                return false;
            }
            out = cfg;
            return true;
        }

        void log_summary()
        {
            ESP_LOGI(TAG, "Booking page %s, service %s, %u staff, %u recipients",
                     s_cfg.session_url().c_str(),
                     s_cfg.service_id.c_str(),
                     static_cast<unsigned>(s_cfg.staff_ids.size()),
                     static_cast<unsigned>(s_cfg.recipients.size()));
            ESP_LOGI(TAG, "Polling every %u s, display zone %s%s",
                     static_cast<unsigned>(s_cfg.polling_interval_s),
                     s_cfg.display_time_zone.c_str(),
                     s_cfg.send_test_notification ? ", TEST NOTIFICATION MODE" : "");
            if (s_cfg.recipients.empty())
            {
                ESP_LOGW(TAG, "No recipients configured");
            }
        }

    } // namespace

    esp_err_t load()
    {
        if (s_loaded)
        {
            return ESP_OK;
        }

        std::string stored;
        esp_err_t err = config_store::load_watcher_yaml(stored);
        if (err == ESP_OK)
        {
            std::string error;
            if (parse_and_validate(stored.data(), stored.size(), s_cfg, error))
            {
                s_source = Source::Stored;
                s_loaded = true;
                s_error.clear();
                ESP_LOGI(TAG, "Using settings saved from web UI");
                log_summary();
                return ESP_OK;
            }
            ESP_LOGE(TAG, "Stored settings rejected: %s", error.c_str());
        }
        else if (err != ESP_ERR_NVS_NOT_FOUND)
        {
            ESP_LOGW(TAG, "Reading stored settings failed: %s", esp_err_to_name(err));
        }

        const char *text = reinterpret_cast<const char *>(_binary_watcher_yaml_start);
        size_t len = _binary_watcher_yaml_end - _binary_watcher_yaml_start;
        if (len == 0)
        {
            s_error = "embedded watcher.yaml is empty";
            ESP_LOGE(TAG, "%s", s_error.c_str());
            return ESP_ERR_INVALID_STATE;
        }
        // EMBED_TXTFILES appends a NUL terminator.
        if (text[len - 1] == '\0')
        {
            --len;
        }

        if (!parse_and_validate(text, len, s_cfg, s_error))
        {
            ESP_LOGE(TAG, "Embedded settings rejected: %s", s_error.c_str());
            return ESP_ERR_INVALID_STATE;
        }
        s_source = Source::Embedded;
        s_loaded = true;
        s_error.clear();
        log_summary();
        return ESP_OK;
    }

    const core::PollConfig &watcher()
    {
        if (!s_loaded)
        {
            (void)load();
        }
        return s_cfg;
    }

    Source source()
    {
        return s_source;
    }

    const char *last_error()
    {
        return s_error.c_str();
    }

} // namespace config
