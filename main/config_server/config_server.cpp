#include "config_server.hpp"

#include <cstdlib>
#include <cstring>
#include <string>

#include "esp_http_server.h"
#include "esp_log.h"
#include "esp_system.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include "cJSON.h"
#include "config/config.hpp"
#include "config_store.hpp"
#include "core/poll_loop.hpp"
#include "core/settings.hpp"
#include "services/watcher_service.hpp"

namespace config_server
{

    namespace
    {
        const char *TAG = "cfg_http";

        constexpr size_t kMaxBodyBytes = config_store::kMaxWatcherYamlBytes + 2048;

        // Embedded via target_add_binary_data(... TEXT) in CMakeLists.txt.
        extern const unsigned char index_html_start[] asm("_binary_index_html_start");
        extern const unsigned char index_html_end[] asm("_binary_index_html_end");

        extern const unsigned char style_css_start[] asm("_binary_style_css_start");
        extern const unsigned char style_css_end[] asm("_binary_style_css_end");

        httpd_handle_t s_httpd = nullptr;

        esp_err_t send_static(httpd_req_t *req, const unsigned char *start, const unsigned char *end, const char *content_type)
        {
            httpd_resp_set_type(req, content_type);
            size_t len = static_cast<size_t>(end - start);
            // TEXT embedding adds a trailing NUL
            if (len > 0 && start[len - 1] == '\0')
            {
                --len;
            }
            return httpd_resp_send(req, reinterpret_cast<const char *>(start), len);
        }

        esp_err_t send_json(httpd_req_t *req, cJSON *root)
        {
            char *text = root ? cJSON_PrintUnformatted(root) : nullptr;
            cJSON_Delete(root);
            if (!text)
            {
                return httpd_resp_send_err(req, HTTPD_500_INTERNAL_SERVER_ERROR, "No memory");
            }
            httpd_resp_set_type(req, "application/json");
            esp_err_t err = httpd_resp_send(req, text, std::strlen(text));
            cJSON_free(text);
            return err;
        }

        esp_err_t send_error_json(httpd_req_t *req, const char *status, const std::string &message)
        {
            httpd_resp_set_status(req, status);
            cJSON *root = cJSON_CreateObject();
            if (root)
            {
                cJSON_AddStringToObject(root, "status", "error");
                cJSON_AddStringToObject(root, "error", message.c_str());
            }
            return send_json(req, root);
        }

        esp_err_t handle_root(httpd_req_t *req)
        {
            return send_static(req, index_html_start, index_html_end, "text/html");
        }

        esp_err_t handle_style_css(httpd_req_t *req)
        {
            return send_static(req, style_css_start, style_css_end, "text/css");
        }

        esp_err_t handle_get_config(httpd_req_t *req)
        {
            config_store::WifiAp aps[config_store::kMaxWifiAps];
            std::size_t wifi_count = 0;
            (void)config_store::load_wifi(aps, config_store::kMaxWifiAps, wifi_count);

            std::string yaml;
            const bool stored = config_store::load_watcher_yaml(yaml) == ESP_OK;

            cJSON *root = cJSON_CreateObject();
            if (!root)
            {
                return httpd_resp_send_err(req, HTTPD_500_INTERNAL_SERVER_ERROR, "No memory");
            }
            cJSON *wifi = cJSON_AddArrayToObject(root, "wifi");
            for (std::size_t i = 0; wifi && i < wifi_count; ++i)
            {
                cJSON *item = cJSON_CreateObject();
                if (!item)
                {
                    break;
                }
                cJSON_AddStringToObject(item, "ssid", aps[i].ssid);
                cJSON_AddStringToObject(item, "password", aps[i].password);
                cJSON_AddItemToArray(wifi, item);
            }
            cJSON_AddStringToObject(root, "watcher_yaml", yaml.c_str());
            cJSON_AddBoolToObject(root, "watcher_yaml_stored", stored);
            cJSON_AddStringToObject(root, "load_error", config::last_error());
            return send_json(req, root);
        }

        bool read_body(httpd_req_t *req, std::string &out)
        {
            const size_t content_len = static_cast<size_t>(req->content_len);
            if (content_len == 0 || content_len > kMaxBodyBytes)
            {
                return false;
            }
            out.resize(content_len);
            size_t received = 0;
            while (received < content_len)
            {
                const int r = httpd_req_recv(req, &out[received], content_len - received);
                if (r == HTTPD_SOCK_ERR_TIMEOUT)
                {
                    continue;
                }
                if (r <= 0)
                {
                    return false;
                }
                received += static_cast<size_t>(r);
            }
            return true;
        }

        esp_err_t handle_post_config(httpd_req_t *req)
        {
            std::string body;
            if (!read_body(req, body))
            {
                return send_error_json(req, "400 Bad Request", "Invalid body length");
            }
            ESP_LOGI(TAG, "Received config body (%u bytes)", static_cast<unsigned>(body.size()));

            cJSON *root = cJSON_ParseWithLength(body.c_str(), body.size());
            if (!root)
            {
                return send_error_json(req, "400 Bad Request", "Invalid JSON");
            }

            config_store::WifiAp wifi_items[config_store::kMaxWifiAps];
            std::size_t wifi_count = 0;
            cJSON *wifi = cJSON_GetObjectItem(root, "wifi");
            const bool has_wifi = cJSON_IsArray(wifi);
            if (has_wifi)
            {
                const int arr_size = cJSON_GetArraySize(wifi);
                for (int i = 0; i < arr_size && wifi_count < config_store::kMaxWifiAps; ++i)
                {
                    cJSON *item = cJSON_GetArrayItem(wifi, i);
                    cJSON *ssid = cJSON_GetObjectItem(item, "ssid");
                    cJSON *password = cJSON_GetObjectItem(item, "password");
                    if (!cJSON_IsString(ssid) || !ssid->valuestring || !ssid->valuestring[0])
                    {
                        continue;
                    }
                    config_store::WifiAp ap{};
                    std::strncpy(ap.ssid, ssid->valuestring, sizeof(ap.ssid) - 1);
                    if (cJSON_IsString(password) && password->valuestring)
                    {
                        std::strncpy(ap.password, password->valuestring, sizeof(ap.password) - 1);
                    }
                    wifi_items[wifi_count++] = ap;
                }
            }

            cJSON *yaml_item = cJSON_GetObjectItem(root, "watcher_yaml");
            const bool has_yaml = cJSON_IsString(yaml_item) && yaml_item->valuestring;
            std::string yaml = has_yaml ? yaml_item->valuestring : "";
            cJSON_Delete(root);

            if (has_yaml && !yaml.empty())
            {
                if (yaml.size() > config_store::kMaxWatcherYamlBytes)
                {
                    return send_error_json(req, "400 Bad Request", "Settings YAML too large");
                }
                core::PollConfig candidate;
                std::string error;
                if (!core::parse_settings(yaml.data(), yaml.size(), candidate, error) ||
                    !core::validate_settings(candidate, error))
                {
                    ESP_LOGW(TAG, "Rejected settings: %s", error.c_str());
                    return send_error_json(req, "400 Bad Request", error);
                }
            }

            esp_err_t err = ESP_OK;
            if (has_wifi)
            {
                err = config_store::save_wifi(wifi_items, wifi_count);
                if (err != ESP_OK)
                {
                    ESP_LOGE(TAG, "save_wifi failed: %s", esp_err_to_name(err));
                    return send_error_json(req, "500 Internal Server Error", "Failed to save Wi-Fi");
                }
            }
            if (has_yaml)
            {
                err = yaml.empty() ? config_store::erase_watcher_yaml() : config_store::save_watcher_yaml(yaml);
                if (err != ESP_OK)
                {
                    ESP_LOGE(TAG, "saving settings failed: %s", esp_err_to_name(err));
                    return send_error_json(req, "500 Internal Server Error", "Failed to save settings");
                }
            }

            cJSON *ok = cJSON_CreateObject();
            if (ok)
            {
                cJSON_AddStringToObject(ok, "status", "ok");
            }
            return send_json(req, ok);
        }

        esp_err_t handle_get_status(httpd_req_t *req)
        {
            watcher::Status st = watcher::status();
            cJSON *root = cJSON_CreateObject();
            if (!root)
            {
                return httpd_resp_send_err(req, HTTPD_500_INTERNAL_SERVER_ERROR, "No memory");
            }
            cJSON_AddBoolToObject(root, "running", st.running);
            cJSON_AddStringToObject(root, "state", core::to_string(st.state));
            cJSON_AddNumberToObject(root, "cycles", st.cycles);
            cJSON_AddStringToObject(root, "last_outcome", core::to_string(st.last_outcome));
            cJSON_AddStringToObject(root, "last_error", st.last_error.c_str());
            cJSON_AddNumberToObject(root, "last_slots", st.last_slot_count);
            cJSON_AddNumberToObject(root, "last_failed_deliveries", st.last_failed_deliveries);
            cJSON_AddNumberToObject(root, "last_cycle_time", static_cast<double>(st.last_cycle_time));
            cJSON_AddNumberToObject(root, "notifications_sent", st.notifications_sent);
            return send_json(req, root);
        }

        esp_err_t handle_reboot(httpd_req_t *req)
        {
            cJSON *root = cJSON_CreateObject();
            if (root)
            {
                cJSON_AddStringToObject(root, "status", "rebooting");
            }
            // Best effort: the response may not make it out before restart.
            (void)send_json(req, root);
            ESP_LOGI(TAG, "Reboot requested via HTTP config UI");
            watcher::stop();
            vTaskDelay(pdMS_TO_TICKS(100));
            esp_restart();
            return ESP_OK;
        }

        void register_uri(const char *uri, httpd_method_t method, esp_err_t (*handler)(httpd_req_t *))
        {
            httpd_uri_t h = {};
            h.uri = uri;
            h.method = method;
            h.handler = handler;
            h.user_ctx = nullptr;
            esp_err_t err = httpd_register_uri_handler(s_httpd, &h);
            if (err != ESP_OK)
            {
                ESP_LOGW(TAG, "register %s failed: %s", uri, esp_err_to_name(err));
            }
        }

    } // namespace

    esp_err_t start()
    {
        if (s_httpd)
        {
            return ESP_OK;
        }

        httpd_config_t cfg = HTTPD_DEFAULT_CONFIG();
        cfg.server_port = 80;
        cfg.stack_size = 8192;

        esp_err_t err = httpd_start(&s_httpd, &cfg);
        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "httpd_start failed: %s", esp_err_to_name(err));
            s_httpd = nullptr;
            return err;
        }

        register_uri("/", HTTP_GET, handle_root);
        register_uri("/style.css", HTTP_GET, handle_style_css);
        register_uri("/api/config", HTTP_GET, handle_get_config);
        register_uri("/api/config", HTTP_POST, handle_post_config);
        register_uri("/api/status", HTTP_GET, handle_get_status);
        register_uri("/api/reboot", HTTP_POST, handle_reboot);

        ESP_LOGI(TAG, "Config HTTP server started on port %d", cfg.server_port);
        return ESP_OK;
    }

    void stop()
    {
        if (s_httpd)
        {
            httpd_stop(s_httpd);
            s_httpd = nullptr;
        }
    }

} // namespace config_server
