#include "infra/transport/time_sync.hpp"

#include "esp_log.h"
#include "esp_sntp.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

namespace time_sync {

namespace {
const char* TAG = "time_sync";
constexpr std::time_t kValidAfter = 1704067200; // 2024-01-01T00:00:00Z
bool s_started = false;

void on_sync(struct timeval* tv)
{
    ESP_LOGI(TAG, "Clock synchronized: %lld", static_cast<long long>(tv ? tv->tv_sec : 0));
}
}

esp_err_t start()
{
    if (s_started) {
        return ESP_OK;
    }
    esp_sntp_setoperatingmode(ESP_SNTP_OPMODE_POLL);
    esp_sntp_setservername(0, "pool.ntp.org");
    sntp_set_time_sync_notification_cb(on_sync);
    esp_sntp_init();
    s_started = true;
    return ESP_OK;
}

bool is_valid()
{
    return now() >= kValidAfter;
}

bool wait_valid(int timeout_ms)
{
    const int step_ms = 500;
    for (int waited = 0; !is_valid(); waited += step_ms) {
        if (waited >= timeout_ms) {
            ESP_LOGW(TAG, "Clock still unset after %d ms", timeout_ms);
            return false;
        }
        vTaskDelay(pdMS_TO_TICKS(step_ms));
    }
    return true;
}

std::time_t now()
{
    return std::time(nullptr);
}

} // namespace time_sync
