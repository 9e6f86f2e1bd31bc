#include "event_logger.hpp"

#include "esp_event.h"
#include "esp_log.h"
#include "app_events.hpp"
#include "core/poll_loop.hpp"

namespace event_logger
{

    namespace
    {
        static const char *TAG = "APP_EVENT_BUS";
        static esp_event_handler_instance_t s_any_instance = nullptr;

        static void log_event(void * /*arg*/,
                              esp_event_base_t event_base,
                              int32_t event_id,
                              void *event_data)
        {
            const char *base_str = event_base ? event_base : "NULL";
            switch (event_id)
            {
            case app_events::APP_STATE_CHANGED:
            {
                auto *p = static_cast<const app_events::AppStateChangedPayload *>(event_data);
                if (!p)
                    break;
                ESP_LOGI(TAG,
                         "event: base=%s id=APP_STATE_CHANGED %s -> %s",
                         base_str,
                         app_state_name(static_cast<AppState>(p->old_state)),
                         app_state_name(static_cast<AppState>(p->new_state)));
                break;
            }
            case app_events::CYCLE_FINISHED:
            {
                auto *p = static_cast<const app_events::CycleFinishedPayload *>(event_data);
                if (!p)
                    break;
                ESP_LOGI(TAG,
                         "event: base=%s id=CYCLE_FINISHED cycle=%u outcome=%s slots=%d failed=%d",
                         base_str,
                         static_cast<unsigned>(p->cycle),
                         core::to_string(static_cast<core::CycleOutcome>(p->outcome)),
                         p->slot_count,
                         p->failed_deliveries);
                break;
            }
            case app_events::NOTIFICATION_SENT:
            {
                auto *p = static_cast<const app_events::NotificationSentPayload *>(event_data);
                if (!p)
                    break;
                ESP_LOGI(TAG,
                         "event: base=%s id=NOTIFICATION_SENT recipient=%s success=%d",
                         base_str,
                         p->recipient[0] ? p->recipient : "<null>",
                         (int)p->success);
                break;
            }
            default:
                ESP_LOGI(TAG,
                         "event: base=%s id=%s (%ld)",
                         base_str,
                         app_events::id_to_string(event_id),
                         static_cast<long>(event_id));
                break;
            }
        }
    } // namespace

    esp_err_t init()
    {
        esp_err_t err = esp_event_handler_instance_register(
            APP_EVENTS,
            ESP_EVENT_ANY_ID,
            &log_event,
            nullptr,
            &s_any_instance);

        if (err != ESP_OK)
        {
            ESP_LOGE(TAG, "failed to register event logger: %s", esp_err_to_name(err));
        }

        return err;
    }

} // namespace event_logger
