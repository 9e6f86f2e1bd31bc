#include "app_events.hpp"

#include "esp_log.h"
#include <cstring>

ESP_EVENT_DEFINE_BASE(APP_EVENTS);

namespace app_events
{

    namespace
    {
        static const char *TAG = "app_events";

        template <typename T>
        esp_err_t post(Id id, const T &payload, const char *what)
        {
            esp_err_t err = esp_event_post(APP_EVENTS, id, &payload, sizeof(payload), 0);
            if (err != ESP_OK)
            {
                ESP_LOGW(TAG, "%s failed: %s", what, esp_err_to_name(err));
            }
            return err;
        }
    } // namespace

    const char *id_to_string(int32_t id)
    {
        switch (id)
        {
        case APP_STATE_CHANGED:
            return "APP_STATE_CHANGED";
        case CYCLE_FINISHED:
            return "CYCLE_FINISHED";
        case NOTIFICATION_SENT:
            return "NOTIFICATION_SENT";
        default:
            return "UNKNOWN";
        }
    }

    esp_err_t post_app_state_changed(AppState old_state, AppState new_state, std::int64_t timestamp_us)
    {
        AppStateChangedPayload payload;
        payload.old_state = static_cast<int>(old_state);
        payload.new_state = static_cast<int>(new_state);
        payload.timestamp_us = timestamp_us;
        return post(APP_STATE_CHANGED, payload, "post_app_state_changed");
    }

    esp_err_t post_cycle_finished(std::uint32_t cycle, int outcome, int slot_count, int failed_deliveries,
                                  std::int64_t timestamp_us)
    {
        CycleFinishedPayload payload;
        payload.cycle = cycle;
        payload.outcome = outcome;
        payload.slot_count = slot_count;
        payload.failed_deliveries = failed_deliveries;
        payload.timestamp_us = timestamp_us;
        return post(CYCLE_FINISHED, payload, "post_cycle_finished");
    }

    esp_err_t post_notification_sent(const char *recipient, bool success, std::int64_t timestamp_us)
    {
        NotificationSentPayload payload;
        if (recipient)
        {
            std::strncpy(payload.recipient, recipient, sizeof(payload.recipient) - 1);
        }
        payload.success = success;
        payload.timestamp_us = timestamp_us;
        return post(NOTIFICATION_SENT, payload, "post_notification_sent");
    }

} // namespace app_events
