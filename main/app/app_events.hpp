#pragma once

#include "esp_event.h"
#include <cstdint>

#include "app_state.hpp"

// Application-level event base for internal messages
ESP_EVENT_DECLARE_BASE(APP_EVENTS);

namespace app_events
{

    enum Id : int32_t
    {
        APP_STATE_CHANGED = 100,
        CYCLE_FINISHED = 200,
        NOTIFICATION_SENT = 201,
    };

    struct AppStateChangedPayload
    {
        int old_state = 0; // static_cast<int>(AppState)
        int new_state = 0; // static_cast<int>(AppState)
        std::int64_t timestamp_us = 0;
    };

    struct CycleFinishedPayload
    {
        std::uint32_t cycle = 0;
        int outcome = 0; // static_cast<int>(core::CycleOutcome)
        int slot_count = 0;
        int failed_deliveries = 0;
        std::int64_t timestamp_us = 0;
    };

    struct NotificationSentPayload
    {
        char recipient[24]{};
        bool success = false;
        std::int64_t timestamp_us = 0;
    };

    const char *id_to_string(int32_t id);

    esp_err_t post_app_state_changed(AppState old_state, AppState new_state, std::int64_t timestamp_us);
    esp_err_t post_cycle_finished(std::uint32_t cycle, int outcome, int slot_count, int failed_deliveries,
                                  std::int64_t timestamp_us);
    esp_err_t post_notification_sent(const char *recipient, bool success, std::int64_t timestamp_us);

} // namespace app_events
