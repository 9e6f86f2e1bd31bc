#include "services/watcher_service.hpp"

#include <atomic>
#include <memory>
#include <mutex>

#include "esp_log.h"
#include "esp_timer.h"
#include "freertos/FreeRTOS.h"
#include "freertos/task.h"

#include "app/app_config.hpp"
#include "app/app_events.hpp"
#include "core/time_util.hpp"
#include "core/twilio_notifier.hpp"
#include "infra/transport/http_transport.hpp"
#include "infra/transport/time_sync.hpp"

namespace watcher {

namespace {

const char* TAG = "watcher";

constexpr std::uint32_t kSleepSliceMs = 1000;

struct Runtime {
    explicit Runtime(const core::PollConfig& cfg)
        : booking_http(true, app_config::kMaxResponseBytes),
          twilio_http(false, app_config::kMaxResponseBytes),
          notifier(twilio_http, cfg),
          loop(cfg, booking_http, notifier, &time_sync::now, &sleep_ms)
    {
    }

    // Sleeps in slices so stop() takes effect without waiting a full interval.
    static void sleep_ms(std::uint32_t ms);

    transport::EspHttpClient booking_http;
    transport::EspHttpClient twilio_http;
    core::TwilioNotifier notifier;
    core::PollLoop loop;
};

std::atomic<bool> s_stop{false};
std::atomic<bool> s_running{false};
std::unique_ptr<Runtime> s_runtime;
TaskHandle_t s_task = nullptr;

std::mutex s_status_mutex;
Status s_status;

void Runtime::sleep_ms(std::uint32_t ms)
{
    while (ms > 0 && !s_stop.load()) {
        std::uint32_t slice = ms < kSleepSliceMs ? ms : kSleepSliceMs;
        vTaskDelay(pdMS_TO_TICKS(slice));
        ms -= slice;
    }
}

void log_report(const core::CycleReport& r)
{
    switch (r.outcome) {
    case core::CycleOutcome::NoSlots:
        ESP_LOGI(TAG, "cycle %u: no available slots between %s and %s",
                 static_cast<unsigned>(r.cycle),
                 core::format_utc(r.window.start).c_str(),
                 core::format_utc(r.window.end).c_str());
        break;
    case core::CycleOutcome::Notified:
        for (const auto& d : r.deliveries) {
            if (d.ok) {
                ESP_LOGI(TAG, "Notification sent to %s (SID %s)", d.recipient.c_str(), d.message_id.c_str());
            } else {
                ESP_LOGE(TAG, "Failed to send notification to %s: %s", d.recipient.c_str(), d.error.c_str());
            }
        }
        if (r.failed_deliveries() > 0) {
            ESP_LOGW(TAG, "cycle %u: %u of %u notifications failed",
                     static_cast<unsigned>(r.cycle),
                     static_cast<unsigned>(r.failed_deliveries()),
                     static_cast<unsigned>(r.deliveries.size()));
        }
        break;
    case core::CycleOutcome::NoRecipients:
        ESP_LOGE(TAG, "%s", r.error.c_str());
        break;
    case core::CycleOutcome::TransportError:
        ESP_LOGE(TAG, "cycle %u: request failed after %d retries: %s",
                 static_cast<unsigned>(r.cycle), r.retries, r.error.c_str());
        break;
    case core::CycleOutcome::SessionStatusError:
        ESP_LOGW(TAG, "Failed to get session. Status code: %d", r.session_status);
        ESP_LOGD(TAG, "Response: %s", r.upstream_body.c_str());
        break;
    case core::CycleOutcome::AvailabilityStatusError:
        ESP_LOGW(TAG, "Failed to get availability. Status code: %d", r.availability_status);
        ESP_LOGW(TAG, "Response: %s", r.upstream_body.c_str());
        break;
    case core::CycleOutcome::ValidationError:
        ESP_LOGE(TAG, "cycle %u: unexpected availability response: %s",
                 static_cast<unsigned>(r.cycle), r.error.c_str());
        break;
    case core::CycleOutcome::Stopped:
        ESP_LOGI(TAG, "stop requested");
        break;
    case core::CycleOutcome::Pending:
        break;
    }
}

void publish_report(const core::CycleReport& r)
{
    const std::int64_t now_us = esp_timer_get_time();
    std::uint32_t sent = 0;
    for (const auto& d : r.deliveries) {
        if (d.ok) {
            ++sent;
        }
        (void)app_events::post_notification_sent(d.recipient.c_str(), d.ok, now_us);
    }
    (void)app_events::post_cycle_finished(r.cycle,
                                          static_cast<int>(r.outcome),
                                          static_cast<int>(r.slots.size()),
                                          static_cast<int>(r.failed_deliveries()),
                                          now_us);

    std::lock_guard<std::mutex> lock(s_status_mutex);
    s_status.cycles = r.cycle;
    s_status.last_outcome = r.outcome;
    s_status.last_error = r.error;
    s_status.last_slot_count = static_cast<int>(r.slots.size());
    s_status.last_failed_deliveries = static_cast<int>(r.failed_deliveries());
    s_status.last_cycle_time = time_sync::now();
    s_status.notifications_sent += sent;
}

void on_transition(core::CycleState from, core::CycleState to, const core::CycleReport& report)
{
    ESP_LOGD(TAG, "cycle %u: %s -> %s",
             static_cast<unsigned>(report.cycle), core::to_string(from), core::to_string(to));
    {
        std::lock_guard<std::mutex> lock(s_status_mutex);
        s_status.state = to;
    }

    switch (to) {
    case core::CycleState::RequestSession:
        ESP_LOGI(TAG, "cycle %u: checking availability", static_cast<unsigned>(report.cycle));
        break;
    case core::CycleState::Notify:
        ESP_LOGI(TAG, "Found %u available slot(s)", static_cast<unsigned>(report.slots.size()));
        break;
    case core::CycleState::Sleep:
    case core::CycleState::Stopped:
        // The report is final once the loop leaves the cycle.
        log_report(report);
        if (report.outcome != core::CycleOutcome::Pending) {
            publish_report(report);
        }
        break;
    default:
        break;
    }
}

void watcher_task(void* /*arg*/)
{
    ESP_LOGI(TAG, "Polling started");
    s_runtime->loop.run(s_stop);
    ESP_LOGI(TAG, "Polling stopped");

    {
        std::lock_guard<std::mutex> lock(s_status_mutex);
        s_status.running = false;
        s_status.state = core::CycleState::Stopped;
    }
    s_running = false;
    s_task = nullptr;
    vTaskDelete(nullptr);
}

} // namespace

esp_err_t start(const core::PollConfig& cfg)
{
    if (s_running.load()) {
        return ESP_ERR_INVALID_STATE;
    }

    s_runtime = std::make_unique<Runtime>(cfg);
    s_runtime->loop.set_transition_handler(&on_transition);
    s_stop = false;
    s_running = true;
    {
        std::lock_guard<std::mutex> lock(s_status_mutex);
        s_status = Status{};
        s_status.running = true;
    }

    if (xTaskCreate(watcher_task, "watcher", app_config::kWatcherTaskStack, nullptr,
                    app_config::kWatcherTaskPriority, &s_task) != pdPASS) {
        ESP_LOGE(TAG, "Failed to create watcher task");
        s_running = false;
        s_task = nullptr;
        std::lock_guard<std::mutex> lock(s_status_mutex);
        s_status.running = false;
        return ESP_ERR_NO_MEM;
    }
    return ESP_OK;
}

void stop()
{
    if (s_running.load()) {
        ESP_LOGI(TAG, "Stopping watcher");
    }
    s_stop = true;
}

bool is_running()
{
    return s_running.load();
}

Status status()
{
    std::lock_guard<std::mutex> lock(s_status_mutex);
    return s_status;
}

} // namespace watcher
