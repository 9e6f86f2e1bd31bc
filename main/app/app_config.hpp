#pragma once

#include <cstddef>
#include <cstdint>

namespace app_config
{

    // SSID of the soft AP started when the device needs configuration.
    constexpr const char *kSetupApSsid = "bookwatch-setup";

    // Weakest AP accepted when picking a known network (dBm).
    constexpr std::int32_t kMinRssi = -85;

    constexpr int kWifiConnectTimeoutMs = 15000;
    constexpr int kWifiRescanIntervalMs = 15000;

    // Wait for SNTP before the first cycle; the window is derived from "now".
    constexpr int kTimeSyncTimeoutMs = 30000;

    // Upper bound on a buffered booking/Twilio response body.
    constexpr std::size_t kMaxResponseBytes = 64 * 1024;

    // The watcher task runs TLS handshakes and cJSON parsing.
    constexpr std::uint32_t kWatcherTaskStack = 12288;
    constexpr unsigned kWatcherTaskPriority = 4;

} // namespace app_config
