#pragma once

#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

namespace core {

// Upstream statuses that never count as a bookable slot.
constexpr const char *kStatusBusy = "BOOKINGSAVAILABILITYSTATUS_BUSY";
constexpr const char *kStatusOutOfOffice = "BOOKINGSAVAILABILITYSTATUS_OUT_OF_OFFICE";

struct AvailabilityWindow {
    std::time_t start = 0; // UTC midnight
    std::time_t end = 0;   // start + 12 days
};

struct Slot {
    std::string start_raw;
    std::string end_raw;
    std::time_t start = 0; // UTC
    std::time_t end = 0;   // UTC
};

using SlotList = std::vector<Slot>;

struct PollConfig {
    std::string provider_host = "outlook.office365.com";
    std::string mailbox;
    std::string page_token;
    std::string service_id;
    std::vector<std::string> staff_ids;
    std::string request_time_zone = "Pacific Standard Time";
    std::string display_time_zone = "America/Los_Angeles";

    std::string twilio_api_base = "https://api.twilio.com";
    std::string twilio_account_sid;
    std::string twilio_auth_token;
    std::string twilio_from_number;

    std::vector<std::string> recipients;

    std::uint32_t polling_interval_s = 60;
    bool send_test_notification = false;
    std::uint32_t http_timeout_ms = 15000;

    std::string session_url() const;
    std::string availability_url() const;
};

} // namespace core
