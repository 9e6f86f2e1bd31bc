#pragma once

#include <ctime>
#include <string>

#include "core/http_client.hpp"
#include "core/slot.hpp"

namespace core {

// Browser identity the booking page expects.
extern const char *const kBrowserUserAgent;

// [midnight(now - 1 day), +12 days), in UTC.
AvailabilityWindow make_window(std::time_t now);

// JSON body for GetStaffAvailability. Returns false if cJSON runs out of memory.
bool build_availability_body(const AvailabilityWindow &window, const PollConfig &cfg, std::string &out_json);

HttpRequest make_session_request(const PollConfig &cfg);
HttpRequest make_availability_request(const PollConfig &cfg, const std::string &body);

} // namespace core
