#pragma once

#include <string>

#include "core/slot.hpp"

namespace core {

// Extract bookable slots from a GetStaffAvailability response.
// Fails (returns false, `error` set, `out` left empty) on invalid JSON, a
// missing/empty staffAvailabilityResponse, a staff entry without
// availabilityItems, or a non-excluded item without parseable start/end.
bool parse_availability(const std::string &json, SlotList &out, std::string &error);

bool is_excluded_status(const char *status);

// Synthetic slot used by test mode (2024-10-22 18:00-18:30 UTC).
Slot fixture_slot();

} // namespace core
