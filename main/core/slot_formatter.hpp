#pragma once

#include <string>

#include "core/slot.hpp"

namespace core {

// "Oct 22 11:00AM - 11:30AM" in `time_zone` (IANA name or POSIX TZ rule).
std::string format_slot(const Slot &slot, const std::string &time_zone);

// One formatted slot per line.
std::string format_slots(const SlotList &slots, const std::string &time_zone);

std::string build_message(const std::string &formatted_slots, const std::string &booking_url);

} // namespace core
