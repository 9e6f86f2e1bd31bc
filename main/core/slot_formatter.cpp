#include "core/slot_formatter.hpp"

#include <ctime>

#include "core/time_util.hpp"

namespace core {

namespace {

std::string format_local(std::time_t t, const char *fmt)
{
    struct tm tm_local {};
    localtime_r(&t, &tm_local);
    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), fmt, &tm_local);
    return std::string(buf, n);
}

std::string format_in_current_zone(const Slot &slot)
{
    return format_local(slot.start, "%b %d %I:%M%p") + " - " + format_local(slot.end, "%I:%M%p");
}

} // namespace

std::string format_slot(const Slot &slot, const std::string &time_zone)
{
    ScopedTimeZone tz(time_zone);
    return format_in_current_zone(slot);
}

std::string format_slots(const SlotList &slots, const std::string &time_zone)
{
    ScopedTimeZone tz(time_zone);
    std::string out;
    for (size_t i = 0; i < slots.size(); ++i) {
        if (i > 0)
            out += '\n';
        out += format_in_current_zone(slots[i]);
    }
    return out;
}

std::string build_message(const std::string &formatted_slots, const std::string &booking_url)
{
    return "Booking Slots Available!\n\n" + formatted_slots + "\n\nGo to: " + booking_url;
}

} // namespace core
