#include "core/availability_parser.hpp"

#include <cstring>
#include <utility>

#include "core/time_util.hpp"
#include "cJSON.h"

namespace core {

namespace {

const char *kFixtureStart = "2024-10-22T18:00:00";
const char *kFixtureEnd = "2024-10-22T18:30:00";

// item[key].dateTime, or nullptr if absent / not a non-empty string.
const char *nested_date_time(const cJSON *item, const char *key)
{
    const cJSON *obj = cJSON_GetObjectItemCaseSensitive(item, key);
    if (!cJSON_IsObject(obj))
        return nullptr;
    const cJSON *dt = cJSON_GetObjectItemCaseSensitive(obj, "dateTime");
    if (!cJSON_IsString(dt) || !dt->valuestring || !dt->valuestring[0])
        return nullptr;
    return dt->valuestring;
}

bool parse_items(const cJSON *items, SlotList &out, std::string &error)
{
    const cJSON *item = nullptr;
    cJSON_ArrayForEach(item, items)
    {
        const cJSON *status = cJSON_GetObjectItemCaseSensitive(item, "status");
        if (cJSON_IsString(status) && is_excluded_status(status->valuestring))
            continue;

        const char *start = nested_date_time(item, "startDateTime");
        const char *end = nested_date_time(item, "endDateTime");
        if (!start || !end) {
            error = "Missing 'startDateTime' or 'endDateTime' in item.";
            return false;
        }

        Slot slot;
        slot.start_raw = start;
        slot.end_raw = end;
        if (!parse_iso8601(start, slot.start) || !parse_iso8601(end, slot.end)) {
            error = "Malformed timestamp in item: ";
            error += start;
            error += " / ";
            error += end;
            return false;
        }
        out.push_back(std::move(slot));
    }
    return true;
}

} // namespace

bool is_excluded_status(const char *status)
{
    if (!status)
        return false;
    return std::strcmp(status, kStatusBusy) == 0 || std::strcmp(status, kStatusOutOfOffice) == 0;
}

bool parse_availability(const std::string &json, SlotList &out, std::string &error)
{
    out.clear();

    cJSON *root = cJSON_ParseWithLength(json.c_str(), json.size());
    if (!root) {
        error = "Failed to parse JSON response";
        return false;
    }

    const cJSON *staff_list = cJSON_GetObjectItemCaseSensitive(root, "staffAvailabilityResponse");
    if (!cJSON_IsArray(staff_list) || cJSON_GetArraySize(staff_list) == 0) {
        cJSON_Delete(root);
        error = "Missing 'staffAvailabilityResponse' in response.";
        return false;
    }

    SlotList slots;
    bool ok = true;
    const cJSON *staff = nullptr;
    cJSON_ArrayForEach(staff, staff_list)
    {
        const cJSON *items = cJSON_GetObjectItemCaseSensitive(staff, "availabilityItems");
        if (!cJSON_IsArray(items)) {
            error = "Missing 'availabilityItems' in staff data.";
            ok = false;
            break;
        }
        if (!parse_items(items, slots, error)) {
            ok = false;
            break;
        }
    }

    cJSON_Delete(root);
    if (ok)
        out = std::move(slots);
    return ok;
}

Slot fixture_slot()
{
    Slot slot;
    slot.start_raw = kFixtureStart;
    slot.end_raw = kFixtureEnd;
    (void)parse_iso8601(kFixtureStart, slot.start);
    (void)parse_iso8601(kFixtureEnd, slot.end);
    return slot;
}

} // namespace core
