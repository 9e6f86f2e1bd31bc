#include "core/booking_request.hpp"

#include "core/time_util.hpp"
#include "cJSON.h"

namespace core {

const char *const kBrowserUserAgent =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 (KHTML, like Gecko) "
    "Chrome/114.0.5735.90 Safari/537.36";

namespace {

constexpr std::time_t kDay = 24 * 60 * 60;
constexpr int kWindowDays = 12;

cJSON *make_date_time(const std::string &date_time, const std::string &zone)
{
    cJSON *obj = cJSON_CreateObject();
    if (!obj)
        return nullptr;
    if (!cJSON_AddStringToObject(obj, "dateTime", date_time.c_str()) ||
        !cJSON_AddStringToObject(obj, "timeZone", zone.c_str())) {
        cJSON_Delete(obj);
        return nullptr;
    }
    return obj;
}

} // namespace

std::string PollConfig::session_url() const
{
    return "https://" + provider_host + "/book/" + mailbox + "/s/" + page_token;
}

std::string PollConfig::availability_url() const
{
    return "https://" + provider_host + "/BookingsService/api/V1/bookingBusinessesc2/" + mailbox +
           "/GetStaffAvailability?app=BookingsC2&n=7";
}

AvailabilityWindow make_window(std::time_t now)
{
    AvailabilityWindow w;
    w.start = utc_midnight(now - kDay);
    w.end = w.start + kWindowDays * kDay;
    return w;
}

bool build_availability_body(const AvailabilityWindow &window, const PollConfig &cfg, std::string &out_json)
{
    cJSON *root = cJSON_CreateObject();
    if (!root)
        return false;

    bool ok = cJSON_AddStringToObject(root, "serviceId", cfg.service_id.c_str()) != nullptr;

    cJSON *staff = ok ? cJSON_AddArrayToObject(root, "staffIds") : nullptr;
    ok = ok && staff;
    for (size_t i = 0; ok && i < cfg.staff_ids.size(); ++i) {
        cJSON *id = cJSON_CreateString(cfg.staff_ids[i].c_str());
        if (!id || !cJSON_AddItemToArray(staff, id)) {
            cJSON_Delete(id);
            ok = false;
        }
    }

    if (ok) {
        cJSON *start = make_date_time(format_utc(window.start), cfg.request_time_zone);
        if (!start || !cJSON_AddItemToObject(root, "startDateTime", start)) {
            cJSON_Delete(start);
            ok = false;
        }
    }
    if (ok) {
        cJSON *end = make_date_time(format_utc(window.end), cfg.request_time_zone);
        if (!end || !cJSON_AddItemToObject(root, "endDateTime", end)) {
            cJSON_Delete(end);
            ok = false;
        }
    }

    char *text = ok ? cJSON_PrintUnformatted(root) : nullptr;
    cJSON_Delete(root);
    if (!text)
        return false;
    out_json = text;
    cJSON_free(text);
    return true;
}

HttpRequest make_session_request(const PollConfig &cfg)
{
    HttpRequest req;
    req.method = HttpMethod::Get;
    req.url = cfg.session_url();
    req.headers.emplace_back("User-Agent", kBrowserUserAgent);
    req.timeout_ms = cfg.http_timeout_ms;
    return req;
}

HttpRequest make_availability_request(const PollConfig &cfg, const std::string &body)
{
    HttpRequest req;
    req.method = HttpMethod::Post;
    req.url = cfg.availability_url();
    req.headers.emplace_back("User-Agent", kBrowserUserAgent);
    req.headers.emplace_back("Content-Type", "application/json");
    req.headers.emplace_back("Accept", "application/json");
    req.body = body;
    req.timeout_ms = cfg.http_timeout_ms;
    return req;
}

} // namespace core
