#include <gtest/gtest.h>

#include "cJSON.h"
#include "core/booking_request.hpp"
#include "core/time_util.hpp"
#include "fakes.hpp"

namespace {

using bookwatch_test::fixed_now;
using bookwatch_test::sample_config;

std::string header(const core::HttpRequest &req, const std::string &name)
{
    for (const auto &h : req.headers) {
        if (h.first == name)
            return h.second;
    }
    return "";
}

TEST(BookingRequestTest, WindowStartsYesterdaySpansTwelveDays)
{
    core::AvailabilityWindow w = core::make_window(fixed_now());
    EXPECT_EQ(core::format_utc(w.start), "2024-10-09T00:00:00");
    EXPECT_EQ(core::format_utc(w.end), "2024-10-21T00:00:00");
}

TEST(BookingRequestTest, WindowTruncatesToMidnight)
{
    // 2024-10-10T23:59:30Z
    core::AvailabilityWindow w = core::make_window(fixed_now() + 86370);
    EXPECT_EQ(core::format_utc(w.start), "2024-10-09T00:00:00");
    EXPECT_EQ(w.end - w.start, 12 * 86400);
}

TEST(BookingRequestTest, BodyCarriesIdentityAndLabelZone)
{
    core::PollConfig cfg = sample_config();
    cfg.display_time_zone = "Europe/Berlin";
    std::string body;
    ASSERT_TRUE(core::build_availability_body(core::make_window(fixed_now()), cfg, body));

    cJSON *root = cJSON_Parse(body.c_str());
    ASSERT_NE(root, nullptr);
    EXPECT_STREQ(cJSON_GetObjectItem(root, "serviceId")->valuestring, "svc-1");

    cJSON *staff = cJSON_GetObjectItem(root, "staffIds");
    ASSERT_TRUE(cJSON_IsArray(staff));
    ASSERT_EQ(cJSON_GetArraySize(staff), 2);
    EXPECT_STREQ(cJSON_GetArrayItem(staff, 0)->valuestring, "staff-a");
    EXPECT_STREQ(cJSON_GetArrayItem(staff, 1)->valuestring, "staff-b");

    cJSON *start = cJSON_GetObjectItem(root, "startDateTime");
    cJSON *end = cJSON_GetObjectItem(root, "endDateTime");
    EXPECT_STREQ(cJSON_GetObjectItem(start, "dateTime")->valuestring, "2024-10-09T00:00:00");
    EXPECT_STREQ(cJSON_GetObjectItem(end, "dateTime")->valuestring, "2024-10-21T00:00:00");
    // The upstream label is fixed and independent of the display zone.
    EXPECT_STREQ(cJSON_GetObjectItem(start, "timeZone")->valuestring, "Pacific Standard Time");
    EXPECT_STREQ(cJSON_GetObjectItem(end, "timeZone")->valuestring, "Pacific Standard Time");
    cJSON_Delete(root);
}

TEST(BookingRequestTest, Urls)
{
    core::PollConfig cfg = sample_config();
    EXPECT_EQ(cfg.session_url(), "https://outlook.office365.com/book/Clinic@example.com/s/tok123");
    EXPECT_EQ(cfg.availability_url(),
              "https://outlook.office365.com/BookingsService/api/V1/bookingBusinessesc2/Clinic@example.com/"
              "GetStaffAvailability?app=BookingsC2&n=7");
}

TEST(BookingRequestTest, RequestsCarryBrowserAgentAndTimeout)
{
    core::PollConfig cfg = sample_config();
    cfg.http_timeout_ms = 9000;

    core::HttpRequest get = core::make_session_request(cfg);
    EXPECT_EQ(get.method, core::HttpMethod::Get);
    EXPECT_EQ(get.url, cfg.session_url());
    EXPECT_EQ(header(get, "User-Agent"), core::kBrowserUserAgent);
    EXPECT_TRUE(get.body.empty());
    EXPECT_EQ(get.timeout_ms, 9000u);

    core::HttpRequest post = core::make_availability_request(cfg, "{}");
    EXPECT_EQ(post.method, core::HttpMethod::Post);
    EXPECT_EQ(post.url, cfg.availability_url());
    EXPECT_EQ(header(post, "Content-Type"), "application/json");
    EXPECT_EQ(post.body, "{}");
}

} // namespace
