#include <gtest/gtest.h>

#include "core/http_client.hpp"
#include "fakes.hpp"

namespace {

using bookwatch_test::FakeHttpClient;
using bookwatch_test::SleepLog;

core::HttpRequest get_request()
{
    core::HttpRequest req;
    req.url = "https://example.com/";
    return req;
}

class RetryTest : public ::testing::Test {
protected:
    void SetUp() override { SleepLog::calls().clear(); }
};

TEST_F(RetryTest, BackoffSchedule)
{
    core::RetryPolicy policy;
    EXPECT_EQ(policy.backoff_ms(1), 0u);
    EXPECT_EQ(policy.backoff_ms(2), 10000u);
    EXPECT_EQ(policy.backoff_ms(3), 20000u);
    EXPECT_EQ(policy.backoff_ms(30), 120000u);
}

TEST_F(RetryTest, ForceListedStatusRetriedUntilExhausted)
{
    FakeHttpClient http;
    http.sticky_last = true;
    http.push_get(503, "busy");
    core::HttpResponse resp;
    core::RetryOutcome out = core::send_with_retry(http, get_request(), resp, core::RetryPolicy{}, &SleepLog::record);
    EXPECT_TRUE(out.ok);
    EXPECT_EQ(out.attempts, 4);
    EXPECT_EQ(resp.status, 503);
    EXPECT_EQ(resp.body, "busy");
    EXPECT_EQ(SleepLog::calls(), (std::vector<std::uint32_t>{10000, 20000}));
}

TEST_F(RetryTest, RecoversAfterTransientFailure)
{
    FakeHttpClient http;
    http.push_get(502);
    http.push_get(200, "ok");
    core::HttpResponse resp;
    core::RetryOutcome out = core::send_with_retry(http, get_request(), resp, core::RetryPolicy{}, &SleepLog::record);
    EXPECT_TRUE(out.ok);
    EXPECT_EQ(out.attempts, 2);
    EXPECT_EQ(resp.status, 200);
    EXPECT_TRUE(SleepLog::calls().empty());
}

TEST_F(RetryTest, OtherStatusesNotRetried)
{
    FakeHttpClient http;
    http.push_get(404, "nope");
    http.push_get(200);
    core::HttpResponse resp;
    core::RetryOutcome out = core::send_with_retry(http, get_request(), resp, core::RetryPolicy{}, &SleepLog::record);
    EXPECT_TRUE(out.ok);
    EXPECT_EQ(out.attempts, 1);
    EXPECT_EQ(resp.status, 404);
}

TEST_F(RetryTest, TransportErrorsRetriedThenSurfaced)
{
    FakeHttpClient http;
    http.sticky_last = true;
    http.push_get_error("connection refused");
    core::HttpResponse resp;
    core::RetryOutcome out = core::send_with_retry(http, get_request(), resp, core::RetryPolicy{}, &SleepLog::record);
    EXPECT_FALSE(out.ok);
    EXPECT_EQ(out.attempts, 4);
    EXPECT_EQ(out.error, "connection refused");
}

TEST_F(RetryTest, ZeroRetries)
{
    FakeHttpClient http;
    http.push_get(500);
    core::RetryPolicy policy;
    policy.max_retries = 0;
    core::HttpResponse resp;
    core::RetryOutcome out = core::send_with_retry(http, get_request(), resp, policy, nullptr);
    EXPECT_EQ(out.attempts, 1);
    EXPECT_EQ(resp.status, 500);
}

TEST_F(RetryTest, MethodNames)
{
    EXPECT_STREQ(core::method_name(core::HttpMethod::Get), "GET");
    EXPECT_STREQ(core::method_name(core::HttpMethod::Post), "POST");
}

} // namespace
