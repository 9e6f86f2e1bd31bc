#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <vector>

#include "core/poll_loop.hpp"
#include "fakes.hpp"

namespace {

using bookwatch_test::FakeHttpClient;
using bookwatch_test::FakeNotifier;
using bookwatch_test::SleepLog;
using bookwatch_test::fixed_now;
using bookwatch_test::sample_config;

const char *kOneOpenSlot = R"({"staffAvailabilityResponse":[{"availabilityItems":[
    {"status":"BOOKINGSAVAILABILITYSTATUS_BUSY",
     "startDateTime":{"dateTime":"2024-10-22T17:00:00"},
     "endDateTime":{"dateTime":"2024-10-22T17:30:00"}},
    {"status":"BOOKINGSAVAILABILITYSTATUS_AVAILABLE",
     "startDateTime":{"dateTime":"2024-10-22T18:00:00"},
     "endDateTime":{"dateTime":"2024-10-22T18:30:00"}}]}]})";

const char *kAllBusy = R"({"staffAvailabilityResponse":[{"availabilityItems":[
    {"status":"BOOKINGSAVAILABILITYSTATUS_BUSY",
     "startDateTime":{"dateTime":"2024-10-22T17:00:00"},
     "endDateTime":{"dateTime":"2024-10-22T17:30:00"}}]}]})";

std::vector<core::CycleState> &transitions()
{
    static std::vector<core::CycleState> v;
    return v;
}

void record_transition(core::CycleState, core::CycleState to, const core::CycleReport &)
{
    transitions().push_back(to);
}

std::atomic<bool> g_stop{false};
int g_interval_sleeps = 0;

// Stops the loop after the second polling-interval sleep.
void sleep_then_stop(std::uint32_t ms)
{
    SleepLog::record(ms);
    if (ms == 60000u && ++g_interval_sleeps == 2)
        g_stop = true;
}

class PollLoopTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        cfg = sample_config();
        transitions().clear();
        SleepLog::calls().clear();
        g_stop = false;
        g_interval_sleeps = 0;
    }

    core::PollLoop make_loop()
    {
        core::PollLoop loop(cfg, http, notifier, &fixed_now, &SleepLog::record);
        loop.set_transition_handler(&record_transition);
        return loop;
    }

    core::PollConfig cfg;
    FakeHttpClient http;
    FakeNotifier notifier;
};

TEST_F(PollLoopTest, TestModeSendsFixtureWithoutUpstreamTraffic)
{
    cfg.send_test_notification = true;
    core::PollLoop loop = make_loop();
    core::CycleReport report = loop.run_cycle();

    EXPECT_EQ(report.outcome, core::CycleOutcome::Notified);
    EXPECT_TRUE(http.requests.empty());
    ASSERT_EQ(report.slots.size(), 1u);
    ASSERT_EQ(notifier.sent.size(), 2u);
    EXPECT_EQ(notifier.sent[0].recipient, "+15551111111");
    EXPECT_EQ(notifier.sent[1].recipient, "+15552222222");
    EXPECT_NE(report.message.find("Oct 22 11:00AM - 11:30AM"), std::string::npos);
    EXPECT_NE(report.message.find("Go to: https://outlook.office365.com/book/Clinic@example.com/s/tok123"),
              std::string::npos);
    EXPECT_EQ(transitions(), (std::vector<core::CycleState>{core::CycleState::Parse, core::CycleState::Notify}));
}

TEST_F(PollLoopTest, OpenSlotNotifiesEveryRecipient)
{
    http.push_get(200, "<html></html>");
    http.push_post(200, kOneOpenSlot);
    core::PollLoop loop = make_loop();
    core::CycleReport report = loop.run_cycle();

    EXPECT_EQ(report.outcome, core::CycleOutcome::Notified);
    EXPECT_EQ(report.session_status, 200);
    EXPECT_EQ(report.availability_status, 200);
    ASSERT_EQ(report.slots.size(), 1u);
    EXPECT_EQ(report.deliveries.size(), 2u);
    EXPECT_EQ(report.failed_deliveries(), 0u);
    EXPECT_EQ(report.message,
              "Booking Slots Available!\n\nOct 22 11:00AM - 11:30AM\n\n"
              "Go to: https://outlook.office365.com/book/Clinic@example.com/s/tok123");

    ASSERT_EQ(http.requests.size(), 2u);
    EXPECT_EQ(http.requests[0].method, core::HttpMethod::Get);
    EXPECT_EQ(http.requests[1].method, core::HttpMethod::Post);
    EXPECT_NE(http.requests[1].body.find("2024-10-09T00:00:00"), std::string::npos);
    EXPECT_EQ(transitions(),
              (std::vector<core::CycleState>{core::CycleState::RequestSession,
                                             core::CycleState::RequestAvailability,
                                             core::CycleState::Parse,
                                             core::CycleState::Notify}));
}

TEST_F(PollLoopTest, SessionFailureSkipsAvailability)
{
    http.sticky_last = true;
    http.push_get(503, "unavailable");
    core::PollLoop loop = make_loop();
    core::CycleReport report = loop.run_cycle();

    EXPECT_EQ(report.outcome, core::CycleOutcome::SessionStatusError);
    EXPECT_EQ(report.session_status, 503);
    EXPECT_EQ(report.upstream_body, "unavailable");
    EXPECT_EQ(report.retries, 3);
    EXPECT_EQ(http.count(core::HttpMethod::Get), 4);
    EXPECT_EQ(http.count(core::HttpMethod::Post), 0);
    EXPECT_TRUE(notifier.sent.empty());
}

TEST_F(PollLoopTest, AvailabilityStatusError)
{
    http.push_get(200);
    http.push_post(400, "bad request");
    core::PollLoop loop = make_loop();
    core::CycleReport report = loop.run_cycle();

    EXPECT_EQ(report.outcome, core::CycleOutcome::AvailabilityStatusError);
    EXPECT_EQ(report.availability_status, 400);
    EXPECT_EQ(report.retries, 0);
    EXPECT_TRUE(notifier.sent.empty());
}

TEST_F(PollLoopTest, AllBusyNotifiesNobody)
{
    http.push_get(200);
    http.push_post(200, kAllBusy);
    core::PollLoop loop = make_loop();
    core::CycleReport report = loop.run_cycle();

    EXPECT_EQ(report.outcome, core::CycleOutcome::NoSlots);
    EXPECT_TRUE(notifier.sent.empty());
    EXPECT_EQ(transitions().back(), core::CycleState::Skip);
}

TEST_F(PollLoopTest, OneFailedRecipientDoesNotStopFanOut)
{
    cfg.send_test_notification = true;
    notifier.failing.insert("+15551111111");
    core::PollLoop loop = make_loop();
    core::CycleReport report = loop.run_cycle();

    EXPECT_EQ(report.outcome, core::CycleOutcome::Notified);
    ASSERT_EQ(report.deliveries.size(), 2u);
    EXPECT_FALSE(report.deliveries[0].ok);
    EXPECT_EQ(report.deliveries[0].error, "rejected");
    EXPECT_TRUE(report.deliveries[1].ok);
    EXPECT_EQ(report.failed_deliveries(), 1u);
}

TEST_F(PollLoopTest, RecipientsAreTrimmedAndBlanksSkipped)
{
    cfg.send_test_notification = true;
    cfg.recipients = {"  +15553333333 ", "", "   "};
    core::PollLoop loop = make_loop();
    core::CycleReport report = loop.run_cycle();

    ASSERT_EQ(notifier.sent.size(), 1u);
    EXPECT_EQ(notifier.sent[0].recipient, "+15553333333");
    EXPECT_EQ(report.outcome, core::CycleOutcome::Notified);
}

TEST_F(PollLoopTest, NoRecipients)
{
    cfg.send_test_notification = true;
    cfg.recipients.clear();
    core::PollLoop loop = make_loop();
    core::CycleReport report = loop.run_cycle();

    EXPECT_EQ(report.outcome, core::CycleOutcome::NoRecipients);
    EXPECT_EQ(report.error, "No recipients specified for notifications.");
    EXPECT_TRUE(notifier.sent.empty());
}

TEST_F(PollLoopTest, TransportErrorAfterRetries)
{
    http.sticky_last = true;
    http.push_get_error("dns failure");
    core::PollLoop loop = make_loop();
    core::CycleReport report = loop.run_cycle();

    EXPECT_EQ(report.outcome, core::CycleOutcome::TransportError);
    EXPECT_EQ(report.error, "dns failure");
    EXPECT_EQ(http.count(core::HttpMethod::Get), 4);
    EXPECT_EQ(SleepLog::calls(), (std::vector<std::uint32_t>{10000, 20000}));
}

TEST_F(PollLoopTest, AvailabilityRetriesUnavailableThenGivesUp)
{
    http.sticky_last = true;
    http.push_get(200);
    http.push_post(503, "try later");
    core::PollLoop loop = make_loop();
    core::CycleReport report = loop.run_cycle();

    EXPECT_EQ(report.outcome, core::CycleOutcome::AvailabilityStatusError);
    EXPECT_EQ(report.session_status, 200);
    EXPECT_EQ(report.availability_status, 503);
    EXPECT_EQ(report.upstream_body, "try later");
    EXPECT_EQ(report.retries, 3);
    EXPECT_EQ(http.count(core::HttpMethod::Get), 1);
    EXPECT_EQ(http.count(core::HttpMethod::Post), 4);
    EXPECT_TRUE(notifier.sent.empty());
}

TEST_F(PollLoopTest, AvailabilityTransportErrorAfterRetries)
{
    http.sticky_last = true;
    http.push_get(200);
    http.push_post_error("connection reset");
    core::PollLoop loop = make_loop();
    core::CycleReport report = loop.run_cycle();

    EXPECT_EQ(report.outcome, core::CycleOutcome::TransportError);
    EXPECT_EQ(report.error, "connection reset");
    EXPECT_EQ(http.count(core::HttpMethod::Get), 1);
    EXPECT_EQ(http.count(core::HttpMethod::Post), 4);
    EXPECT_EQ(SleepLog::calls(), (std::vector<std::uint32_t>{10000, 20000}));
    EXPECT_TRUE(notifier.sent.empty());
}

TEST_F(PollLoopTest, MalformedResponseIsValidationError)
{
    http.push_get(200);
    http.push_post(200, R"({"unexpected":true})");
    core::PollLoop loop = make_loop();
    core::CycleReport report = loop.run_cycle();

    EXPECT_EQ(report.outcome, core::CycleOutcome::ValidationError);
    EXPECT_EQ(report.error, "Missing 'staffAvailabilityResponse' in response.");
    EXPECT_TRUE(notifier.sent.empty());
}

TEST_F(PollLoopTest, StopFlagHaltsBeforeRequests)
{
    std::atomic<bool> stop{true};
    core::PollLoop loop = make_loop();
    core::CycleReport report = loop.run_cycle(&stop);

    EXPECT_EQ(report.outcome, core::CycleOutcome::Stopped);
    EXPECT_TRUE(http.requests.empty());
    EXPECT_EQ(transitions(), (std::vector<core::CycleState>{core::CycleState::Stopped}));
}

TEST_F(PollLoopTest, RunSleepsPollingIntervalBetweenCycles)
{
    cfg.send_test_notification = true;
    core::PollLoop loop(cfg, http, notifier, &fixed_now, &sleep_then_stop);
    loop.set_transition_handler(&record_transition);
    loop.run(g_stop);

    EXPECT_EQ(notifier.sent.size(), 4u);
    EXPECT_EQ(SleepLog::calls(), (std::vector<std::uint32_t>{60000, 60000}));
}

TEST_F(PollLoopTest, Names)
{
    EXPECT_STREQ(core::to_string(core::CycleState::RequestAvailability), "REQUEST_AVAILABILITY");
    EXPECT_STREQ(core::to_string(core::CycleOutcome::SessionStatusError), "session-status-error");
}

} // namespace
