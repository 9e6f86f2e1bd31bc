#include "core/poll_loop.hpp"

#include <utility>

#include "core/availability_parser.hpp"
#include "core/booking_request.hpp"
#include "core/slot_formatter.hpp"

namespace core {

namespace {

constexpr size_t kBodyExcerptLen = 256;

std::string excerpt(const std::string &body)
{
    if (body.size() <= kBodyExcerptLen)
        return body;
    return body.substr(0, kBodyExcerptLen) + "...";
}

std::string trim(const std::string &s)
{
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

} // namespace

std::size_t CycleReport::failed_deliveries() const
{
    std::size_t failed = 0;
    for (const auto &d : deliveries) {
        if (!d.ok)
            ++failed;
    }
    return failed;
}

const char *to_string(CycleState state)
{
    switch (state) {
    case CycleState::Idle:
        return "IDLE";
    case CycleState::RequestSession:
        return "REQUEST_SESSION";
    case CycleState::RequestAvailability:
        return "REQUEST_AVAILABILITY";
    case CycleState::Parse:
        return "PARSE";
    case CycleState::Notify:
        return "NOTIFY";
    case CycleState::Skip:
        return "SKIP";
    case CycleState::Sleep:
        return "SLEEP";
    case CycleState::Stopped:
        return "STOPPED";
    }
    return "?";
}

const char *to_string(CycleOutcome outcome)
{
    switch (outcome) {
    case CycleOutcome::Pending:
        return "pending";
    case CycleOutcome::NoSlots:
        return "no-slots";
    case CycleOutcome::Notified:
        return "notified";
    case CycleOutcome::NoRecipients:
        return "no-recipients";
    case CycleOutcome::TransportError:
        return "transport-error";
    case CycleOutcome::SessionStatusError:
        return "session-status-error";
    case CycleOutcome::AvailabilityStatusError:
        return "availability-status-error";
    case CycleOutcome::ValidationError:
        return "validation-error";
    case CycleOutcome::Stopped:
        return "stopped";
    }
    return "?";
}

PollLoop::PollLoop(const PollConfig &cfg, IHttpClient &http, INotifier &notifier, ClockFn clock, SleepFn sleep)
    : cfg_(cfg), http_(http), notifier_(notifier), clock_(clock), sleep_(sleep)
{
}

bool PollLoop::enter(CycleState next, CycleReport &report, const std::atomic<bool> *stop)
{
    if (stop && stop->load()) {
        report.outcome = CycleOutcome::Stopped;
        next = CycleState::Stopped;
    }
    CycleState prev = state_;
    state_ = next;
    if (on_transition_)
        on_transition_(prev, next, report);
    return next != CycleState::Stopped;
}

CycleReport PollLoop::run_cycle(const std::atomic<bool> *stop)
{
    CycleReport report;
    report.cycle = ++cycle_count_;
    state_ = CycleState::Idle;

    if (cfg_.send_test_notification) {
        // No upstream traffic; the fixture stands in for the parsed response.
        if (!enter(CycleState::Parse, report, stop))
            return report;
        report.slots.push_back(fixture_slot());
    } else {
        if (!enter(CycleState::RequestSession, report, stop))
            return report;

        HttpResponse resp;
        RetryOutcome sent = send_with_retry(http_, make_session_request(cfg_), resp, retry_, sleep_);
        report.retries += sent.attempts - 1;
        if (!sent.ok) {
            report.outcome = CycleOutcome::TransportError;
            report.error = sent.error;
            return report;
        }
        report.session_status = resp.status;
        if (resp.status != 200) {
            report.outcome = CycleOutcome::SessionStatusError;
            report.upstream_body = excerpt(resp.body);
            return report;
        }

        if (!enter(CycleState::RequestAvailability, report, stop))
            return report;

        report.window = make_window(clock_ ? clock_() : std::time(nullptr));
        std::string body;
        if (!build_availability_body(report.window, cfg_, body)) {
            report.outcome = CycleOutcome::TransportError;
            report.error = "out of memory building request body";
            return report;
        }

        sent = send_with_retry(http_, make_availability_request(cfg_, body), resp, retry_, sleep_);
        report.retries += sent.attempts - 1;
        if (!sent.ok) {
            report.outcome = CycleOutcome::TransportError;
            report.error = sent.error;
            return report;
        }
        report.availability_status = resp.status;
        if (resp.status != 200) {
            report.outcome = CycleOutcome::AvailabilityStatusError;
            report.upstream_body = excerpt(resp.body);
            return report;
        }

        if (!enter(CycleState::Parse, report, stop))
            return report;
        if (!parse_availability(resp.body, report.slots, report.error)) {
            report.outcome = CycleOutcome::ValidationError;
            return report;
        }
    }

    if (report.slots.empty()) {
        report.outcome = CycleOutcome::NoSlots;
        (void)enter(CycleState::Skip, report, stop);
        return report;
    }

    if (!enter(CycleState::Notify, report, stop))
        return report;
    notify(report);
    return report;
}

void PollLoop::notify(CycleReport &report)
{
    report.message = build_message(format_slots(report.slots, cfg_.display_time_zone), cfg_.session_url());

    for (const auto &raw : cfg_.recipients) {
        std::string recipient = trim(raw);
        if (recipient.empty())
            continue;
        Delivery delivery;
        delivery.ok = notifier_.send(recipient, report.message, delivery);
        if (!delivery.ok && delivery.error.empty())
            delivery.error = "send failed";
        delivery.recipient = recipient;
        report.deliveries.push_back(std::move(delivery));
    }

    if (report.deliveries.empty()) {
        report.outcome = CycleOutcome::NoRecipients;
        report.error = "No recipients specified for notifications.";
    } else {
        report.outcome = CycleOutcome::Notified;
    }
}

void PollLoop::run(const std::atomic<bool> &stop)
{
    while (!stop.load()) {
        CycleReport report = run_cycle(&stop);
        if (report.outcome == CycleOutcome::Stopped)
            break;
        if (!enter(CycleState::Sleep, report, &stop))
            break;
        if (sleep_)
            sleep_(cfg_.polling_interval_s * 1000u);
    }
}

} // namespace core
