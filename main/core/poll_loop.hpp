#pragma once

#include <atomic>
#include <cstdint>
#include <ctime>
#include <string>
#include <vector>

#include "core/http_client.hpp"
#include "core/notifier.hpp"
#include "core/slot.hpp"

namespace core {

enum class CycleState {
    Idle,
    RequestSession,
    RequestAvailability,
    Parse,
    Notify,
    Skip,
    Sleep,
    Stopped,
};

enum class CycleOutcome {
    Pending,
    NoSlots,
    Notified,
    NoRecipients,
    TransportError,
    SessionStatusError,
    AvailabilityStatusError,
    ValidationError,
    Stopped,
};

struct CycleReport {
    std::uint32_t cycle = 0;
    CycleOutcome outcome = CycleOutcome::Pending;
    AvailabilityWindow window;
    int session_status = 0;
    int availability_status = 0;
    int retries = 0;            // transport-level retries spent this cycle
    std::string error;
    std::string upstream_body;  // body of a non-200 response, truncated
    SlotList slots;
    std::string message;
    std::vector<Delivery> deliveries;

    std::size_t failed_deliveries() const;
};

using ClockFn = std::time_t (*)();
using TransitionHandler = void (*)(CycleState from, CycleState to, const CycleReport &report);

const char *to_string(CycleState state);
const char *to_string(CycleOutcome outcome);

// One booking page, one roster, one recipient list; strictly sequential.
class PollLoop {
public:
    PollLoop(const PollConfig &cfg, IHttpClient &http, INotifier &notifier, ClockFn clock, SleepFn sleep);

    void set_transition_handler(TransitionHandler handler) { on_transition_ = handler; }
    void set_retry_policy(const RetryPolicy &policy) { retry_ = policy; }

    // IDLE -> ... -> NOTIFY|SKIP, stopping short of SLEEP.
    CycleReport run_cycle(const std::atomic<bool> *stop = nullptr);

    // run_cycle() + SLEEP(polling interval) until `stop` is set.
    void run(const std::atomic<bool> &stop);

private:
    bool enter(CycleState next, CycleReport &report, const std::atomic<bool> *stop);
    void notify(CycleReport &report);

    const PollConfig &cfg_;
    IHttpClient &http_;
    INotifier &notifier_;
    ClockFn clock_;
    SleepFn sleep_;
    RetryPolicy retry_;
    TransitionHandler on_transition_ = nullptr;
    CycleState state_ = CycleState::Idle;
    std::uint32_t cycle_count_ = 0;
};

} // namespace core
