#pragma once

#include <cstdint>
#include <ctime>
#include <deque>
#include <set>
#include <string>
#include <vector>

#include "core/http_client.hpp"
#include "core/notifier.hpp"
#include "core/slot.hpp"

namespace bookwatch_test {

// Scripted HTTP client: each send() pops the next reply for the method.
class FakeHttpClient : public core::IHttpClient {
public:
    struct Reply {
        bool transport_ok = true;
        int status = 200;
        std::string body;
        std::string error;
    };

    void push_get(int status, const std::string &body = "") { gets_.push_back({true, status, body, ""}); }
    void push_post(int status, const std::string &body = "") { posts_.push_back({true, status, body, ""}); }
    void push_get_error(const std::string &error) { gets_.push_back({false, 0, "", error}); }
    void push_post_error(const std::string &error) { posts_.push_back({false, 0, "", error}); }

    bool send(const core::HttpRequest &request, core::HttpResponse &response, std::string &error) override
    {
        requests.push_back(request);
        std::deque<Reply> &queue = request.method == core::HttpMethod::Get ? gets_ : posts_;
        if (queue.empty()) {
            error = "no scripted reply";
            return false;
        }
        Reply r = queue.front();
        if (queue.size() > 1 || !sticky_last)
            queue.pop_front();
        if (!r.transport_ok) {
            error = r.error;
            return false;
        }
        response.status = r.status;
        response.body = r.body;
        return true;
    }

    int count(core::HttpMethod method) const
    {
        int n = 0;
        for (const auto &r : requests) {
            if (r.method == method)
                ++n;
        }
        return n;
    }

    // Keep replaying the last scripted reply instead of running dry.
    bool sticky_last = false;
    std::vector<core::HttpRequest> requests;

private:
    std::deque<Reply> gets_;
    std::deque<Reply> posts_;
};

class FakeNotifier : public core::INotifier {
public:
    struct Sent {
        std::string recipient;
        std::string message;
    };

    bool send(const std::string &recipient, const std::string &message, core::Delivery &delivery) override
    {
        sent.push_back({recipient, message});
        delivery = core::Delivery{};
        delivery.recipient = recipient;
        if (failing.count(recipient)) {
            delivery.error = "rejected";
            return false;
        }
        delivery.ok = true;
        delivery.message_id = "SM" + std::to_string(sent.size());
        return true;
    }

    std::set<std::string> failing;
    std::vector<Sent> sent;
};

// Records every sleep instead of blocking.
struct SleepLog {
    static std::vector<std::uint32_t> &calls()
    {
        static std::vector<std::uint32_t> v;
        return v;
    }
    static void record(std::uint32_t ms) { calls().push_back(ms); }
};

inline std::time_t fixed_now()
{
    return 1728518400; // 2024-10-10T00:00:00Z
}

inline core::PollConfig sample_config()
{
    core::PollConfig cfg;
    cfg.mailbox = "Clinic@example.com";
    cfg.page_token = "tok123";
    cfg.service_id = "svc-1";
    cfg.staff_ids = {"staff-a", "staff-b"};
    cfg.twilio_account_sid = "AC0001";
    cfg.twilio_auth_token = "secret";
    cfg.twilio_from_number = "+15550000000";
    cfg.recipients = {"+15551111111", "+15552222222"};
    return cfg;
}

} // namespace bookwatch_test
