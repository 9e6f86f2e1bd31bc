#pragma once

#include <string>

#include "core/http_client.hpp"
#include "core/notifier.hpp"
#include "core/slot.hpp"

namespace core {

// SMS through the Twilio Messages API over an IHttpClient.
class TwilioNotifier : public INotifier {
public:
    TwilioNotifier(IHttpClient &http, const PollConfig &cfg);

    bool send(const std::string &recipient, const std::string &message, Delivery &delivery) override;

    std::string messages_url() const;

private:
    IHttpClient &http_;
    std::string api_base_;
    std::string account_sid_;
    std::string auth_token_;
    std::string from_;
    std::uint32_t timeout_ms_;
};

// application/x-www-form-urlencoded value encoding.
std::string form_encode(const std::string &value);

} // namespace core
