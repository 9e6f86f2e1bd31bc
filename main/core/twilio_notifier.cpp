#include "core/twilio_notifier.hpp"

#include <cstdio>

#include "cJSON.h"

namespace core {

namespace {

bool is_unreserved(unsigned char c)
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '-' || c == '_' || c == '.' || c == '~';
}

// Twilio error bodies look like {"code": 21211, "message": "...", "status": 400}.
std::string describe_error(const HttpResponse &resp)
{
    char prefix[32];
    std::snprintf(prefix, sizeof(prefix), "HTTP %d", resp.status);
    std::string out = prefix;

    cJSON *root = cJSON_ParseWithLength(resp.body.c_str(), resp.body.size());
    if (!root)
        return out;
    const cJSON *code = cJSON_GetObjectItemCaseSensitive(root, "code");
    const cJSON *message = cJSON_GetObjectItemCaseSensitive(root, "message");
    if (cJSON_IsNumber(code)) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), " code=%d", code->valueint);
        out += buf;
    }
    if (cJSON_IsString(message) && message->valuestring) {
        out += ": ";
        out += message->valuestring;
    }
    cJSON_Delete(root);
    return out;
}

} // namespace

std::string form_encode(const std::string &value)
{
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (is_unreserved(c)) {
            out += static_cast<char>(c);
        } else if (c == ' ') {
            out += '+';
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

TwilioNotifier::TwilioNotifier(IHttpClient &http, const PollConfig &cfg)
    : http_(http),
      api_base_(cfg.twilio_api_base),
      account_sid_(cfg.twilio_account_sid),
      auth_token_(cfg.twilio_auth_token),
      from_(cfg.twilio_from_number),
      timeout_ms_(cfg.http_timeout_ms)
{
}

std::string TwilioNotifier::messages_url() const
{
    return api_base_ + "/2010-04-01/Accounts/" + account_sid_ + "/Messages.json";
}

bool TwilioNotifier::send(const std::string &recipient, const std::string &message, Delivery &delivery)
{
    delivery = Delivery{};
    delivery.recipient = recipient;

    HttpRequest req;
    req.method = HttpMethod::Post;
    req.url = messages_url();
    req.headers.emplace_back("Content-Type", "application/x-www-form-urlencoded");
    req.headers.emplace_back("Accept", "application/json");
    req.username = account_sid_;
    req.password = auth_token_;
    req.timeout_ms = timeout_ms_;
    req.body = "To=" + form_encode(recipient) + "&From=" + form_encode(from_) + "&Body=" + form_encode(message);

    HttpResponse resp;
    std::string error;
    if (!http_.send(req, resp, error)) {
        delivery.error = error.empty() ? "transport error" : error;
        return false;
    }

    if (resp.status < 200 || resp.status >= 300) {
        delivery.error = describe_error(resp);
        return false;
    }

    cJSON *root = cJSON_ParseWithLength(resp.body.c_str(), resp.body.size());
    const cJSON *sid = root ? cJSON_GetObjectItemCaseSensitive(root, "sid") : nullptr;
    if (cJSON_IsString(sid) && sid->valuestring && sid->valuestring[0]) {
        delivery.message_id = sid->valuestring;
        delivery.ok = true;
    } else {
        delivery.error = "response without message sid";
    }
    cJSON_Delete(root);
    return delivery.ok;
}

} // namespace core
