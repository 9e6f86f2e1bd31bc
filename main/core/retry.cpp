#include "core/http_client.hpp"

#include <algorithm>

namespace core {

bool RetryPolicy::should_retry_status(int status) const
{
    return std::find(status_forcelist.begin(), status_forcelist.end(), status) != status_forcelist.end();
}

std::uint32_t RetryPolicy::backoff_ms(int retry) const
{
    if (retry <= 1)
        return 0;
    std::uint64_t delay = backoff_factor_ms;
    for (int i = 1; i < retry && delay < backoff_max_ms; ++i)
        delay *= 2;
    return static_cast<std::uint32_t>(std::min<std::uint64_t>(delay, backoff_max_ms));
}

RetryOutcome send_with_retry(IHttpClient &client,
                             const HttpRequest &request,
                             HttpResponse &response,
                             const RetryPolicy &policy,
                             SleepFn sleep)
{
    RetryOutcome outcome;
    for (int retry = 0;; ++retry) {
        if (retry > 0) {
            std::uint32_t delay = policy.backoff_ms(retry);
            if (delay > 0 && sleep)
                sleep(delay);
        }

        response = HttpResponse{};
        std::string error;
        ++outcome.attempts;
        const bool got_response = client.send(request, response, error);

        const bool retryable = got_response ? policy.should_retry_status(response.status) : true;
        if (!retryable || retry >= policy.max_retries) {
            outcome.ok = got_response;
            outcome.error = got_response ? std::string() : error;
            return outcome;
        }
    }
}

const char *method_name(HttpMethod method)
{
    switch (method) {
    case HttpMethod::Get:
        return "GET";
    case HttpMethod::Post:
        return "POST";
    }
    return "?";
}

} // namespace core
