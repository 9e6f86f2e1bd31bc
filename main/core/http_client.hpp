#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace core {

enum class HttpMethod { Get, Post };

struct HttpRequest {
    HttpMethod method = HttpMethod::Get;
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    // HTTP basic auth, sent only when username is non-empty.
    std::string username;
    std::string password;
    std::uint32_t timeout_ms = 15000;
};

struct HttpResponse {
    int status = 0;
    std::string body;
};

// Blocking HTTP seam. Returns false only when no HTTP status was obtained
// (connect/TLS/timeout/I/O failure); `error` then describes the failure.
class IHttpClient {
public:
    virtual ~IHttpClient() = default;
    virtual bool send(const HttpRequest &request, HttpResponse &response, std::string &error) = 0;
};

using SleepFn = void (*)(std::uint32_t ms);

struct RetryPolicy {
    int max_retries = 3;
    std::uint32_t backoff_factor_ms = 5000;
    std::uint32_t backoff_max_ms = 120000;
    std::vector<int> status_forcelist{500, 502, 503, 504};

    bool should_retry_status(int status) const;

    // Delay before the n-th retry (1-based): none for the first retry,
    // then factor * 2^(n-1), capped at backoff_max_ms.
    std::uint32_t backoff_ms(int retry) const;
};

struct RetryOutcome {
    bool ok = false;  // a response was obtained (any status)
    int attempts = 0; // total requests issued
    std::string error;
};

// Sends `request`, retrying transport failures and listed statuses until the
// policy is exhausted. The last response (or transport error) is surfaced.
RetryOutcome send_with_retry(IHttpClient &client,
                             const HttpRequest &request,
                             HttpResponse &response,
                             const RetryPolicy &policy,
                             SleepFn sleep);

const char *method_name(HttpMethod method);

} // namespace core
