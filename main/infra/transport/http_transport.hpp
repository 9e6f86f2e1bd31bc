#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "core/http_client.hpp"

namespace transport {

// core::IHttpClient over esp_http_client. One connection per request;
// cookies set by a response are replayed on later requests when enabled.
class EspHttpClient : public core::IHttpClient {
public:
    EspHttpClient(bool keep_cookies, std::size_t max_response_bytes);

    bool send(const core::HttpRequest& request, core::HttpResponse& response, std::string& error) override;

    void clear_cookies() { cookies_.clear(); }

private:
    void store_cookie(const char* set_cookie);
    std::string cookie_header() const;

    bool keep_cookies_;
    std::size_t max_response_bytes_;
    std::vector<std::pair<std::string, std::string>> cookies_;
};

} // namespace transport
