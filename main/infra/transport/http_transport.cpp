#include "infra/transport/http_transport.hpp"

#include <cstdio>
#include <cstring>
#include <strings.h>

#include "esp_http_client.h"
#if CONFIG_MBEDTLS_CERTIFICATE_BUNDLE
#include "esp_crt_bundle.h"
#endif
#include "esp_log.h"
#include "esp_timer.h"

#include "infra/transport/wifi_manager.h"

namespace transport {

namespace {

const char* TAG = "http";

constexpr int kMaxRedirects = 5;
constexpr int kReadChunk = 1024;

bool is_https_url(const std::string& url)
{
    return strncasecmp(url.c_str(), "https://", 8) == 0;
}

bool is_redirect(int status)
{
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

struct EventContext {
    EspHttpClient* owner;
    void (*on_cookie)(EspHttpClient*, const char*);
};

esp_err_t on_http_event(esp_http_client_event_t* evt)
{
    if (evt->event_id != HTTP_EVENT_ON_HEADER || !evt->user_data) {
        return ESP_OK;
    }
    if (evt->header_key && evt->header_value && strcasecmp(evt->header_key, "Set-Cookie") == 0) {
        auto* ctx = static_cast<EventContext*>(evt->user_data);
        ctx->on_cookie(ctx->owner, evt->header_value);
    }
    return ESP_OK;
}

std::string error_text(const char* what, esp_err_t err)
{
    char buf[96];
    std::snprintf(buf, sizeof(buf), "%s: %s", what, esp_err_to_name(err));
    return buf;
}

} // namespace

EspHttpClient::EspHttpClient(bool keep_cookies, std::size_t max_response_bytes)
    : keep_cookies_(keep_cookies), max_response_bytes_(max_response_bytes)
{
}

void EspHttpClient::store_cookie(const char* set_cookie)
{
    // "name=value; Path=/; Secure" -> name, value
    std::string pair(set_cookie);
    size_t semi = pair.find(';');
    if (semi != std::string::npos) {
        pair.resize(semi);
    }
    size_t eq = pair.find('=');
    if (eq == std::string::npos || eq == 0) {
        return;
    }
    std::string name = pair.substr(0, eq);
    std::string value = pair.substr(eq + 1);
    for (auto& c : cookies_) {
        if (c.first == name) {
            c.second = value;
            return;
        }
    }
    cookies_.emplace_back(std::move(name), std::move(value));
}

std::string EspHttpClient::cookie_header() const
{
    std::string out;
    for (const auto& c : cookies_) {
        if (!out.empty()) {
            out += "; ";
        }
        out += c.first;
        out += '=';
        out += c.second;
    }
    return out;
}

bool EspHttpClient::send(const core::HttpRequest& request, core::HttpResponse& response, std::string& error)
{
    response = core::HttpResponse{};
    if (!wifi_manager_is_connected()) {
        error = "wifi not connected";
        return false;
    }

    EventContext ctx{this, [](EspHttpClient* self, const char* v) { self->store_cookie(v); }};

    esp_http_client_config_t cfg;
    std::memset(&cfg, 0, sizeof(cfg));
    cfg.url = request.url.c_str();
    cfg.timeout_ms = static_cast<int>(request.timeout_ms);
    cfg.disable_auto_redirect = true;
    cfg.buffer_size = 2048;
    cfg.buffer_size_tx = 2048;
    cfg.event_handler = on_http_event;
    cfg.user_data = keep_cookies_ ? &ctx : nullptr;
    if (!request.username.empty()) {
        cfg.username = request.username.c_str();
        cfg.password = request.password.c_str();
        cfg.auth_type = HTTP_AUTH_TYPE_BASIC;
    }
    if (is_https_url(request.url)) {
#if CONFIG_MBEDTLS_CERTIFICATE_BUNDLE
        cfg.crt_bundle_attach = esp_crt_bundle_attach;
#else
        ESP_LOGW(TAG, "HTTPS without certificate bundle; enable CONFIG_MBEDTLS_CERTIFICATE_BUNDLE");
#endif
    }

    esp_http_client_handle_t client = esp_http_client_init(&cfg);
    if (!client) {
        error = "esp_http_client_init failed";
        return false;
    }

    esp_http_client_set_method(client,
                               request.method == core::HttpMethod::Post ? HTTP_METHOD_POST : HTTP_METHOD_GET);
    for (const auto& h : request.headers) {
        esp_http_client_set_header(client, h.first.c_str(), h.second.c_str());
    }
    esp_http_client_set_header(client, "Accept-Encoding", "identity");

    const int64_t t0_us = esp_timer_get_time();
    int status = 0;
    bool ok = true;
    bool send_body = !request.body.empty();
    for (int redirects = 0;; ++redirects) {
        if (keep_cookies_ && !cookies_.empty()) {
            esp_http_client_set_header(client, "Cookie", cookie_header().c_str());
        }

        const int body_len = send_body ? static_cast<int>(request.body.size()) : 0;
        esp_err_t err = esp_http_client_open(client, body_len);
        if (err != ESP_OK) {
            error = error_text("open", err);
            ok = false;
            break;
        }
        if (body_len > 0) {
            int written = esp_http_client_write(client, request.body.data(), body_len);
            if (written != body_len) {
                error = "short write";
                ok = false;
                break;
            }
        }

        if (esp_http_client_fetch_headers(client) < 0) {
            error = "failed to read response headers";
            ok = false;
            break;
        }
        status = esp_http_client_get_status_code(client);
        if (!is_redirect(status) || redirects >= kMaxRedirects) {
            break;
        }

        ESP_LOGD(TAG, "%s %s -> %d, following redirect", core::method_name(request.method), request.url.c_str(), status);
        esp_http_client_flush_response(client, nullptr);
        err = esp_http_client_set_redirection(client);
        if (err != ESP_OK) {
            break;
        }
        esp_http_client_close(client);
        if (status == 303) {
            esp_http_client_set_method(client, HTTP_METHOD_GET);
            send_body = false;
        }
    }

    if (ok) {
        char chunk[kReadChunk];
        for (;;) {
            int r = esp_http_client_read(client, chunk, sizeof(chunk));
            if (r < 0) {
                error = "read failed";
                ok = false;
                break;
            }
            if (r == 0) {
                break;
            }
            if (response.body.size() + static_cast<size_t>(r) > max_response_bytes_) {
                error = "response exceeds " + std::to_string(max_response_bytes_) + " bytes";
                ok = false;
                break;
            }
            response.body.append(chunk, static_cast<size_t>(r));
        }
    }

    if (ok) {
        response.status = status;
        ESP_LOGI(TAG, "%s %s -> %d (%u bytes, %lld ms)",
                 core::method_name(request.method),
                 request.url.c_str(),
                 status,
                 static_cast<unsigned>(response.body.size()),
                 static_cast<long long>((esp_timer_get_time() - t0_us) / 1000));
    } else {
        ESP_LOGW(TAG, "%s %s failed: %s", core::method_name(request.method), request.url.c_str(), error.c_str());
    }

    esp_http_client_close(client);
    esp_http_client_cleanup(client);
    return ok;
}

} // namespace transport
