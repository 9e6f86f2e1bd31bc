#include "core/settings.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <vector>

#include "core/time_util.hpp"

namespace core {

namespace {

enum class Section {
    None,
    Outlook,
    Twilio,
    Recipients,
    Watcher,
    Unknown,
};

inline std::string trim(const std::string &s)
{
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos)
        return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

inline std::string unquote(const std::string &s)
{
    if (s.size() >= 2) {
        char first = s.front();
        char last = s.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

// '#' starts a comment at line start or after whitespace, outside quotes.
std::string strip_comment(const std::string &line)
{
    char quote = 0;
    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quote) {
            if (c == quote)
                quote = 0;
        } else if (c == '"' || c == '\'') {
            quote = c;
        } else if (c == '#' && (i == 0 || line[i - 1] == ' ' || line[i - 1] == '\t')) {
            return line.substr(0, i);
        }
    }
    return line;
}

bool parse_flow_list(const std::string &value, std::vector<std::string> &out)
{
    if (value.size() < 2 || value.front() != '[' || value.back() != ']')
        return false;
    out.clear();
    std::string inner = value.substr(1, value.size() - 2);
    size_t start = 0;
    while (start <= inner.size()) {
        size_t comma = inner.find(',', start);
        if (comma == std::string::npos)
            comma = inner.size();
        std::string item = unquote(trim(inner.substr(start, comma - start)));
        if (!item.empty())
            out.push_back(item);
        start = comma + 1;
    }
    return true;
}

bool parse_uint(const std::string &value, std::uint32_t &out)
{
    if (value.empty())
        return false;
    char *endp = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(value.c_str(), &endp, 10);
    if (endp == value.c_str() || *endp != '\0' || value[0] == '-')
        return false;
    if (errno == ERANGE || v > std::numeric_limits<std::uint32_t>::max())
        return false;
    out = static_cast<std::uint32_t>(v);
    return true;
}

bool parse_bool(const std::string &value, bool &out)
{
    if (value == "true" || value == "True" || value == "yes" || value == "on" || value == "1") {
        out = true;
        return true;
    }
    if (value == "false" || value == "False" || value == "no" || value == "off" || value == "0") {
        out = false;
        return true;
    }
    return false;
}

std::string *outlook_field(PollConfig &cfg, const std::string &key)
{
    if (key == "host")
        return &cfg.provider_host;
    if (key == "email")
        return &cfg.mailbox;
    if (key == "get_token")
        return &cfg.page_token;
    if (key == "service_id")
        return &cfg.service_id;
    if (key == "request_timezone")
        return &cfg.request_time_zone;
    return nullptr;
}

std::string *twilio_field(PollConfig &cfg, const std::string &key)
{
    if (key == "account_sid")
        return &cfg.twilio_account_sid;
    if (key == "auth_token")
        return &cfg.twilio_auth_token;
    if (key == "phone_number")
        return &cfg.twilio_from_number;
    if (key == "api_base")
        return &cfg.twilio_api_base;
    return nullptr;
}

bool set_watcher_field(PollConfig &cfg, const std::string &key, const std::string &value, std::string &error)
{
    if (key == "polling_interval") {
        if (!parse_uint(value, cfg.polling_interval_s)) {
            error = "watcher.polling_interval must be a non-negative integer";
            return false;
        }
    } else if (key == "http_timeout_ms") {
        if (!parse_uint(value, cfg.http_timeout_ms)) {
            error = "watcher.http_timeout_ms must be a non-negative integer";
            return false;
        }
    } else if (key == "send_notification") {
        if (!parse_bool(value, cfg.send_test_notification)) {
            error = "watcher.send_notification must be true or false";
            return false;
        }
    }
    return true;
}

} // namespace

bool parse_settings(const char *text, std::size_t len, PollConfig &cfg, std::string &error)
{
    if (!text) {
        error = "no settings text";
        return false;
    }

    Section section = Section::None;
    std::vector<std::string> *list = nullptr;
    int line_no = 0;

    size_t pos = 0;
    while (pos < len) {
        size_t line_end = pos;
        while (line_end < len && text[line_end] != '\n' && text[line_end] != '\r') {
            ++line_end;
        }
        std::string raw(text + pos, line_end - pos);
        pos = line_end;
        if (pos < len && text[pos] == '\r')
            ++pos;
        if (pos < len && text[pos] == '\n')
            ++pos;
        ++line_no;

        std::string line = strip_comment(raw);
        size_t indent = line.find_first_not_of(" \t");
        line = trim(line);
        if (line.empty()) {
            continue;
        }

        if (line.rfind("- ", 0) == 0 || line == "-") {
            std::string item = line.size() > 1 ? unquote(trim(line.substr(2))) : "";
            if (list && !item.empty()) {
                list->push_back(item);
            }
            continue;
        }

        size_t colon = line.find(':');
        if (colon == std::string::npos) {
            error = "line " + std::to_string(line_no) + ": expected 'key: value'";
            return false;
        }

        std::string key = trim(line.substr(0, colon));
        std::string value = unquote(trim(line.substr(colon + 1)));

        if (indent == 0) {
            list = nullptr;
            if (value.empty()) {
                if (key == "outlook") {
                    section = Section::Outlook;
                } else if (key == "twilio") {
                    section = Section::Twilio;
                } else if (key == "watcher") {
                    section = Section::Watcher;
                } else if (key == "recipients") {
                    section = Section::Recipients;
                    cfg.recipients.clear();
                    list = &cfg.recipients;
                } else {
                    section = Section::Unknown;
                }
                continue;
            }

            section = Section::None;
            if (key == "timezone") {
                cfg.display_time_zone = value;
            } else if (key == "recipients") {
                if (!parse_flow_list(value, cfg.recipients)) {
                    cfg.recipients.assign(1, value);
                }
            }
            continue;
        }

        switch (section) {
        case Section::Outlook:
            if (key == "staff_ids") {
                cfg.staff_ids.clear();
                if (value.empty()) {
                    list = &cfg.staff_ids;
                } else if (!parse_flow_list(value, cfg.staff_ids)) {
                    cfg.staff_ids.assign(1, value);
                }
            } else if (std::string *field = outlook_field(cfg, key)) {
                *field = value;
                list = nullptr;
            }
            break;
        case Section::Twilio:
            if (std::string *field = twilio_field(cfg, key)) {
                *field = value;
            }
            break;
        case Section::Watcher:
            if (!set_watcher_field(cfg, key, value, error)) {
                error = "line " + std::to_string(line_no) + ": " + error;
                return false;
            }
            break;
        default:
            // keys outside a known section are ignored
            break;
        }
    }

    return true;
}

bool validate_settings(const PollConfig &cfg, std::string &error)
{
    struct Required {
        const std::string *value;
        const char *name;
    };
    const Required required[] = {
        {&cfg.provider_host, "outlook.host"},
        {&cfg.mailbox, "outlook.email"},
        {&cfg.page_token, "outlook.get_token"},
        {&cfg.service_id, "outlook.service_id"},
        {&cfg.twilio_account_sid, "twilio.account_sid"},
        {&cfg.twilio_auth_token, "twilio.auth_token"},
        {&cfg.twilio_from_number, "twilio.phone_number"},
        {&cfg.display_time_zone, "timezone"},
    };
    for (const auto &r : required) {
        if (r.value->empty()) {
            error = std::string("missing ") + r.name;
            return false;
        }
    }
    std::string posix;
    if (!core::resolve_time_zone(cfg.display_time_zone, posix)) {
        error = "timezone '" + cfg.display_time_zone + "' is not a known zone name or POSIX TZ rule";
        return false;
    }
    if (cfg.staff_ids.empty()) {
        error = "outlook.staff_ids is empty";
        return false;
    }
    if (cfg.polling_interval_s == 0 || cfg.polling_interval_s > 24u * 60u * 60u) {
        error = "watcher.polling_interval must be between 1 and 86400 seconds";
        return false;
    }
    if (cfg.http_timeout_ms == 0) {
        error = "watcher.http_timeout_ms must be positive";
        return false;
    }
    return true;
}

} // namespace core
