#pragma once

#include <string>

namespace core {

struct Delivery {
    std::string recipient;
    bool ok = false;
    std::string message_id; // provider id on success
    std::string error;      // reason on failure
};

// "Send a text message to a recipient". Failures are reported, never thrown.
class INotifier {
public:
    virtual ~INotifier() = default;
    virtual bool send(const std::string &recipient, const std::string &message, Delivery &delivery) = 0;
};

} // namespace core
