#pragma once

#include <string>
#include "../core/types.hpp"

namespace webhunter {

struct PushMessage {
    std::string title;
    std::string body;
    std::string url;
    std::string url_title;
};

// One push provider. `send` performs exactly one request and classifies
// its outcome; retrying is the dispatcher's business.
class NotificationChannel {
public:
    virtual ~NotificationChannel() = default;

    virtual std::string get_name() const = 0;
    virtual SendResult send(const PushMessage& message, const std::string& target) = 0;
};

} // namespace webhunter
