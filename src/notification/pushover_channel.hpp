#pragma once

#include <string>
#include "notification_channel.hpp"
#include "../network/rest_client.hpp"
#include "../utils/config_types.hpp"

namespace webhunter {

class AppState;

// Pushover messages API: form-encoded POST carrying the application token,
// the recipient (user or group) key and the message.
class PushoverChannel : public NotificationChannel {
public:
    PushoverChannel(const NotifierConfig& config, const std::string& user_agent, AppState* app_state);

    std::string get_name() const override { return "pushover"; }
    SendResult send(const PushMessage& message, const std::string& target) override;

    std::string build_request_body(const PushMessage& message, const std::string& target) const;

    // 2xx ok; 408/429 and 5xx transient; any other 4xx rejected
    static SendResult classify_response(long status_code, const std::string& body);

private:
    static constexpr size_t kMaxTitleLength = 250;
    static constexpr size_t kMaxMessageLength = 1024;
    static constexpr size_t kMaxUrlLength = 512;

    NotifierConfig config_;
    RestClient client_;
};

} // namespace webhunter
