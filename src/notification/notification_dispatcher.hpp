#pragma once

#include <string>
#include "message_formatter.hpp"
#include "notification_channel.hpp"
#include "../core/retry_policy.hpp"
#include "../core/types.hpp"

namespace webhunter {

// Delivers one listing through the channel with bounded exponential backoff.
// A rejected request is abandoned after its first attempt; transient failures
// are retried until policy.max_attempts. A send cut short by shutdown ends
// the delivery as cancelled on any attempt, never as abandoned. Holds no per-listing state, so
// concurrent deliver() calls are independent.
class NotificationDispatcher {
public:
    NotificationDispatcher(NotificationChannel& channel,
                           MessageFormatter formatter,
                           std::string target,
                           RetryPolicy policy,
                           Sleeper sleeper);
    virtual ~NotificationDispatcher() = default;

    virtual DeliveryOutcome deliver(const Listing& listing);

    // Service messages (startup/shutdown) go through the same policy
    DeliveryOutcome deliver_message(const PushMessage& message);

    const RetryPolicy& policy() const { return policy_; }

private:
    NotificationChannel& channel_;
    MessageFormatter formatter_;
    std::string target_;
    RetryPolicy policy_;
    Sleeper sleeper_;
};

} // namespace webhunter
