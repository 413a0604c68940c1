#include "notification_dispatcher.hpp"
#include "../utils/logger.hpp"

namespace webhunter {

NotificationDispatcher::NotificationDispatcher(NotificationChannel& channel,
                                               MessageFormatter formatter,
                                               std::string target,
                                               RetryPolicy policy,
                                               Sleeper sleeper)
    : channel_(channel)
    , formatter_(std::move(formatter))
    , target_(std::move(target))
    , policy_(policy)
    , sleeper_(std::move(sleeper)) {}

DeliveryOutcome NotificationDispatcher::deliver(const Listing& listing) {
    LOG_DEBUG("Dispatching {}/{} via {}", listing.source_id, listing.listing_id, channel_.get_name());
    return deliver_message(formatter_.render(listing));
}

DeliveryOutcome NotificationDispatcher::deliver_message(const PushMessage& message) {
    DeliveryOutcome outcome;
    outcome.status = DeliveryStatus::ABANDONED;

    auto result = retry(
        policy_, sleeper_,
        [this, &message, &outcome](int attempt) {
            SendResult sent = channel_.send(message, target_);
            outcome.attempts.push_back(
                NotificationAttempt{attempt, std::chrono::system_clock::now(), sent.outcome, sent.detail});
            if (sent.is_transient()) {
                LOG_WARNING("Delivery attempt {}/{} for '{}' failed transiently: {}",
                            attempt, policy_.max_attempts, message.title, sent.detail);
            }
            return sent;
        },
        [](const SendResult& sent) { return sent.is_transient(); });

    const SendResult& last = result.value;
    if (last.is_ok()) {
        outcome.status = DeliveryStatus::DELIVERED;
    } else if (last.is_cancelled()) {
        outcome.status = DeliveryStatus::CANCELLED;
        outcome.reason = "send interrupted by shutdown on attempt " + std::to_string(result.attempts);
    } else if (result.cancelled) {
        outcome.status = DeliveryStatus::CANCELLED;
        outcome.reason = "shutdown during backoff after attempt " + std::to_string(result.attempts);
    } else if (last.is_rejected()) {
        outcome.reason = "rejected: " + last.detail;
        LOG_ERROR("Notification '{}' rejected by {}, abandoning: {}", message.title, channel_.get_name(), last.detail);
    } else {
        outcome.reason = "gave up after " + std::to_string(result.attempts) + " attempts: " + last.detail;
        LOG_ERROR("Notification '{}' abandoned after {} attempts: {}", message.title, result.attempts, last.detail);
    }
    return outcome;
}

} // namespace webhunter
