#pragma once

#include <atomic>
#include "notification_channel.hpp"

namespace webhunter {

// Stand-in used when app.simulate is set: logs what would have been pushed
class SimulatedChannel : public NotificationChannel {
public:
    std::string get_name() const override { return "simulated"; }
    SendResult send(const PushMessage& message, const std::string& target) override;

    size_t sent_count() const { return sent_.load(); }

private:
    std::atomic<size_t> sent_{0};
};

} // namespace webhunter
