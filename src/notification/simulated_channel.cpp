#include "simulated_channel.hpp"
#include "../utils/logger.hpp"

namespace webhunter {

namespace {

std::string one_line(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (c == '\n') {
            result += " | ";
        } else if (c != '\r') {
            result += c;
        }
    }
    return result;
}

} // namespace

SendResult SimulatedChannel::send(const PushMessage& message, const std::string& target) {
    sent_.fetch_add(1);
    LOG_INFO("sim-msg to '{}': t'{}' m'{}' u'{}'", target, message.title, one_line(message.body), message.url);
    return SendResult{SendOutcome::OK, 200, "simulated"};
}

} // namespace webhunter
