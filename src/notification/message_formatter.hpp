#pragma once

#include <string>
#include "notification_channel.hpp"
#include "../core/types.hpp"
#include "../utils/config_types.hpp"

namespace webhunter {

// Renders listings with the configured templates. Recognised placeholders:
// {source} {title} {price} {url} {id}. Unknown placeholders are kept verbatim.
class MessageFormatter {
public:
    explicit MessageFormatter(const MessagesConfig& config);

    PushMessage render(const Listing& listing) const;
    static std::string expand(const std::string& pattern, const Listing& listing);

private:
    MessagesConfig config_;
};

} // namespace webhunter
