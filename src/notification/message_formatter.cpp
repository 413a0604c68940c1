#include "message_formatter.hpp"

namespace webhunter {

MessageFormatter::MessageFormatter(const MessagesConfig& config) : config_(config) {}

PushMessage MessageFormatter::render(const Listing& listing) const {
    PushMessage message;
    message.title = expand(config_.title, listing);
    message.body = expand(config_.body, listing);

    // Empty price lines leave a dangling newline behind
    while (!message.body.empty() && (message.body.back() == '\n' || message.body.back() == ' ')) {
        message.body.pop_back();
    }
    if (message.body.empty()) {
        message.body = listing.url.empty() ? listing.listing_id : listing.url;
    }

    message.url = listing.url;
    message.url_title = listing.title.empty() ? listing.url : listing.title;
    return message;
}

std::string MessageFormatter::expand(const std::string& pattern, const Listing& listing) {
    std::string result;
    result.reserve(pattern.size() + listing.title.size() + listing.url.size());

    size_t pos = 0;
    while (pos < pattern.size()) {
        size_t open = pattern.find('{', pos);
        if (open == std::string::npos) {
            result.append(pattern, pos, std::string::npos);
            break;
        }
        size_t close = pattern.find('}', open);
        if (close == std::string::npos) {
            result.append(pattern, pos, std::string::npos);
            break;
        }

        result.append(pattern, pos, open - pos);
        std::string name = pattern.substr(open + 1, close - open - 1);
        if (name == "source") {
            result += listing.source_id;
        } else if (name == "title") {
            result += listing.title;
        } else if (name == "price") {
            result += listing.price;
        } else if (name == "url") {
            result += listing.url;
        } else if (name == "id") {
            result += listing.listing_id;
        } else {
            result.append(pattern, open, close - open + 1);
        }
        pos = close + 1;
    }
    return result;
}

} // namespace webhunter
