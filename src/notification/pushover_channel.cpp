#include "pushover_channel.hpp"
#include "../network/network_exception.hpp"
#include "../utils/logger.hpp"
#include <map>
#include <nlohmann/json.hpp>

namespace webhunter {

namespace {

// Cuts at a character boundary so multi-byte UTF-8 sequences stay intact
std::string truncate_utf8(const std::string& value, size_t max_bytes) {
    if (value.size() <= max_bytes) {
        return value;
    }
    size_t cut = max_bytes;
    while (cut > 0 && (static_cast<unsigned char>(value[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return value.substr(0, cut);
}

std::string describe_errors(const std::string& body) {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object() || !parsed.contains("errors")) {
        return body;
    }
    std::string joined;
    for (const auto& error : parsed["errors"]) {
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += error.is_string() ? error.get<std::string>() : error.dump();
    }
    return joined;
}

} // namespace

PushoverChannel::PushoverChannel(const NotifierConfig& config, const std::string& user_agent, AppState* app_state)
    : config_(config), client_(app_state) {
    client_.SetUserAgent(user_agent);
    client_.SetDefaultTimeout(config_.timeout_ms);
}

std::string PushoverChannel::build_request_body(const PushMessage& message, const std::string& target) const {
    std::map<std::string, std::string> fields;
    fields["token"] = config_.app_token;
    fields["user"] = target;
    fields["message"] = truncate_utf8(message.body.empty() ? message.title : message.body, kMaxMessageLength);
    if (!message.title.empty()) {
        fields["title"] = truncate_utf8(message.title, kMaxTitleLength);
    }
    if (!message.url.empty()) {
        fields["url"] = truncate_utf8(message.url, kMaxUrlLength);
        if (!message.url_title.empty()) {
            fields["url_title"] = truncate_utf8(message.url_title, 100);
        }
    }
    if (!config_.device.empty()) {
        fields["device"] = config_.device;
    }
    if (config_.priority != 0) {
        fields["priority"] = std::to_string(config_.priority);
    }
    return RestClient::BuildPostData(fields);
}

SendResult PushoverChannel::send(const PushMessage& message, const std::string& target) {
    if (target.empty()) {
        return SendResult{SendOutcome::REJECTED, 0, "no recipient configured"};
    }

    try {
        auto response = client_.Post(config_.endpoint, build_request_body(message, target),
                                     {{"Content-Type", "application/x-www-form-urlencoded"}});
        return classify_response(response.status_code, response.body);
    } catch (const CancelledException& e) {
        return SendResult{SendOutcome::CANCELLED, 0, e.what()};
    } catch (const NetworkException& e) {
        LOG_WARNING("Pushover request failed: {}", e.what());
        return SendResult{SendOutcome::TRANSIENT, 0, e.what()};
    }
}

SendResult PushoverChannel::classify_response(long status_code, const std::string& body) {
    if (status_code >= 200 && status_code < 300) {
        return SendResult{SendOutcome::OK, status_code, ""};
    }
    if (status_code == 408 || status_code == 429) {
        return SendResult{SendOutcome::TRANSIENT, status_code, "throttled: " + describe_errors(body)};
    }
    if (status_code >= 400 && status_code < 500) {
        return SendResult{SendOutcome::REJECTED, status_code, describe_errors(body)};
    }
    return SendResult{SendOutcome::TRANSIENT, status_code, "HTTP " + std::to_string(status_code)};
}

} // namespace webhunter
