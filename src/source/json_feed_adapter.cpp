#include "json_feed_adapter.hpp"
#include "http_fetch.hpp"
#include "../utils/logger.hpp"
#include <nlohmann/json.hpp>

namespace webhunter {

namespace {

const nlohmann::json* lookup(const nlohmann::json& item, const std::string& field) {
    if (field.empty()) {
        return nullptr;
    }
    if (field.front() == '/') {
        nlohmann::json::json_pointer pointer(field);
        if (!item.contains(pointer)) {
            return nullptr;
        }
        return &item.at(pointer);
    }
    if (!item.is_object() || !item.contains(field)) {
        return nullptr;
    }
    return &item.at(field);
}

std::string field_text(const nlohmann::json& item, const std::string& field) {
    const nlohmann::json* value = lookup(item, field);
    if (value == nullptr || value->is_null()) {
        return "";
    }
    if (value->is_string()) {
        return value->get<std::string>();
    }
    return value->dump();
}

} // namespace

JsonFeedAdapter::JsonFeedAdapter(AppState* app_state, const std::string& user_agent)
    : client_(app_state) {
    client_.SetUserAgent(user_agent);
}

std::vector<Listing> JsonFeedAdapter::fetch(const SourceConfig& config) {
    return parse(fetch_page(client_, config), config);
}

std::vector<Listing> JsonFeedAdapter::parse(const std::string& body, const SourceConfig& config) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(body);
    } catch (const nlohmann::json::parse_error& e) {
        throw FetchError(FetchError::Kind::PERMANENT, "invalid JSON from " + config.name + ": " + e.what());
    }

    const std::string items_path = get_string_param(config, "items_path");
    const nlohmann::json* items = &document;
    if (!items_path.empty()) {
        try {
            items = &document.at(nlohmann::json::json_pointer(items_path));
        } catch (const nlohmann::json::exception& e) {
            throw FetchError(FetchError::Kind::PERMANENT,
                             "items_path '" + items_path + "' not found in response: " + e.what());
        }
    }
    if (!items->is_array()) {
        throw FetchError(FetchError::Kind::PERMANENT, "items_path '" + items_path + "' is not an array");
    }

    const std::string id_field = get_string_param(config, "id_field", "id");
    const std::string url_field = get_string_param(config, "url_field", "url");
    const std::string title_field = get_string_param(config, "title_field", "title");
    const std::string price_field = get_string_param(config, "price_field", "price");
    const auto now = std::chrono::system_clock::now();

    std::vector<Listing> listings;
    listings.reserve(items->size());
    try {
        for (const auto& item : *items) {
            Listing listing;
            listing.source_id = config.name;
            listing.url = resolve_url(field_text(item, url_field), config);
            listing.title = field_text(item, title_field);
            listing.price = field_text(item, price_field);
            listing.listing_id = field_text(item, id_field);
            listing.observed_at = now;

            if (listing.listing_id.empty()) {
                if (listing.url.empty() && listing.title.empty()) {
                    LOG_DEBUG("Skipping item without id, url or title from {}", config.name);
                    continue;
                }
                listing.listing_id = make_content_id(listing.url, listing.title);
            }
            listings.push_back(std::move(listing));
        }
    } catch (const nlohmann::json::exception& e) {
        throw FetchError(FetchError::Kind::PERMANENT, "unexpected item shape from " + config.name + ": " + e.what());
    }

    return listings;
}

} // namespace webhunter
