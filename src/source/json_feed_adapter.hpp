#pragma once

#include <string>
#include <vector>
#include "source_adapter.hpp"
#include "../network/rest_client.hpp"

namespace webhunter {

class AppState;

// Sites with a JSON search API. Parameters:
//   url          endpoint to GET
//   items_path   JSON pointer to the result array (default: document root)
//   id_field, url_field, title_field, price_field
//                member name or JSON pointer inside one item
//   url_prefix   prepended to relative item URLs
//   headers      extra request headers
class JsonFeedAdapter : public SourceAdapter {
public:
    explicit JsonFeedAdapter(AppState* app_state, const std::string& user_agent = "WebHunter/1.0");

    std::string get_kind() const override { return "json_feed"; }
    std::vector<Listing> fetch(const SourceConfig& config) override;

    static std::vector<Listing> parse(const std::string& body, const SourceConfig& config);

private:
    RestClient client_;
};

} // namespace webhunter
