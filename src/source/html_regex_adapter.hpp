#pragma once

#include <string>
#include <vector>
#include "source_adapter.hpp"
#include "../network/rest_client.hpp"

namespace webhunter {

class AppState;

// Result pages scraped with one Perl-syntax regular expression (Boost.Regex)
// that matches a single listing. Parameters:
//   url, headers, url_prefix   as for json_feed
//   pattern                    the expression
//   id_group, url_group, title_group, price_group
//                              capture group numbers, 0 when the site has none
class HtmlRegexAdapter : public SourceAdapter {
public:
    explicit HtmlRegexAdapter(AppState* app_state, const std::string& user_agent = "WebHunter/1.0");

    std::string get_kind() const override { return "html_regex"; }
    std::vector<Listing> fetch(const SourceConfig& config) override;

    static std::vector<Listing> parse(const std::string& body, const SourceConfig& config);
    static std::string decode_entities(const std::string& text);

private:
    RestClient client_;
};

} // namespace webhunter
