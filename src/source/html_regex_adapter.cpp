#include "html_regex_adapter.hpp"
#include "http_fetch.hpp"
#include <boost/regex.hpp>

namespace webhunter {

namespace {

struct Entity {
    const char* name;
    const char* text;
};

const Entity kEntities[] = {
    {"&amp;", "&"},
    {"&lt;", "<"},
    {"&gt;", ">"},
    {"&quot;", "\""},
    {"&#39;", "'"},
    {"&apos;", "'"},
    {"&nbsp;", " "},
    {"&euro;", "\xE2\x82\xAC"},
};

std::string collapse_whitespace(const std::string& text) {
    std::string result;
    bool in_space = false;
    for (char c : text) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            in_space = true;
            continue;
        }
        if (in_space && !result.empty()) {
            result += ' ';
        }
        in_space = false;
        result += c;
    }
    return result;
}

std::string group_text(const boost::smatch& match, int group) {
    if (group <= 0 || static_cast<size_t>(group) >= match.size() || !match[group].matched) {
        return "";
    }
    return collapse_whitespace(HtmlRegexAdapter::decode_entities(match[group].str()));
}

} // namespace

HtmlRegexAdapter::HtmlRegexAdapter(AppState* app_state, const std::string& user_agent)
    : client_(app_state) {
    client_.SetUserAgent(user_agent);
}

std::vector<Listing> HtmlRegexAdapter::fetch(const SourceConfig& config) {
    return parse(fetch_page(client_, config), config);
}

std::vector<Listing> HtmlRegexAdapter::parse(const std::string& body, const SourceConfig& config) {
    const std::string pattern = get_string_param(config, "pattern");
    if (pattern.empty()) {
        throw FetchError(FetchError::Kind::PERMANENT, "source '" + config.name + "' has no params.pattern");
    }

    boost::regex expression;
    try {
        expression = boost::regex(pattern, boost::regex::perl | boost::regex::icase);
    } catch (const boost::regex_error& e) {
        throw FetchError(FetchError::Kind::PERMANENT, "invalid pattern for " + config.name + ": " + e.what());
    }

    const int id_group = get_int_param(config, "id_group", 0);
    const int url_group = get_int_param(config, "url_group", 0);
    const int title_group = get_int_param(config, "title_group", 0);
    const int price_group = get_int_param(config, "price_group", 0);
    const auto now = std::chrono::system_clock::now();

    std::vector<Listing> listings;
    try {
        // '.' stops at line ends; [\s\S] spans them
        boost::sregex_iterator it(body.begin(), body.end(), expression, boost::match_not_dot_newline);
        for (; it != boost::sregex_iterator(); ++it) {
            const boost::smatch& match = *it;
            Listing listing;
            listing.source_id = config.name;
            listing.url = resolve_url(group_text(match, url_group), config);
            listing.title = group_text(match, title_group);
            listing.price = group_text(match, price_group);
            listing.listing_id = group_text(match, id_group);
            listing.observed_at = now;

            if (listing.listing_id.empty()) {
                if (listing.url.empty() && listing.title.empty()) {
                    continue;
                }
                listing.listing_id = make_content_id(listing.url, listing.title);
            }
            listings.push_back(std::move(listing));
        }
    } catch (const boost::regex_error& e) {
        // Matching is iterative; runaway backtracking ends here instead of the stack
        throw FetchError(FetchError::Kind::PERMANENT, "pattern failed on page from " + config.name + ": " + e.what());
    }

    return listings;
}

std::string HtmlRegexAdapter::decode_entities(const std::string& text) {
    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] != '&') {
            result += text[pos++];
            continue;
        }
        bool replaced = false;
        for (const auto& entity : kEntities) {
            size_t length = std::char_traits<char>::length(entity.name);
            if (text.compare(pos, length, entity.name) == 0) {
                result += entity.text;
                pos += length;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            result += text[pos++];
        }
    }
    return result;
}

} // namespace webhunter
