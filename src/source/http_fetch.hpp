#pragma once

#include <string>
#include "../network/rest_client.hpp"
#include "../utils/config_types.hpp"

namespace webhunter {

// GETs params.url (with optional params.headers) and returns the body.
// Transport failures, 5xx, 408 and 429 throw a transient FetchError; other
// non-2xx statuses and missing parameters throw a permanent one.
std::string fetch_page(RestClient& client, const SourceConfig& config);

// Resolves a possibly relative link against params.url_prefix
std::string resolve_url(const std::string& url, const SourceConfig& config);

// Fallback identity for sites that expose no stable key
std::string make_content_id(const std::string& url, const std::string& title);

std::string get_string_param(const SourceConfig& config, const std::string& key, const std::string& fallback = "");
int get_int_param(const SourceConfig& config, const std::string& key, int fallback);

} // namespace webhunter
