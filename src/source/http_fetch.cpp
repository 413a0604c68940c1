#include "http_fetch.hpp"
#include "../core/exceptions.hpp"
#include "../network/network_exception.hpp"
#include "../utils/crypto_utils.hpp"
#include <unordered_map>

namespace webhunter {

std::string get_string_param(const SourceConfig& config, const std::string& key, const std::string& fallback) {
    if (!config.params.is_object() || !config.params.contains(key)) {
        return fallback;
    }
    const auto& value = config.params.at(key);
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return fallback;
    }
    return value.dump();
}

int get_int_param(const SourceConfig& config, const std::string& key, int fallback) {
    if (!config.params.is_object() || !config.params.contains(key)) {
        return fallback;
    }
    const auto& value = config.params.at(key);
    if (value.is_number_integer()) {
        return value.get<int>();
    }
    throw FetchError(FetchError::Kind::PERMANENT, "params." + key + " must be an integer");
}

std::string fetch_page(RestClient& client, const SourceConfig& config) {
    const std::string url = get_string_param(config, "url");
    if (url.empty()) {
        throw FetchError(FetchError::Kind::PERMANENT, "source '" + config.name + "' has no params.url");
    }

    std::unordered_map<std::string, std::string> headers;
    if (config.params.is_object() && config.params.contains("headers") && config.params["headers"].is_object()) {
        for (const auto& [name, value] : config.params["headers"].items()) {
            headers[name] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }

    HttpResponse response;
    try {
        response = client.Get(url, headers);
    } catch (const NetworkException& e) {
        throw FetchError(FetchError::Kind::TRANSIENT, e.what());
    }

    if (response.IsSuccess()) {
        return response.body;
    }

    const std::string message = "GET " + url + " returned HTTP " + std::to_string(response.status_code);
    if (response.IsServerError() || response.status_code == 408 || response.status_code == 429) {
        throw FetchError(FetchError::Kind::TRANSIENT, message);
    }
    throw FetchError(FetchError::Kind::PERMANENT, message);
}

std::string resolve_url(const std::string& url, const SourceConfig& config) {
    if (url.empty() || url.rfind("http://", 0) == 0 || url.rfind("https://", 0) == 0) {
        return url;
    }
    std::string prefix = get_string_param(config, "url_prefix");
    if (prefix.empty()) {
        return url;
    }
    if (prefix.back() == '/' && url.front() == '/') {
        prefix.pop_back();
    } else if (prefix.back() != '/' && url.front() != '/') {
        prefix.push_back('/');
    }
    return prefix + url;
}

std::string make_content_id(const std::string& url, const std::string& title) {
    return CryptoUtils::sha256(url + "\n" + title);
}

} // namespace webhunter
