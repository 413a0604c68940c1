#include "rest_client.hpp"
#include "network_exception.hpp"
#include "../core/app_state.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <memory>
#include <mutex>
#include <curl/curl.h>

namespace webhunter {

namespace {

constexpr long kConnectTimeoutMs = 5000;
constexpr long kMaxRedirects = 5;

int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* app_state = static_cast<AppState*>(clientp);
    // Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
    return (app_state && !app_state->is_running()) ? 1 : 0;
}

struct CurlEasyDeleter {
    void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

} // namespace

RestClient::RestClient(AppState* app_state)
    : app_state_(app_state)
    , user_agent_("WebHunter/1.0")
    , default_timeout_ms_(10000) {
    GlobalInit();
}

void RestClient::GlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

void RestClient::SetUserAgent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

void RestClient::SetDefaultTimeout(long timeout_ms) {
    default_timeout_ms_ = timeout_ms;
}

HttpResponse RestClient::Get(const std::string& url,
                             const std::unordered_map<std::string, std::string>& headers) {
    HttpRequest request;
    request.url = url;
    request.headers = headers;
    request.timeout_ms = default_timeout_ms_;
    return Request(request);
}

HttpResponse RestClient::Post(const std::string& url,
                              const std::string& body,
                              const std::unordered_map<std::string, std::string>& headers) {
    HttpRequest request;
    request.url = url;
    request.method = "POST";
    request.body = body;
    request.headers = headers;
    request.timeout_ms = default_timeout_ms_;
    return Request(request);
}

void RestClient::ApplyOptions(void* raw, const HttpRequest& request, HttpResponse& response) const {
    CURL* handle = static_cast<CURL*>(raw);
    curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str());

    bool has_body = request.method == "POST" || !request.body.empty();
    if (request.method == "POST") {
        curl_easy_setopt(handle, CURLOPT_POST, 1L);
    } else if (request.method != "GET") {
        curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }
    if (has_body) {
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, RestClient::WriteCallback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(handle, CURLOPT_HEADERFUNCTION, RestClient::HeaderCallback);
    curl_easy_setopt(handle, CURLOPT_HEADERDATA, &response.headers);

    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, request.timeout_ms);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, kConnectTimeoutMs);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, request.follow_redirects ? 1L : 0L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, kMaxRedirects);

    // Lets shutdown interrupt a slow transfer
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, app_state_);
}

HttpResponse RestClient::Request(const HttpRequest& request) {
    if (app_state_ && !app_state_->is_running()) {
        throw CancelledException("Shutdown in progress, not sending " + request.method + " " + request.url);
    }

    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) {
        throw ConnectionException("Failed to initialize CURL handle");
    }

    HttpResponse response;
    ApplyOptions(curl.get(), request, response);

    std::unique_ptr<curl_slist, CurlSlistDeleter> header_list;
    for (const auto& header : request.headers) {
        std::string line = header.first + ": " + header.second;
        curl_slist* appended = curl_slist_append(header_list.get(), line.c_str());
        if (!appended) {
            throw ConnectionException("Failed to build request headers");
        }
        header_list.release();
        header_list.reset(appended);
    }
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }

    auto started = std::chrono::steady_clock::now();
    CURLcode code = curl_easy_perform(curl.get());
    response.response_time_ms = static_cast<long>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count());

    if (code != CURLE_OK) {
        std::string reason = curl_easy_strerror(code);
        LOG_DEBUG("{} {} failed after {} ms: {} (curl code {})", request.method, request.url,
                  response.response_time_ms, reason, static_cast<int>(code));
        switch (code) {
            case CURLE_ABORTED_BY_CALLBACK:
                throw CancelledException("Request cancelled: " + request.url);
            case CURLE_OPERATION_TIMEDOUT:
                throw TimeoutException("Request timed out: " + reason);
            default:
                throw ConnectionException("Request failed: " + reason);
        }
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    if (response.status_code >= 400) {
        LOG_WARNING("{} {} answered HTTP {}", request.method, request.url, response.status_code);
    }
    LOG_DEBUG("{} {} -> {} ({} bytes, {} ms)", request.method, request.url,
              response.status_code, response.body.size(), response.response_time_ms);
    return response;
}

size_t RestClient::WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total_size = size * nmemb;
    userp->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t RestClient::HeaderCallback(char* buffer, size_t size, size_t nitems,
                                  std::unordered_map<std::string, std::string>* headers) {
    size_t total_size = size * nitems;
    std::string header(buffer, total_size);

    auto colon = header.find(':');
    if (colon != std::string::npos) {
        std::string key = trim(header.substr(0, colon));
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        (*headers)[key] = trim(header.substr(colon + 1));
    }
    return total_size;
}

std::string RestClient::BuildPostData(const std::map<std::string, std::string>& data) {
    std::string post_data;
    bool first = true;

    for (const auto& pair : data) {
        if (!first) {
            post_data += "&";
        }
        post_data += UrlEncode(pair.first) + "=" + UrlEncode(pair.second);
        first = false;
    }

    return post_data;
}

std::string RestClient::UrlEncode(const std::string& value) {
    GlobalInit();
    std::unique_ptr<CURL, CurlEasyDeleter> curl(curl_easy_init());
    if (!curl) {
        throw ConnectionException("Failed to initialize CURL handle for URL encoding");
    }
    char* encoded = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.length()));
    if (!encoded) {
        throw ConnectionException("URL encoding failed");
    }
    std::string result(encoded);
    curl_free(encoded);
    return result;
}

} // namespace webhunter
