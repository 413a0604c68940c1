#pragma once

#include <map>
#include <string>
#include <unordered_map>

namespace webhunter {

class AppState;

struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::unordered_map<std::string, std::string> headers;
    long response_time_ms = 0;

    bool IsSuccess() const { return status_code >= 200 && status_code < 300; }
    bool IsServerError() const { return status_code >= 500; }
};

struct HttpRequest {
    std::string url;
    std::string method = "GET";
    std::unordered_map<std::string, std::string> headers;
    std::string body;
    long timeout_ms = 10000;
    bool follow_redirects = true;
};

// Blocking libcurl client. Transport failures are thrown as
// NetworkException subclasses; HTTP error statuses are returned.
// A transfer in progress is aborted once `app_state` reports shutdown.
class RestClient {
public:
    explicit RestClient(AppState* app_state = nullptr);
    ~RestClient() = default;

    RestClient(const RestClient&) = delete;
    RestClient& operator=(const RestClient&) = delete;

    void SetUserAgent(const std::string& user_agent);
    void SetDefaultTimeout(long timeout_ms);

    HttpResponse Get(const std::string& url,
                     const std::unordered_map<std::string, std::string>& headers = {});

    HttpResponse Post(const std::string& url,
                      const std::string& body,
                      const std::unordered_map<std::string, std::string>& headers = {});

    HttpResponse Request(const HttpRequest& request);

    static std::string BuildPostData(const std::map<std::string, std::string>& data);
    static std::string UrlEncode(const std::string& value);

private:
    static void GlobalInit();
    static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp);
    static size_t HeaderCallback(char* buffer, size_t size, size_t nitems,
                                 std::unordered_map<std::string, std::string>* headers);
    void ApplyOptions(void* handle, const HttpRequest& request, HttpResponse& response) const;

    AppState* app_state_;
    std::string user_agent_;
    long default_timeout_ms_;
};

} // namespace webhunter
