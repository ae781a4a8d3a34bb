#pragma once

#include "network/IHttpClient.h"
#include "network/RateLimiter.h"
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace marketpipe {
namespace network {

// libcurl 기반 IHttpClient. 요청은 mutex 로 직렬화, 호스트별 rate limit 적용
class CurlHttpClient : public IHttpClient {
public:
    explicit CurlHttpClient(long timeout_seconds = 30,
                            std::shared_ptr<RateLimiter> rate_limiter = nullptr);
    ~CurlHttpClient();

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(
        const std::string& url,
        const std::map<std::string, std::string>& query_params = {},
        const std::map<std::string, std::string>& headers = {}
    ) override;

    // "https://host:port/path" -> "host"
    static std::string hostOf(const std::string& url);

private:
    HttpResponse performRequest(
        const std::string& url,
        const std::map<std::string, std::string>& headers
    );

    static size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp);
    static size_t headerCallback(char* buffer, size_t size, size_t nitems, void* userdata);

    std::string buildQueryString(const std::map<std::string, std::string>& params);

    long timeout_seconds_;
    CURL* curl_;
    std::mutex mutex_;
    std::shared_ptr<RateLimiter> rate_limiter_;
};

} // namespace network
} // namespace marketpipe
