#pragma once

#include <string>
#include <map>
#include <chrono>
#include <mutex>
#include <condition_variable>

namespace marketpipe {
namespace network {

// 호스트별 1초 윈도우
struct RateLimitWindow {
    std::string host;
    int max_per_second;
    int current_count;
    std::chrono::steady_clock::time_point window_start;

    RateLimitWindow(const std::string& name, int max_req)
        : host(name)
        , max_per_second(max_req)
        , current_count(0)
        , window_start(std::chrono::steady_clock::now())
    {}
};

// Rate Limiter - 프로바이더 호스트별 초당 요청 수 제한 (Thread-Safe)
class RateLimiter {
public:
    explicit RateLimiter(int requests_per_second = 2);

    // 가능하면 true, 대기 필요하면 false (Non-blocking)
    bool tryAcquire(const std::string& host);

    // 필요시 다음 윈도우까지 대기 (Blocking)
    void acquire(const std::string& host);

    int getRemainingRequests(const std::string& host);

    // 429 응답 시 해당 호스트 전체 일시정지
    void handleRateLimitError(const std::string& host, int status_code);

    struct Stats {
        int total_requests;
        int rejected_requests;
        int forced_waits;
        std::chrono::milliseconds total_wait_time;
    };
    Stats getStats() const;

private:
    RateLimitWindow& windowFor(const std::string& host);
    void resetWindowIfNeeded(RateLimitWindow& window);

    int requests_per_second_;
    std::map<std::string, RateLimitWindow> windows_;
    std::map<std::string, std::chrono::steady_clock::time_point> blocked_until_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    int total_requests_;
    int rejected_requests_;
    int forced_waits_;
    std::chrono::milliseconds total_wait_time_;
};

} // namespace network
} // namespace marketpipe
