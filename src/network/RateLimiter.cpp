#include "network/RateLimiter.h"
#include "common/Logger.h"
#include <algorithm>

namespace marketpipe {
namespace network {

namespace {
// 429 수신 후 해당 호스트 정지 시간
constexpr auto kBackoffOn429 = std::chrono::seconds(2);
}

RateLimiter::RateLimiter(int requests_per_second)
    : requests_per_second_(std::max(1, requests_per_second))
    , total_requests_(0)
    , rejected_requests_(0)
    , forced_waits_(0)
    , total_wait_time_(std::chrono::milliseconds(0))
{
    LOG_DEBUG("RateLimiter 초기화 - 호스트당 초당 {}회", requests_per_second_);
}

RateLimitWindow& RateLimiter::windowFor(const std::string& host) {
    auto it = windows_.find(host);
    if (it == windows_.end()) {
        it = windows_.emplace(host, RateLimitWindow(host, requests_per_second_)).first;
    }
    return it->second;
}

bool RateLimiter::tryAcquire(const std::string& host) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto blocked = blocked_until_.find(host);
    if (blocked != blocked_until_.end()) {
        if (std::chrono::steady_clock::now() < blocked->second) {
            rejected_requests_++;
            return false;
        }
        blocked_until_.erase(blocked);
    }

    auto& window = windowFor(host);
    resetWindowIfNeeded(window);

    if (window.current_count < window.max_per_second) {
        window.current_count++;
        total_requests_++;
        return true;
    }

    rejected_requests_++;
    return false;
}

void RateLimiter::acquire(const std::string& host) {
    std::unique_lock<std::mutex> lock(mutex_);

    while (true) {
        // 1. 429 차단 중이면 해제 시각까지 대기
        auto blocked = blocked_until_.find(host);
        if (blocked != blocked_until_.end()) {
            const auto until = blocked->second;
            if (std::chrono::steady_clock::now() < until) {
                forced_waits_++;
                auto wait_start = std::chrono::steady_clock::now();
                cv_.wait_until(lock, until);
                total_wait_time_ += std::chrono::duration_cast<std::chrono::milliseconds>(
                    std::chrono::steady_clock::now() - wait_start);
                continue;
            }
            blocked_until_.erase(blocked);
        }

        // 2. 윈도우 리셋 및 토큰 체크
        auto& window = windowFor(host);
        resetWindowIfNeeded(window);

        if (window.current_count < window.max_per_second) {
            window.current_count++;
            total_requests_++;
            return;
        }

        // 3. 다음 윈도우 시작까지 대기
        auto wake_time = window.window_start + std::chrono::seconds(1) + std::chrono::milliseconds(1);

        forced_waits_++;
        auto wait_start = std::chrono::steady_clock::now();
        cv_.wait_until(lock, wake_time);
        total_wait_time_ += std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - wait_start);
    }
}

int RateLimiter::getRemainingRequests(const std::string& host) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto& window = windowFor(host);
    resetWindowIfNeeded(window);
    return std::max(0, window.max_per_second - window.current_count);
}

void RateLimiter::handleRateLimitError(const std::string& host, int status_code) {
    if (status_code != 429) {
        return;
    }

    std::unique_lock<std::mutex> lock(mutex_);
    LOG_WARN("429 Too Many Requests - {} ({}초 정지)", host,
             std::chrono::duration_cast<std::chrono::seconds>(kBackoffOn429).count());

    forced_waits_++;
    blocked_until_[host] = std::chrono::steady_clock::now() + kBackoffOn429;
    cv_.notify_all();
}

RateLimiter::Stats RateLimiter::getStats() const {
    std::unique_lock<std::mutex> lock(mutex_);

    Stats stats;
    stats.total_requests = total_requests_;
    stats.rejected_requests = rejected_requests_;
    stats.forced_waits = forced_waits_;
    stats.total_wait_time = total_wait_time_;
    return stats;
}

void RateLimiter::resetWindowIfNeeded(RateLimitWindow& window) {
    auto now = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - window.window_start);

    if (elapsed.count() >= 1000) {
        window.current_count = 0;
        window.window_start = now;
        cv_.notify_all();
    }
}

} // namespace network
} // namespace marketpipe
