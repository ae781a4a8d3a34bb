#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace marketpipe {

// 저장소 설정
struct StoreSettings {
    std::string data_root = "static/data";
    int retention_days = 90;
};

// 신선도 판단 설정
struct FreshnessSettings {
    int open_market_max_age_seconds = 3600;   // 장중 재다운로드 기준 (1시간)
    int min_usable_rows = 20;
};

// 프로바이더 재시도 정책
struct RetryPolicy {
    int max_attempts = 3;
    std::chrono::milliseconds delay{5000};
};

// 다운로드 설정
struct DownloadSettings {
    int lookback_years = 5;
    RetryPolicy primary{3, std::chrono::milliseconds(5000)};    // Yahoo
    RetryPolicy secondary{3, std::chrono::milliseconds(2000)};  // Naver/Stooq
    long http_timeout_seconds = 30;
    int requests_per_second = 2;
};

// 오케스트레이터/배치 설정
struct PipelineSettings {
    int min_validation_rows = 20;
    int max_workers = 2;
    std::vector<std::string> active_tickers;   // 비어 있으면 전체 허용
};

} // namespace marketpipe
