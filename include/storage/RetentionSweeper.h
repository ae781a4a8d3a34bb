#pragma once

#include "common/Settings.h"
#include "market/IClock.h"
#include <cstdint>
#include <filesystem>
#include <memory>

namespace marketpipe {
namespace storage {

struct SweepStats {
    int scanned_files = 0;
    int removed_files = 0;
    int kept_canonical = 0;     // 오래됐지만 그룹 최신이라 남긴 파일
    std::uintmax_t freed_bytes = 0;
};

// Retention Sweeper - 오래된 아티팩트를 나이 기준으로 정리
// (ticker, kind, timeframe) 그룹의 최신 파일은 나이와 무관하게 유지
class RetentionSweeper {
public:
    RetentionSweeper(StoreSettings settings, std::shared_ptr<market::IClock> clock = nullptr);

    // max_age_days <= 0 이면 설정값 사용
    SweepStats sweep(int max_age_days = 0);

private:
    void sweepMarketDir(const std::filesystem::path& dir,
                        const boost::posix_time::ptime& cutoff_utc,
                        const boost::posix_time::ptime& tmp_cutoff_utc,
                        SweepStats& stats);

    bool removeFile(const std::filesystem::path& path, SweepStats& stats);

    StoreSettings settings_;
    std::shared_ptr<market::IClock> clock_;
};

} // namespace storage
} // namespace marketpipe
