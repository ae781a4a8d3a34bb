#pragma once

#include "common/Types.h"
#include "common/Settings.h"
#include "market/SessionClock.h"
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace marketpipe {
namespace storage {

// OHLCV 저장 결과. 일봉 저장이면 주봉/월봉 경로도 채워짐
struct SavedOhlcv {
    std::string path;           // 요청한 timeframe 의 경로
    std::string weekly_path;    // 데이터 부족 시 빈 문자열
    std::string monthly_path;
    size_t rows = 0;
    size_t weekly_rows = 0;
    size_t monthly_rows = 0;
};

// Artifact Store - 메타데이터 헤더 + CSV 본문, 임시파일 -> rename 원자적 저장
// 실패 시 StorageError
class ArtifactStore {
public:
    ArtifactStore(StoreSettings settings, std::shared_ptr<market::SessionClock> clock);

    // OHLCV 저장. timeframe 이 DAILY 면 주봉/월봉도 같은 타임스탬프로 저장
    // as_of: 파일명 타임스탬프 지정 (기본은 마지막 바 시각)
    SavedOhlcv saveOhlcv(const std::string& ticker, Market market, Timeframe timeframe,
                         const BarSeries& series,
                         const std::optional<Timestamp>& as_of = std::nullopt);

    // 지표(또는 crossinfo) 테이블 저장
    std::string saveIndicators(const std::string& ticker, Market market, Timeframe timeframe,
                               const IndicatorSeries& series,
                               const std::optional<Timestamp>& as_of = std::nullopt,
                               ArtifactKind kind = ArtifactKind::INDICATORS);

    std::filesystem::path marketDir(Market market) const;

    // 대상 경로에 원자적으로 기록 (tmp 작성 후 rename)
    static void writeAtomically(const std::filesystem::path& target, const std::string& content);

private:
    std::string saveBarsOnly(const std::string& ticker, Market market, Timeframe timeframe,
                             const BarSeries& series, const Timestamp& as_of);

    std::string buildMetadata(const std::string& header, const std::string& ticker, Market market,
                              const std::string& timeframe_label,
                              const Timestamp& data_start, const Timestamp& data_end,
                              const Timestamp& latest, size_t rows) const;

    StoreSettings settings_;
    std::shared_ptr<market::SessionClock> clock_;
};

} // namespace storage
} // namespace marketpipe
