#pragma once

#include "common/Types.h"
#include "common/Settings.h"
#include "market/SessionClock.h"
#include "storage/IArtifactLocator.h"
#include <memory>
#include <optional>
#include <string>

namespace marketpipe {
namespace market {

enum class DataStrategy { USE_EXISTING, DOWNLOAD_FRESH };

std::string toString(DataStrategy strategy);

// Freshness Policy - 기존 아티팩트 재사용 여부 판단
// 장중에는 나이 기준으로 갱신, 장외에는 파일이 있으면 재사용
class FreshnessPolicy {
public:
    FreshnessPolicy(std::shared_ptr<storage::IArtifactLocator> locator,
                    std::shared_ptr<SessionClock> clock,
                    FreshnessSettings settings = FreshnessSettings());

    DataStrategy decide(const std::string& ticker, Market market) const;

    // 페이지 캐시 판단 (순수 계산)
    // pre/open: 직전 영업일 마감 이후 생성이면 fresh
    // post: 오늘 마감 이후 생성이면 fresh
    bool isPageFresh(const Timestamp& created_local, Market market) const;

    // 메타데이터 created_at 우선, 없으면 파일 시각. 아티팩트가 없으면 stale
    bool isArtifactPageFresh(const std::string& ticker, ArtifactKind kind,
                             Market market, Timeframe timeframe) const;

    // 일봉 파일을 읽을 수 있고 QualityGate 검증(min_usable_rows)을 통과하는지
    bool hasUsableDailyData(const std::string& ticker, Market market) const;

    // 아티팩트 생성 시각 (현지). 파일명 타임스탬프 -> 파일 수정 시각 순
    std::optional<Timestamp> creationInstant(const storage::LocatedArtifact& artifact,
                                             Market market) const;

private:
    std::shared_ptr<storage::IArtifactLocator> locator_;
    std::shared_ptr<SessionClock> clock_;
    FreshnessSettings settings_;
};

} // namespace market
} // namespace marketpipe
