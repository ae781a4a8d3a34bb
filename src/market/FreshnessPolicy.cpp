#include "market/FreshnessPolicy.h"
#include "storage/ArtifactReader.h"
#include "storage/CsvCodec.h"
#include "storage/FileArtifactLocator.h"
#include "quality/QualityGate.h"
#include "common/Logger.h"

#include <algorithm>

namespace marketpipe {
namespace market {

std::string toString(DataStrategy strategy) {
    return strategy == DataStrategy::USE_EXISTING ? "use_existing" : "download_fresh";
}

FreshnessPolicy::FreshnessPolicy(
    std::shared_ptr<storage::IArtifactLocator> locator,
    std::shared_ptr<SessionClock> clock,
    FreshnessSettings settings
)
    : locator_(std::move(locator))
    , clock_(clock ? std::move(clock) : std::make_shared<SessionClock>())
    , settings_(settings)
{
}

std::optional<Timestamp> FreshnessPolicy::creationInstant(
    const storage::LocatedArtifact& artifact, Market market
) const {
    // 로케이터가 이미 파일명 또는 수정 시각으로 채워 둠
    if (!artifact.timestamp.is_special()) {
        return artifact.timestamp;
    }
    auto utc = storage::FileArtifactLocator::lastWriteUtc(artifact.path);
    if (!utc) {
        return std::nullopt;
    }
    return SessionClock::toLocal(*utc, market);
}

DataStrategy FreshnessPolicy::decide(const std::string& ticker, Market market) const {
    auto existing = locator_->locate(ticker, ArtifactKind::OHLCV, market, Timeframe::DAILY);
    if (!existing) {
        LOG_INFO("{} ({}): 기존 일봉 없음 -> download_fresh", ticker, toString(market));
        return DataStrategy::DOWNLOAD_FRESH;
    }

    auto created = creationInstant(*existing, market);
    if (!created) {
        // 파일 시각을 알 수 없어도 읽을 수 있는 파일은 존재함
        LOG_WARN("{} ({}): 파일 시각 확인 실패, 기존 데이터 사용 - {}",
                 ticker, toString(market), existing->path.string());
        return DataStrategy::USE_EXISTING;
    }

    const Timestamp now = clock_->nowLocal(market);
    if (!clock_->isOpen(market)) {
        LOG_INFO("{} ({}): 장외 ({}) -> use_existing", ticker, toString(market),
                 toString(clock_->phase(market)));
        return DataStrategy::USE_EXISTING;
    }

    const long age_seconds = (now - *created).total_seconds();
    if (age_seconds > settings_.open_market_max_age_seconds) {
        LOG_INFO("{} ({}): 장중, 파일 나이 {}s > {}s -> download_fresh",
                 ticker, toString(market), age_seconds, settings_.open_market_max_age_seconds);
        return DataStrategy::DOWNLOAD_FRESH;
    }

    LOG_INFO("{} ({}): 장중, 파일 나이 {}s -> use_existing", ticker, toString(market), age_seconds);
    return DataStrategy::USE_EXISTING;
}

bool FreshnessPolicy::isPageFresh(const Timestamp& created_local, Market market) const {
    const Timestamp now = clock_->nowLocal(market);
    const SessionPhase phase = SessionClock::phaseAt(now, market);
    if (phase == SessionPhase::POST) {
        return created_local > clock_->todayClose(market);
    }
    return created_local >= SessionClock::previousBusinessCloseAt(now, market);
}

bool FreshnessPolicy::isArtifactPageFresh(
    const std::string& ticker, ArtifactKind kind,
    Market market, Timeframe timeframe
) const {
    auto artifact = locator_->locate(ticker, kind, market, timeframe);
    if (!artifact) {
        return false;
    }

    std::optional<Timestamp> created;
    const auto metadata = storage::ArtifactReader::readMetadata(artifact->path);
    auto it = metadata.find("created_at");
    if (it != metadata.end()) {
        created = storage::CsvCodec::parseTimestamp(it->second);
    }
    if (!created) {
        auto utc = storage::FileArtifactLocator::lastWriteUtc(artifact->path);
        if (!utc) {
            return false;
        }
        created = SessionClock::toLocal(*utc, market);
    }

    const bool fresh = isPageFresh(*created, market);
    LOG_DEBUG("{} {} {}: created={} fresh={}", ticker, toString(kind), toCode(timeframe),
              storage::CsvCodec::formatDateTime(*created), fresh);
    return fresh;
}

bool FreshnessPolicy::hasUsableDailyData(const std::string& ticker, Market market) const {
    auto artifact = locator_->locate(ticker, ArtifactKind::OHLCV, market, Timeframe::DAILY);
    if (!artifact) {
        return false;
    }

    const BarSeries bars = storage::ArtifactReader::readBars(artifact->path);
    const auto min_rows = static_cast<size_t>(std::max(1, settings_.min_usable_rows));
    if (auto reason = quality::QualityGate::validationFailure(bars, min_rows)) {
        LOG_INFO("{} ({}): 기존 일봉 사용 불가 - {} ({})", ticker, toString(market),
                 *reason, artifact->path.string());
        return false;
    }
    return true;
}

} // namespace market
} // namespace marketpipe
