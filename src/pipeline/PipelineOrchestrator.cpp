#include "pipeline/PipelineOrchestrator.h"
#include "analytics/IndicatorEngine.h"
#include "analytics/TimeframeDeriver.h"
#include "quality/QualityGate.h"
#include "storage/ArtifactReader.h"
#include "storage/CsvCodec.h"
#include "common/TickerIdentity.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <openssl/rand.h>

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>

namespace marketpipe {
namespace pipeline {

namespace {
std::string toHex(const unsigned char* bytes, size_t size) {
    std::ostringstream oss;
    for (size_t i = 0; i < size; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

class StageTimer {
public:
    StageTimer() : start_(std::chrono::steady_clock::now()) {}
    double elapsedSeconds() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    }
private:
    std::chrono::steady_clock::time_point start_;
};
}

PipelineOrchestrator::PipelineOrchestrator(
    std::shared_ptr<market::FreshnessPolicy> freshness,
    std::shared_ptr<provider::ProviderResolver> resolver,
    std::shared_ptr<storage::ArtifactStore> store,
    std::shared_ptr<storage::IArtifactLocator> locator,
    std::shared_ptr<market::SessionClock> clock,
    PipelineSettings settings,
    int lookback_years,
    std::shared_ptr<ITickerAllowList> allow_list
)
    : freshness_(std::move(freshness))
    , resolver_(std::move(resolver))
    , store_(std::move(store))
    , locator_(std::move(locator))
    , clock_(clock ? std::move(clock) : std::make_shared<market::SessionClock>())
    , settings_(std::move(settings))
    , lookback_years_(lookback_years > 0 ? lookback_years : 5)
    , allow_list_(std::move(allow_list))
{
}

std::string PipelineOrchestrator::makeTraceId(const std::string& ticker) {
    unsigned char bytes[4];
    if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
        std::random_device rd;
        for (auto& b : bytes) {
            b = static_cast<unsigned char>(rd() & 0xFF);
        }
    }
    return ticker + "-" + toHex(bytes, sizeof(bytes));
}

void PipelineOrchestrator::event(const std::string& name, const ProcessingResult& result,
                                 nlohmann::json fields) const {
    fields["ticker"] = result.ticker;
    fields["market"] = toString(result.market);
    fields["trace_id"] = result.trace_id;
    LOG_EVENT(name, fields);
}

void PipelineOrchestrator::markFailed(ProcessingResult& result, ProcessingStage stage,
                                      const std::string& message) const {
    result.success = false;
    result.failed_stage = stage;
    result.error = message;
    LOG_ERROR("[{}] {} 단계 실패: {}", result.ticker, toString(stage), message);
    event("orchestrator.failed", result, {{"stage", toString(stage)}, {"error", message}});
}

ProcessingResult PipelineOrchestrator::processTicker(const std::string& ticker, Market market) {
    StageTimer timer;
    ProcessingResult result;
    result.ticker = TickerIdentity(ticker).ticker();
    result.market = market;
    result.trace_id = makeTraceId(result.ticker);

    try {
        // 1. Precheck
        if (allow_list_ && !allow_list_->isActive(result.ticker, market)) {
            result.success = true;
            result.skipped = true;
            LOG_INFO("[{}] 비활성 종목 - 건너뜀", result.ticker);
            event("orchestrator.skip_inactive", result);
            result.elapsed_seconds = timer.elapsedSeconds();
            return result;
        }
        event("orchestrator.start", result);

        // 2. Strategy
        market::DataStrategy strategy = market::DataStrategy::DOWNLOAD_FRESH;
        try {
            strategy = freshness_->decide(result.ticker, market);
            // 재사용 판정이어도 파일이 깨졌거나 행 수가 부족하면 다시 받음
            if (strategy == market::DataStrategy::USE_EXISTING &&
                !freshness_->hasUsableDailyData(result.ticker, market)) {
                LOG_INFO("[{}] 기존 일봉 사용 불가 -> download_fresh", result.ticker);
                strategy = market::DataStrategy::DOWNLOAD_FRESH;
            }
        } catch (const std::exception& e) {
            markFailed(result, ProcessingStage::STRATEGY, e.what());
            result.elapsed_seconds = timer.elapsedSeconds();
            return result;
        }
        result.strategy = strategy;

        // 3. 데이터 확보
        Timestamp as_of;
        if (strategy == market::DataStrategy::USE_EXISTING) {
            event("orchestrator.use_existing", result);
            as_of = runExistingPath(result);
        } else {
            as_of = runDownloadPath(result);
        }

        // 4. 지표 (부분 실패 허용)
        runIndicators(result, as_of, strategy == market::DataStrategy::USE_EXISTING);

        result.success = true;
        result.elapsed_seconds = timer.elapsedSeconds();
        event("orchestrator.done", result, {
            {"strategy", market::toString(strategy)},
            {"daily_rows", result.daily_rows},
            {"indicators_ok", result.indicators_succeeded},
            {"indicators_total", result.indicators_total},
            {"elapsed_s", result.elapsed_seconds}
        });
        LOG_INFO("[{}] 처리 완료 - {}", result.ticker, result.summary());
    } catch (const DownloadError& e) {
        markFailed(result, ProcessingStage::DOWNLOAD, e.what());
    } catch (const ValidationError& e) {
        markFailed(result, ProcessingStage::VALIDATION, e.what());
    } catch (const StorageError& e) {
        markFailed(result, ProcessingStage::DAILY_SAVE, e.what());
    } catch (const NotFoundError& e) {
        markFailed(result, ProcessingStage::EXISTING_PROCESS, e.what());
    } catch (const std::exception& e) {
        markFailed(result, ProcessingStage::EXCEPTION, e.what());
    }

    result.elapsed_seconds = timer.elapsedSeconds();
    return result;
}

ProcessingResult PipelineOrchestrator::ensureIndicators(const std::string& ticker, Market market) {
    StageTimer timer;
    ProcessingResult result;
    result.ticker = TickerIdentity(ticker).ticker();
    result.market = market;
    result.trace_id = makeTraceId(result.ticker);
    result.strategy = market::DataStrategy::USE_EXISTING;

    try {
        const Timestamp as_of = runExistingPath(result);
        runIndicators(result, as_of, true);
        result.success = true;
    } catch (const NotFoundError& e) {
        markFailed(result, ProcessingStage::EXISTING_PROCESS, e.what());
    } catch (const std::exception& e) {
        markFailed(result, ProcessingStage::EXCEPTION, e.what());
    }

    result.elapsed_seconds = timer.elapsedSeconds();
    return result;
}

Timestamp PipelineOrchestrator::runDownloadPath(ProcessingResult& result) {
    const auto end = clock_->currentDate(result.market);
    const auto start = end - boost::gregorian::years(lookback_years_);

    event("download.begin", result, {
        {"start", boost::gregorian::to_iso_extended_string(start)},
        {"end", boost::gregorian::to_iso_extended_string(end)}
    });
    const BarSeries raw = resolver_->download(result.ticker, result.market, start, end, result.trace_id);
    event("download.end", result, {{"rows", raw.size()}});

    // 검증
    const BarSeries cleaned = quality::QualityGate::clean(raw);
    const auto min_rows = static_cast<size_t>(std::max(1, settings_.min_validation_rows));
    if (auto reason = quality::QualityGate::validationFailure(cleaned, min_rows)) {
        throw ValidationError("[" + result.ticker + "] " + *reason);
    }

    auto repaired = quality::QualityGate::repairCloseWithinRange(cleaned);
    if (repaired.repaired_rows > 0) {
        LOG_INFO("[{}] close 범위 보정 {}행", result.ticker, repaired.repaired_rows);
    }

    // 일봉 저장 (주봉/월봉 자동 파생)
    event("save.daily.begin", result, {{"rows", repaired.series.size()}});
    const auto saved = store_->saveOhlcv(result.ticker, result.market, Timeframe::DAILY, repaired.series);
    result.daily_path = saved.path;
    result.weekly_path = saved.weekly_path;
    result.monthly_path = saved.monthly_path;
    result.daily_rows = saved.rows;
    event("save.daily.end", result, {
        {"path", saved.path},
        {"weekly_rows", saved.weekly_rows},
        {"monthly_rows", saved.monthly_rows}
    });

    return repaired.series.back().timestamp;
}

Timestamp PipelineOrchestrator::runExistingPath(ProcessingResult& result) {
    auto located = locator_->locate(result.ticker, ArtifactKind::OHLCV, result.market, Timeframe::DAILY);
    if (!located) {
        throw NotFoundError("[" + result.ticker + "] 기존 일봉 파일 없음");
    }

    const BarSeries daily = storage::ArtifactReader::readBars(located->path);
    if (daily.empty()) {
        throw NotFoundError("[" + result.ticker + "] 기존 일봉 파일을 읽을 수 없음: " + located->path.string());
    }

    result.daily_path = located->path.string();
    result.daily_rows = daily.size();

    // 파일명 타임스탬프가 d/w/m 공통 기준
    const Timestamp as_of = located->timestamp_from_name ? located->timestamp : daily.back().timestamp;

    regenerateDerived(result, daily, Timeframe::WEEKLY, as_of);
    regenerateDerived(result, daily, Timeframe::MONTHLY, as_of);
    return as_of;
}

void PipelineOrchestrator::regenerateDerived(
    ProcessingResult& result, const BarSeries& daily,
    Timeframe timeframe, const Timestamp& as_of
) {
    std::string& target = (timeframe == Timeframe::WEEKLY) ? result.weekly_path : result.monthly_path;

    auto existing = locator_->locate(result.ticker, ArtifactKind::OHLCV, result.market, timeframe);
    if (existing && existing->timestamp >= as_of) {
        target = existing->path.string();
        return;
    }

    const BarSeries derived = analytics::TimeframeDeriver::resample(daily, timeframe);
    if (derived.empty()) {
        LOG_INFO("[{}] {} 파생 데이터 부족 (일봉 {}행)", result.ticker, toLongName(timeframe), daily.size());
        return;
    }

    try {
        target = store_->saveOhlcv(result.ticker, result.market, timeframe, derived, as_of).path;
        LOG_INFO("[{}] {} OHLCV 재생성 - {}", result.ticker, toLongName(timeframe), target);
    } catch (const StorageError& e) {
        LOG_WARN("[{}] {} OHLCV 재생성 실패: {}", result.ticker, toLongName(timeframe), e.what());
    }
}

void PipelineOrchestrator::runIndicators(ProcessingResult& result, const Timestamp& as_of, bool only_missing) {
    event("indicators.calculate.begin", result, {
        {"as_of", storage::CsvCodec::formatDateTime(as_of)},
        {"only_missing", only_missing}
    });

    for (Timeframe timeframe : {Timeframe::DAILY, Timeframe::WEEKLY, Timeframe::MONTHLY}) {
        ++result.indicators_total;

        if (only_missing) {
            auto existing = locator_->locate(result.ticker, ArtifactKind::INDICATORS, result.market, timeframe);
            if (existing && existing->timestamp >= as_of) {
                result.indicator_paths[timeframe] = existing->path.string();
                ++result.indicators_succeeded;
                continue;
            }
        }

        const std::string& ohlcv_path = (timeframe == Timeframe::DAILY) ? result.daily_path
            : (timeframe == Timeframe::WEEKLY) ? result.weekly_path : result.monthly_path;
        if (ohlcv_path.empty()) {
            LOG_INFO("[{}] {} OHLCV 없음 - 지표 건너뜀", result.ticker, toLongName(timeframe));
            continue;
        }

        const BarSeries bars = storage::ArtifactReader::readBars(ohlcv_path);
        const size_t min_rows = analytics::IndicatorEngine::minimumRows(timeframe);
        if (bars.size() < min_rows) {
            LOG_INFO("[{}] {} 지표 계산 행 수 부족 ({} < {})", result.ticker,
                     toLongName(timeframe), bars.size(), min_rows);
            continue;
        }

        const IndicatorSeries series = analytics::IndicatorEngine::compute(bars);
        try {
            result.indicator_paths[timeframe] = store_->saveIndicators(
                result.ticker, result.market, timeframe, series, as_of);
            ++result.indicators_succeeded;
            if (timeframe == Timeframe::DAILY) {
                result.indicator_rows = series.rows();
            }
        } catch (const StorageError& e) {
            LOG_WARN("[{}] {} 지표 저장 실패: {}", result.ticker, toLongName(timeframe), e.what());
        }
    }

    event("indicators.calculate.end", result, {
        {"succeeded", result.indicators_succeeded},
        {"total", result.indicators_total}
    });
}

} // namespace pipeline
} // namespace marketpipe
