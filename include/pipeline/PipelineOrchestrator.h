#pragma once

#include "pipeline/ProcessingResult.h"
#include "pipeline/ITickerAllowList.h"
#include "market/FreshnessPolicy.h"
#include "market/SessionClock.h"
#include "provider/ProviderResolver.h"
#include "storage/ArtifactStore.h"
#include "storage/IArtifactLocator.h"
#include "common/Settings.h"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

namespace marketpipe {
namespace pipeline {

// 종목 1건 처리 진입점 (BatchRunner 에서 사용, 테스트에서 fake 주입)
class ITickerProcessor {
public:
    virtual ~ITickerProcessor() = default;

    virtual ProcessingResult processTicker(const std::string& ticker, Market market) = 0;
};

// Pipeline Orchestrator
// Precheck -> Strategy -> (UseExisting | Download -> Validate -> SaveDaily) -> Indicators
// 실패는 예외 대신 ProcessingResult.failed_stage 로 보고
class PipelineOrchestrator : public ITickerProcessor {
public:
    PipelineOrchestrator(
        std::shared_ptr<market::FreshnessPolicy> freshness,
        std::shared_ptr<provider::ProviderResolver> resolver,
        std::shared_ptr<storage::ArtifactStore> store,
        std::shared_ptr<storage::IArtifactLocator> locator,
        std::shared_ptr<market::SessionClock> clock,
        PipelineSettings settings = PipelineSettings(),
        int lookback_years = 5,
        std::shared_ptr<ITickerAllowList> allow_list = nullptr
    );

    ProcessingResult processTicker(const std::string& ticker, Market market) override;

    // 다운로드 없이 기존 OHLCV 로 빠진 주봉/월봉/지표만 재생성
    ProcessingResult ensureIndicators(const std::string& ticker, Market market);

    // {ticker}-{8자리 hex}
    static std::string makeTraceId(const std::string& ticker);

private:
    // 각 단계는 실패 시 해당 PipelineError 를 던짐
    Timestamp runDownloadPath(ProcessingResult& result);
    Timestamp runExistingPath(ProcessingResult& result);
    void runIndicators(ProcessingResult& result, const Timestamp& as_of, bool only_missing);

    void regenerateDerived(ProcessingResult& result, const BarSeries& daily,
                           Timeframe timeframe, const Timestamp& as_of);

    void markFailed(ProcessingResult& result, ProcessingStage stage, const std::string& message) const;
    void event(const std::string& name, const ProcessingResult& result,
               nlohmann::json fields = nlohmann::json::object()) const;

    std::shared_ptr<market::FreshnessPolicy> freshness_;
    std::shared_ptr<provider::ProviderResolver> resolver_;
    std::shared_ptr<storage::ArtifactStore> store_;
    std::shared_ptr<storage::IArtifactLocator> locator_;
    std::shared_ptr<market::SessionClock> clock_;
    PipelineSettings settings_;
    int lookback_years_;
    std::shared_ptr<ITickerAllowList> allow_list_;
};

} // namespace pipeline
} // namespace marketpipe
