#pragma once

#include "provider/IMarketDataProvider.h"
#include "common/Settings.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace marketpipe {
namespace provider {

// 폴백 계획의 한 단계: 어떤 프로바이더에 어떤 심볼로 몇 번 시도할지
struct ProviderStep {
    std::shared_ptr<IMarketDataProvider> provider;
    std::string symbol;
    RetryPolicy policy;
    std::string fail_event;     // 단계 실패 시 남길 이벤트 이름
};

// Multi-Provider Resolver
// 한국: 보조(6자리 코드) -> Yahoo(.KQ/.KS 순서는 시장 기준)
// 미국: Yahoo -> 보조
class ProviderResolver {
public:
    using SleepFunction = std::function<void(std::chrono::milliseconds)>;

    ProviderResolver(std::shared_ptr<IMarketDataProvider> primary,
                     std::shared_ptr<IMarketDataProvider> secondary,
                     DownloadSettings settings = DownloadSettings(),
                     SleepFunction sleeper = nullptr);

    // 모든 단계 실패 시 DownloadError
    BarSeries download(const std::string& ticker, Market market,
                       const boost::gregorian::date& start,
                       const boost::gregorian::date& end,
                       const std::string& trace_id = "") const;

    std::vector<ProviderStep> plan(const std::string& ticker, Market market) const;

private:
    ProviderResult runStep(const ProviderStep& step,
                           const boost::gregorian::date& start,
                           const boost::gregorian::date& end,
                           const std::string& trace_id) const;

    std::shared_ptr<IMarketDataProvider> primary_;
    std::shared_ptr<IMarketDataProvider> secondary_;
    DownloadSettings settings_;
    SleepFunction sleeper_;
};

} // namespace provider
} // namespace marketpipe
