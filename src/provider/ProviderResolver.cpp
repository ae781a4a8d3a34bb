#include "provider/ProviderResolver.h"
#include "common/TickerIdentity.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <thread>

namespace marketpipe {
namespace provider {

namespace {
nlohmann::json withTrace(nlohmann::json fields, const std::string& trace_id) {
    if (!trace_id.empty()) {
        fields["trace_id"] = trace_id;
    }
    return fields;
}
}

std::string toString(ProviderStatus status) {
    switch (status) {
        case ProviderStatus::SUCCESS: return "success";
        case ProviderStatus::EMPTY: return "empty";
        case ProviderStatus::ERROR: default: return "error";
    }
}

ProviderResolver::ProviderResolver(
    std::shared_ptr<IMarketDataProvider> primary,
    std::shared_ptr<IMarketDataProvider> secondary,
    DownloadSettings settings,
    SleepFunction sleeper
)
    : primary_(std::move(primary))
    , secondary_(std::move(secondary))
    , settings_(std::move(settings))
    , sleeper_(sleeper ? std::move(sleeper)
                       : SleepFunction([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }))
{
}

std::vector<ProviderStep> ProviderResolver::plan(const std::string& ticker, Market market) const {
    const TickerIdentity identity(ticker);
    std::vector<ProviderStep> steps;

    if (identity.isKorean(market)) {
        if (secondary_) {
            steps.push_back({secondary_, identity.secondarySymbol(market),
                             settings_.secondary, "korean.fallback.fdr_fail"});
        }
        if (primary_) {
            for (const auto& symbol : identity.yahooSymbols(market)) {
                steps.push_back({primary_, symbol, settings_.primary, "korean.fallback.yf_fail"});
            }
        }
        return steps;
    }

    if (primary_) {
        steps.push_back({primary_, identity.ticker(), settings_.primary, "us.fallback.yf_fail"});
    }
    if (secondary_) {
        steps.push_back({secondary_, identity.ticker(), settings_.secondary, "us.fallback.fdr_fail"});
    }
    return steps;
}

ProviderResult ProviderResolver::runStep(
    const ProviderStep& step,
    const boost::gregorian::date& start,
    const boost::gregorian::date& end,
    const std::string& trace_id
) const {
    const std::string provider_name = step.provider->name();
    LOG_EVENT("download.call", withTrace({
        {"provider", provider_name},
        {"ticker", step.symbol},
        {"start", boost::gregorian::to_iso_extended_string(start)},
        {"end", boost::gregorian::to_iso_extended_string(end)}
    }, trace_id));

    const int attempts = std::max(1, step.policy.max_attempts);
    ProviderResult last = ProviderResult::error("not attempted");
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        try {
            last = step.provider->fetchDaily(step.symbol, start, end);
        } catch (const std::exception& e) {
            last = ProviderResult::error(e.what());
        }

        if (last.ok()) {
            LOG_EVENT("download.result", withTrace({
                {"provider", provider_name}, {"ticker", step.symbol},
                {"rows", last.bars.size()}, {"status", "success"}
            }, trace_id));
            return last;
        }

        if (last.status != ProviderStatus::ERROR) {
            // 빈 결과는 재시도해도 같음
            LOG_EVENT("download.result", withTrace({
                {"provider", provider_name}, {"ticker", step.symbol},
                {"rows", 0}, {"status", "empty"}
            }, trace_id));
            return last;
        }

        LOG_EVENT("download.retry", withTrace({
            {"provider", provider_name}, {"ticker", step.symbol},
            {"attempt", attempt}, {"error", last.message}
        }, trace_id));
        if (attempt < attempts) {
            sleeper_(step.policy.delay);
        }
    }
    return last;
}

BarSeries ProviderResolver::download(
    const std::string& ticker, Market market,
    const boost::gregorian::date& start,
    const boost::gregorian::date& end,
    const std::string& trace_id
) const {
    const TickerIdentity identity(ticker);
    const bool korean = identity.isKorean(market);

    if (korean) {
        LOG_EVENT("download.fallback.route", withTrace({
            {"market", "KR"}, {"input", identity.ticker()},
            {"market_context", toString(market)},
            {"fdr_norm", identity.secondarySymbol(market)}
        }, trace_id));
        LOG_EVENT("korean.fallback.begin", withTrace({{"ticker", identity.ticker()}}, trace_id));
    } else {
        LOG_EVENT("us.fallback.begin", withTrace({{"ticker", identity.ticker()}}, trace_id));
    }

    const auto steps = plan(ticker, market);
    for (const auto& step : steps) {
        ProviderResult result = runStep(step, start, end, trace_id);
        if (result.ok()) {
            LOG_INFO("{} ({}): {} rows from {} [{}]", identity.ticker(), toString(market),
                     result.bars.size(), step.provider->name(), step.symbol);
            return std::move(result.bars);
        }

        nlohmann::json fields = {
            {"ticker", identity.ticker()},
            {"error", result.message.empty() ? toString(result.status) : result.message}
        };
        if (korean && step.provider == primary_) {
            fields["suffix"] = step.symbol;
            fields["market_context"] = toString(market);
        }
        LOG_EVENT(step.fail_event, withTrace(fields, trace_id));
    }

    throw DownloadError("[" + identity.ticker() + "] " +
                        (korean ? "한국" : "미국") + " 주식 데이터 다운로드 실패 (" +
                        std::to_string(steps.size()) + " providers tried)");
}

} // namespace provider
} // namespace marketpipe
