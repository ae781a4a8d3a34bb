#pragma once

#include "common/Types.h"
#include <boost/date_time/gregorian/gregorian.hpp>
#include <string>

namespace marketpipe {
namespace provider {

enum class ProviderStatus { SUCCESS, EMPTY, ERROR };

std::string toString(ProviderStatus status);

// 프로바이더 호출 결과. 예상 가능한 실패는 예외 대신 status 로 전달
struct ProviderResult {
    ProviderStatus status = ProviderStatus::EMPTY;
    BarSeries bars;
    std::string message;

    bool ok() const { return status == ProviderStatus::SUCCESS && !bars.empty(); }

    static ProviderResult success(BarSeries bars) {
        ProviderResult r;
        r.status = bars.empty() ? ProviderStatus::EMPTY : ProviderStatus::SUCCESS;
        r.bars = std::move(bars);
        return r;
    }
    static ProviderResult empty(const std::string& message = "") {
        ProviderResult r;
        r.status = ProviderStatus::EMPTY;
        r.message = message;
        return r;
    }
    static ProviderResult error(const std::string& message) {
        ProviderResult r;
        r.status = ProviderStatus::ERROR;
        r.message = message;
        return r;
    }
};

// 외부 시세 프로바이더 하나 (일봉 전용)
class IMarketDataProvider {
public:
    virtual ~IMarketDataProvider() = default;

    // 이벤트 로그용 이름 ("yfinance", "fdr")
    virtual std::string name() const = 0;

    // [start, end] 구간 일봉. 바 시각은 거래소 현지 날짜 자정
    virtual ProviderResult fetchDaily(const std::string& symbol,
                                      const boost::gregorian::date& start,
                                      const boost::gregorian::date& end) = 0;
};

} // namespace provider
} // namespace marketpipe
