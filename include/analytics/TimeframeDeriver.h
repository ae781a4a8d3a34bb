#pragma once

#include "common/Types.h"

namespace marketpipe {
namespace analytics {

// 일봉 -> 주봉(일요일 마감) / 월봉(월말) 리샘플링
// open=first, high=max, low=min, close=last, volume=sum
class TimeframeDeriver {
public:
    static constexpr size_t kMinDailyRowsForWeekly = 7;
    static constexpr size_t kMinDailyRowsForMonthly = 30;

    // 행 수가 부족하면 빈 시리즈 (오류 아님)
    static BarSeries resample(const BarSeries& daily, Timeframe target);

    // 주봉은 해당 주의 일요일, 월봉은 말일
    static Timestamp periodLabel(const Timestamp& ts, Timeframe target);
};

} // namespace analytics
} // namespace marketpipe
