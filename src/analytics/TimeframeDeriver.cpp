#include "analytics/TimeframeDeriver.h"
#include <algorithm>

namespace marketpipe {
namespace analytics {

namespace {
bool hasMissingField(const Bar& bar) {
    return isMissing(bar.open) || isMissing(bar.high) || isMissing(bar.low) ||
           isMissing(bar.close) || isMissing(bar.volume);
}
}

Timestamp TimeframeDeriver::periodLabel(const Timestamp& ts, Timeframe target) {
    const boost::gregorian::date d = ts.date();
    switch (target) {
        case Timeframe::WEEKLY: {
            const int dow = d.day_of_week().as_number();  // 0 = Sunday
            return Timestamp(d + boost::gregorian::days((7 - dow) % 7));
        }
        case Timeframe::MONTHLY:
            return Timestamp(d.end_of_month());
        case Timeframe::DAILY:
        default:
            return ts;
    }
}

BarSeries TimeframeDeriver::resample(const BarSeries& daily, Timeframe target) {
    if (target == Timeframe::DAILY) {
        return daily;
    }

    const size_t required = (target == Timeframe::WEEKLY) ? kMinDailyRowsForWeekly : kMinDailyRowsForMonthly;
    if (daily.size() < required) {
        return {};
    }

    BarSeries sorted = daily;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Bar& a, const Bar& b) { return a.timestamp < b.timestamp; });

    BarSeries result;
    bool has_current = false;
    Bar current;

    for (const auto& bar : sorted) {
        if (hasMissingField(bar)) {
            continue;
        }
        const Timestamp label = periodLabel(bar.timestamp, target);
        if (!has_current || label != current.timestamp) {
            if (has_current) {
                result.push_back(current);
            }
            current = Bar(label, bar.open, bar.high, bar.low, bar.close, bar.volume);
            has_current = true;
            continue;
        }
        current.high = std::max(current.high, bar.high);
        current.low = std::min(current.low, bar.low);
        current.close = bar.close;
        current.volume += bar.volume;
    }
    if (has_current) {
        result.push_back(current);
    }
    return result;
}

} // namespace analytics
} // namespace marketpipe
