#include "quality/QualityGate.h"

#include <algorithm>
#include <cmath>
#include <set>
#include <utility>

namespace marketpipe {
namespace quality {

namespace {
bool isNumeric(double v) {
    return std::isfinite(v);
}

bool allFieldsNumeric(const Bar& bar) {
    return isNumeric(bar.open) && isNumeric(bar.high) && isNumeric(bar.low) &&
           isNumeric(bar.close) && isNumeric(bar.volume);
}
}

std::optional<std::string> QualityGate::validationFailure(const BarSeries& series, size_t min_rows) {
    if (series.empty()) {
        return std::string("empty series");
    }
    if (series.size() < min_rows) {
        return "insufficient rows: " + std::to_string(series.size()) + " < " + std::to_string(min_rows);
    }

    std::set<Timestamp> seen;
    for (const auto& bar : series) {
        if (bar.timestamp.is_special()) {
            return std::string("invalid timestamp");
        }
        if (!allFieldsNumeric(bar)) {
            return "non-numeric value at " + boost::posix_time::to_simple_string(bar.timestamp);
        }
        if (bar.open < 0 || bar.high < 0 || bar.low < 0 || bar.close < 0) {
            return "negative price at " + boost::posix_time::to_simple_string(bar.timestamp);
        }
        if (bar.high < bar.low) {
            return "high < low at " + boost::posix_time::to_simple_string(bar.timestamp);
        }
        if (bar.volume < 0) {
            return "negative volume at " + boost::posix_time::to_simple_string(bar.timestamp);
        }
        if (!seen.insert(bar.timestamp).second) {
            return "duplicate timestamp " + boost::posix_time::to_simple_string(bar.timestamp);
        }
    }
    return std::nullopt;
}

bool QualityGate::validate(const BarSeries& series, size_t min_rows) {
    return !validationFailure(series, min_rows).has_value();
}

BarSeries QualityGate::clean(const BarSeries& series) {
    BarSeries sorted = series;
    // stable_sort 이므로 같은 시각 중 먼저 들어온 행이 앞에 남음
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const Bar& a, const Bar& b) { return a.timestamp < b.timestamp; });

    BarSeries cleaned;
    cleaned.reserve(sorted.size());
    for (const auto& bar : sorted) {
        // 결측 행은 중복 판정 전에 제거 (같은 시각의 정상 행이 남도록)
        if (bar.timestamp.is_special() || !allFieldsNumeric(bar)) {
            continue;
        }
        if (!cleaned.empty() && cleaned.back().timestamp == bar.timestamp) {
            continue;
        }

        Bar fixed = bar;
        fixed.open = std::abs(fixed.open);
        fixed.high = std::abs(fixed.high);
        fixed.low = std::abs(fixed.low);
        fixed.close = std::abs(fixed.close);
        fixed.volume = std::abs(fixed.volume);
        if (fixed.high < fixed.low) {
            std::swap(fixed.high, fixed.low);
        }
        cleaned.push_back(fixed);
    }
    return cleaned;
}

QualityGate::RepairResult QualityGate::repairCloseWithinRange(const BarSeries& series) {
    RepairResult result;
    result.series = series;
    for (auto& bar : result.series) {
        if (bar.close > bar.high) {
            bar.high = bar.close;
            ++result.repaired_rows;
        } else if (bar.close < bar.low) {
            bar.low = bar.close;
            ++result.repaired_rows;
        }
    }
    return result;
}

} // namespace quality
} // namespace marketpipe
