#pragma once

#include "common/Types.h"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace marketpipe {
namespace analytics {

// Indicator Engine - 고정 지표 세트 계산 (I/O 없음)
class IndicatorEngine {
public:
    // 출력 컬럼 순서
    static const std::vector<std::string>& columnNames();

    // 타임프레임별 지표 계산 최소 행 수 (d: 50, w: 20, m: 6)
    static size_t minimumRows(Timeframe timeframe);

    static IndicatorSeries compute(const BarSeries& bars);

    // 마지막 행 값 (결측 제외)
    static std::map<std::string, double> latestValues(const IndicatorSeries& series);
    static std::optional<double> latestChangePercent(const IndicatorSeries& series);
};

} // namespace analytics
} // namespace marketpipe
