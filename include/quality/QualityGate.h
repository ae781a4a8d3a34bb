#pragma once

#include "common/Types.h"
#include <optional>
#include <string>

namespace marketpipe {
namespace quality {

// Quality Gate - 원본 시계열 검증/보정 (모두 새 시리즈 반환, 입력 불변)
class QualityGate {
public:
    // 실패 시 false (예외 없음)
    static bool validate(const BarSeries& series, size_t min_rows = 1);

    // 첫 번째 실패 사유, 통과하면 nullopt
    static std::optional<std::string> validationFailure(const BarSeries& series, size_t min_rows = 1);

    // 정렬 -> 중복 제거(첫 행 유지) -> 절대값 -> high/low 교환 -> 결측 행 제거
    static BarSeries clean(const BarSeries& series);

    struct RepairResult {
        BarSeries series;
        size_t repaired_rows = 0;
    };
    // close 가 [low, high] 밖이면 넘어간 쪽 경계를 close 로 넓힘
    static RepairResult repairCloseWithinRange(const BarSeries& series);
};

} // namespace quality
} // namespace marketpipe
