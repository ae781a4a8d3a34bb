#pragma once

#include "common/Types.h"
#include <optional>
#include <string>
#include <vector>

namespace marketpipe {
namespace storage {

// 아티팩트 CSV 셀 변환 유틸
class CsvCodec {
public:
    // NaN -> 빈 셀, 그 외 왕복 가능한 최소 자릿수 (15 또는 17)
    static std::string formatNumber(double value);

    // 자정이면 "YYYY-MM-DD", 아니면 "YYYY-MM-DD HH:MM:SS"
    static std::string formatTimestamp(const Timestamp& ts);
    // 항상 "YYYY-MM-DD HH:MM:SS"
    static std::string formatDateTime(const Timestamp& ts);
    static std::string formatDate(const Timestamp& ts);
    static std::string formatTime(const Timestamp& ts);

    // "YYYY-MM-DD[ HH:MM[:SS]]" ('T' 구분자 허용)
    static std::optional<Timestamp> parseTimestamp(const std::string& text);

    // 빈 셀 -> NaN, 숫자가 아니면 nullopt
    static std::optional<double> parseNumber(const std::string& text);

    static std::vector<std::string> splitLine(const std::string& line);
    static std::string trim(std::string s);
};

} // namespace storage
} // namespace marketpipe
