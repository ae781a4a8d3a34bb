#pragma once

#include "common/Types.h"
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace marketpipe {
namespace storage {

struct LatestQuote {
    Timestamp timestamp;
    double close = 0.0;
    double previous_close = 0.0;
    double change_percent = 0.0;
};

// Artifact Reader - 메타데이터 헤더를 건너뛰고 CSV 본문 파싱
// 파일이 없거나 읽을 수 없으면 빈 결과 (예외 없음)
class ArtifactReader {
public:
    static BarSeries readBars(const std::filesystem::path& path);
    static IndicatorSeries readIndicators(const std::filesystem::path& path);

    // "# key: value" 라인
    static std::map<std::string, std::string> readMetadata(const std::filesystem::path& path);

    // 마지막 종가와 등락률
    static std::optional<LatestQuote> readLatestQuote(const std::filesystem::path& path);
};

} // namespace storage
} // namespace marketpipe
