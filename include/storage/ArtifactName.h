#pragma once

#include "common/Types.h"
#include <optional>
#include <string>

namespace marketpipe {
namespace storage {

// 파일명 = {ticker}_{kind}_{tf}_{YYYYMMDD}_{HHMMSS}_{TZ}.csv
// 타임스탬프는 저장 시각이 아니라 데이터의 마지막 바 시각
struct ArtifactName {
    std::string ticker;
    ArtifactKind kind = ArtifactKind::OHLCV;
    Timeframe timeframe = Timeframe::DAILY;
    Timestamp timestamp;
    std::string tz_label;

    std::string fileName() const;

    // 형식이 맞지 않으면 nullopt
    static std::optional<ArtifactName> parse(const std::string& file_name);
};

} // namespace storage
} // namespace marketpipe
