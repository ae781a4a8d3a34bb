#pragma once

#include "common/Types.h"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace marketpipe {
namespace storage {

struct LocatedArtifact {
    std::filesystem::path path;
    // 파일명 타임스탬프 (없으면 파일 수정 시각을 시장 현지 시각으로 환산)
    Timestamp timestamp;
    bool timestamp_from_name = true;
};

// "최신 아티팩트" 탐색의 유일한 진입점
class IArtifactLocator {
public:
    virtual ~IArtifactLocator() = default;

    // 없으면 nullopt (예외 없음)
    virtual std::optional<LocatedArtifact> locate(
        const std::string& ticker, ArtifactKind kind,
        Market market, Timeframe timeframe) const = 0;

    // 최신순 전체 목록
    virtual std::vector<LocatedArtifact> listAll(
        const std::string& ticker, ArtifactKind kind,
        Market market, Timeframe timeframe) const = 0;
};

} // namespace storage
} // namespace marketpipe
