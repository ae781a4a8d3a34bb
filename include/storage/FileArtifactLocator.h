#pragma once

#include "storage/IArtifactLocator.h"
#include "common/Settings.h"

namespace marketpipe {
namespace storage {

// {data_root}/{US|KOSPI|KOSDAQ}/ 폴더를 스캔하는 로케이터
class FileArtifactLocator : public IArtifactLocator {
public:
    explicit FileArtifactLocator(StoreSettings settings);

    std::optional<LocatedArtifact> locate(
        const std::string& ticker, ArtifactKind kind,
        Market market, Timeframe timeframe) const override;

    std::vector<LocatedArtifact> listAll(
        const std::string& ticker, ArtifactKind kind,
        Market market, Timeframe timeframe) const override;

    std::filesystem::path marketDir(Market market) const;

    // 파일 수정 시각 (UTC). 읽을 수 없으면 nullopt
    static std::optional<boost::posix_time::ptime> lastWriteUtc(const std::filesystem::path& path);

private:
    StoreSettings settings_;
};

} // namespace storage
} // namespace marketpipe
