#include "storage/RetentionSweeper.h"
#include "storage/ArtifactName.h"
#include "storage/FileArtifactLocator.h"
#include "common/TickerIdentity.h"
#include "common/Logger.h"

#include <algorithm>
#include <map>
#include <vector>

namespace marketpipe {
namespace storage {

namespace {
struct SweepCandidate {
    std::filesystem::path path;
    Timestamp name_timestamp;
    boost::posix_time::ptime modified_utc;
};

// 같은 종목의 접미사 변형(005930, 005930.KS)은 한 그룹으로 묶음
std::string groupKey(const ArtifactName& name) {
    return TickerIdentity(name.ticker).baseCode() + "|" +
           toString(name.kind) + "|" + toCode(name.timeframe);
}
}

RetentionSweeper::RetentionSweeper(StoreSettings settings, std::shared_ptr<market::IClock> clock)
    : settings_(std::move(settings))
    , clock_(clock ? std::move(clock) : std::make_shared<market::SystemClock>())
{
}

SweepStats RetentionSweeper::sweep(int max_age_days) {
    const int days = (max_age_days > 0) ? max_age_days : settings_.retention_days;
    const auto now = clock_->nowUtc();
    const auto cutoff = now - boost::posix_time::hours(24 * days);
    const auto tmp_cutoff = now - boost::posix_time::hours(1);

    LOG_INFO("Retention sweep 시작 - root: {}, max_age_days: {}", settings_.data_root, days);

    SweepStats stats;
    for (Market market : {Market::US, Market::KOSPI, Market::KOSDAQ}) {
        const auto dir = std::filesystem::path(settings_.data_root) / toString(market);
        std::error_code ec;
        if (!std::filesystem::is_directory(dir, ec)) {
            continue;
        }
        sweepMarketDir(dir, cutoff, tmp_cutoff, stats);
    }

    LOG_INFO("Retention sweep 완료 - scanned: {}, removed: {}, kept canonical: {}, freed: {} bytes",
             stats.scanned_files, stats.removed_files, stats.kept_canonical, stats.freed_bytes);
    LOG_EVENT("retention.sweep", nlohmann::json({
        {"max_age_days", days},
        {"scanned", stats.scanned_files},
        {"removed", stats.removed_files},
        {"freed_bytes", stats.freed_bytes}
    }));
    return stats;
}

void RetentionSweeper::sweepMarketDir(
    const std::filesystem::path& dir,
    const boost::posix_time::ptime& cutoff_utc,
    const boost::posix_time::ptime& tmp_cutoff_utc,
    SweepStats& stats
) {
    std::map<std::string, std::vector<SweepCandidate>> groups;

    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    const std::filesystem::directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) {
            continue;
        }

        const auto path = it->path();
        const auto modified = FileArtifactLocator::lastWriteUtc(path);
        if (!modified) {
            LOG_WARN("수정 시각 확인 실패: {}", path.string());
            continue;
        }

        // 중단된 저장이 남긴 임시파일
        if (path.extension() == ".tmp") {
            if (*modified < tmp_cutoff_utc) {
                removeFile(path, stats);
            }
            continue;
        }

        auto name = ArtifactName::parse(path.filename().string());
        if (!name) {
            // 형식이 다른 파일은 건드리지 않음
            continue;
        }

        ++stats.scanned_files;
        groups[groupKey(*name)].push_back(SweepCandidate{path, name->timestamp, *modified});
    }

    if (ec) {
        LOG_WARN("Retention scan error in {}: {}", dir.string(), ec.message());
    }

    for (auto& entry : groups) {
        auto& files = entry.second;
        // 로케이터와 같은 순서: 파일명 타임스탬프 내림차순, 경로 내림차순
        std::sort(files.begin(), files.end(), [](const SweepCandidate& a, const SweepCandidate& b) {
            if (a.name_timestamp != b.name_timestamp) {
                return a.name_timestamp > b.name_timestamp;
            }
            return a.path.string() > b.path.string();
        });

        if (files.front().modified_utc < cutoff_utc) {
            ++stats.kept_canonical;
        }
        for (size_t i = 1; i < files.size(); ++i) {
            if (files[i].modified_utc < cutoff_utc) {
                removeFile(files[i].path, stats);
            }
        }
    }
}

bool RetentionSweeper::removeFile(const std::filesystem::path& path, SweepStats& stats) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    const std::uintmax_t bytes = ec ? 0 : size;

    ec.clear();
    if (!std::filesystem::remove(path, ec) || ec) {
        LOG_WARN("삭제 실패: {} ({})", path.string(), ec ? ec.message() : std::string("not found"));
        return false;
    }

    ++stats.removed_files;
    stats.freed_bytes += bytes;
    LOG_DEBUG("Removed {}", path.string());
    return true;
}

} // namespace storage
} // namespace marketpipe
