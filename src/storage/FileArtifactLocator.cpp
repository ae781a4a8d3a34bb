#include "storage/FileArtifactLocator.h"
#include "storage/ArtifactName.h"
#include "market/SessionClock.h"
#include "common/TickerIdentity.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>

namespace marketpipe {
namespace storage {

namespace {
std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}
}

FileArtifactLocator::FileArtifactLocator(StoreSettings settings)
    : settings_(std::move(settings))
{
}

std::filesystem::path FileArtifactLocator::marketDir(Market market) const {
    return std::filesystem::path(settings_.data_root) / toString(market);
}

std::optional<boost::posix_time::ptime> FileArtifactLocator::lastWriteUtc(
    const std::filesystem::path& path
) {
    std::error_code ec;
    const auto ftime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    const auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - std::filesystem::file_time_type::clock::now() + std::chrono::system_clock::now());
    return boost::posix_time::from_time_t(std::chrono::system_clock::to_time_t(sys));
}

std::vector<LocatedArtifact> FileArtifactLocator::listAll(
    const std::string& ticker, ArtifactKind kind,
    Market market, Timeframe timeframe
) const {
    std::vector<LocatedArtifact> found;
    const auto dir = marketDir(market);

    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return found;
    }

    // 후보 접두어: {cand}_{kind}_{tf}_ (대소문자 무시, CrossInfo 등 허용)
    std::vector<std::string> prefixes;
    for (const auto& cand : TickerIdentity(ticker).candidates(market)) {
        prefixes.push_back(toLowerCopy(cand + "_" + toString(kind) + "_" + toCode(timeframe) + "_"));
    }

    std::filesystem::directory_iterator it(dir, ec);
    const std::filesystem::directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) {
            continue;
        }

        const std::string file_name = it->path().filename().string();
        const std::string lower = toLowerCopy(file_name);
        if (!endsWith(lower, ".csv")) {
            continue;
        }
        const bool matched = std::any_of(prefixes.begin(), prefixes.end(),
            [&](const std::string& prefix) { return startsWith(lower, prefix); });
        if (!matched) {
            continue;
        }

        LocatedArtifact artifact;
        artifact.path = it->path();
        if (auto parsed = ArtifactName::parse(file_name)) {
            artifact.timestamp = parsed->timestamp;
            artifact.timestamp_from_name = true;
        } else {
            auto utc = lastWriteUtc(artifact.path);
            if (!utc) {
                continue;
            }
            artifact.timestamp = market::SessionClock::toLocal(*utc, market);
            artifact.timestamp_from_name = false;
        }
        found.push_back(std::move(artifact));
    }

    if (ec) {
        LOG_WARN("Artifact scan error in {}: {}", dir.string(), ec.message());
    }

    // 타임스탬프 내림차순, 같으면 경로로 고정 (순회 순서 무관)
    std::sort(found.begin(), found.end(), [](const LocatedArtifact& a, const LocatedArtifact& b) {
        if (a.timestamp != b.timestamp) {
            return a.timestamp > b.timestamp;
        }
        return a.path.string() > b.path.string();
    });
    return found;
}

std::optional<LocatedArtifact> FileArtifactLocator::locate(
    const std::string& ticker, ArtifactKind kind,
    Market market, Timeframe timeframe
) const {
    auto all = listAll(ticker, kind, market, timeframe);
    if (all.empty()) {
        LOG_DEBUG("No {} {} artifact for {} ({})", toString(kind), toCode(timeframe), ticker, toString(market));
        return std::nullopt;
    }
    return all.front();
}

} // namespace storage
} // namespace marketpipe
