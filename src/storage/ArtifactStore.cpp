#include "storage/ArtifactStore.h"
#include "storage/ArtifactName.h"
#include "storage/CsvCodec.h"
#include "analytics/TimeframeDeriver.h"
#include "common/TickerIdentity.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <fstream>
#include <functional>
#include <initializer_list>
#include <sstream>
#include <thread>

namespace marketpipe {
namespace storage {

namespace {
Timestamp latestTimestamp(const std::vector<Timestamp>& timestamps) {
    return *std::max_element(timestamps.begin(), timestamps.end());
}

std::vector<Timestamp> timestampsOf(const BarSeries& series) {
    std::vector<Timestamp> out;
    out.reserve(series.size());
    for (const auto& bar : series) {
        out.push_back(bar.timestamp);
    }
    return out;
}

std::string tmpSuffix() {
    std::ostringstream oss;
    oss << std::hash<std::thread::id>{}(std::this_thread::get_id());
    return oss.str();
}
}

ArtifactStore::ArtifactStore(StoreSettings settings, std::shared_ptr<market::SessionClock> clock)
    : settings_(std::move(settings))
    , clock_(clock ? std::move(clock) : std::make_shared<market::SessionClock>())
{
}

std::filesystem::path ArtifactStore::marketDir(Market market) const {
    return std::filesystem::path(settings_.data_root) / toString(market);
}

void ArtifactStore::writeAtomically(const std::filesystem::path& target, const std::string& content) {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
    if (ec) {
        throw StorageError("Cannot create directory " + target.parent_path().string() + ": " + ec.message());
    }

    // 같은 파일명을 동시에 쓰는 경우를 위해 임시파일은 스레드별로 분리
    auto tmp_path = target;
    tmp_path += "." + tmpSuffix() + ".tmp";

    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            throw StorageError("Cannot open temp file " + tmp_path.string());
        }
        out << content;
        out.flush();
        if (!out) {
            out.close();
            std::filesystem::remove(tmp_path, ec);
            throw StorageError("Write failed for " + tmp_path.string());
        }
    }

    std::filesystem::rename(tmp_path, target, ec);
    if (!ec) {
        return;
    }

    // rename 실패 시 copy + remove 로 대체
    ec.clear();
    std::filesystem::copy_file(tmp_path, target,
                               std::filesystem::copy_options::overwrite_existing, ec);
    std::error_code remove_ec;
    std::filesystem::remove(tmp_path, remove_ec);
    if (ec) {
        throw StorageError("Cannot move artifact into place " + target.string() + ": " + ec.message());
    }
}

std::string ArtifactStore::buildMetadata(
    const std::string& header, const std::string& ticker, Market market,
    const std::string& timeframe_label,
    const Timestamp& data_start, const Timestamp& data_end,
    const Timestamp& latest, size_t rows
) const {
    const Timestamp now = clock_->nowLocal(market);

    std::ostringstream oss;
    oss << "# " << header << "\n"
        << "# ticker: " << ticker << "\n"
        << "# market_type: " << toString(market) << "\n"
        << "# timeframe: " << timeframe_label << "\n"
        << "# data_start_date: " << CsvCodec::formatDateTime(data_start) << "\n"
        << "# data_end_date: " << CsvCodec::formatDateTime(data_end) << "\n"
        << "# latest_data_datetime: " << CsvCodec::formatDateTime(latest) << "\n"
        << "# total_rows: " << rows << "\n"
        << "# created_at: " << CsvCodec::formatDateTime(now) << "\n"
        << "# timezone: " << timezoneLabel(market) << "\n"
        << "# current_time: " << CsvCodec::formatDateTime(now) << "\n"
        << "# End Metadata\n"
        << "\n";
    return oss.str();
}

std::string ArtifactStore::saveBarsOnly(
    const std::string& ticker, Market market, Timeframe timeframe,
    const BarSeries& series, const Timestamp& as_of
) {
    const auto timestamps = timestampsOf(series);
    const Timestamp data_start = *std::min_element(timestamps.begin(), timestamps.end());
    const Timestamp data_end = latestTimestamp(timestamps);

    std::ostringstream body;
    body << buildMetadata("OHLCV Data Metadata", ticker, market, toLongName(timeframe),
                          data_start, data_end, data_end, series.size());
    body << "Date,Open,High,Low,Close,Volume,Date_Index,Time_Index\n";
    for (const auto& bar : series) {
        body << CsvCodec::formatTimestamp(bar.timestamp) << ","
             << CsvCodec::formatNumber(bar.open) << ","
             << CsvCodec::formatNumber(bar.high) << ","
             << CsvCodec::formatNumber(bar.low) << ","
             << CsvCodec::formatNumber(bar.close) << ","
             << CsvCodec::formatNumber(bar.volume) << ","
             << CsvCodec::formatDate(bar.timestamp) << ","
             << CsvCodec::formatTime(bar.timestamp) << "\n";
    }

    ArtifactName name;
    name.ticker = ticker;
    name.kind = ArtifactKind::OHLCV;
    name.timeframe = timeframe;
    name.timestamp = as_of;
    name.tz_label = timezoneLabel(market);

    const auto path = marketDir(market) / name.fileName();
    writeAtomically(path, body.str());
    LOG_INFO("Saved {} rows -> {}", series.size(), path.string());
    return path.string();
}

SavedOhlcv ArtifactStore::saveOhlcv(
    const std::string& ticker, Market market, Timeframe timeframe,
    const BarSeries& series, const std::optional<Timestamp>& as_of
) {
    if (series.empty()) {
        throw StorageError("Refusing to save empty OHLCV series for " + ticker);
    }

    const std::string canonical = TickerIdentity(ticker).ticker();
    const Timestamp naming = as_of ? *as_of : latestTimestamp(timestampsOf(series));

    SavedOhlcv saved;
    saved.path = saveBarsOnly(canonical, market, timeframe, series, naming);
    saved.rows = series.size();

    if (timeframe != Timeframe::DAILY) {
        return saved;
    }

    // 일봉 저장 시 주봉/월봉 자동 파생 (지표 계산은 오케스트레이터 담당)
    for (Timeframe target : {Timeframe::WEEKLY, Timeframe::MONTHLY}) {
        const BarSeries derived = analytics::TimeframeDeriver::resample(series, target);
        if (derived.empty()) {
            LOG_INFO("{} {}: not enough daily rows for {} bars ({})",
                     canonical, toString(market), toLongName(target), series.size());
            continue;
        }
        try {
            const std::string path = saveBarsOnly(canonical, market, target, derived, naming);
            if (target == Timeframe::WEEKLY) {
                saved.weekly_path = path;
                saved.weekly_rows = derived.size();
            } else {
                saved.monthly_path = path;
                saved.monthly_rows = derived.size();
            }
        } catch (const StorageError& e) {
            // 일봉은 이미 저장됨. 파생 실패는 다음 실행에서 재생성
            LOG_WARN("{} {}: {} save failed: {}", canonical, toString(market), toLongName(target), e.what());
        }
    }
    return saved;
}

std::string ArtifactStore::saveIndicators(
    const std::string& ticker, Market market, Timeframe timeframe,
    const IndicatorSeries& series, const std::optional<Timestamp>& as_of,
    ArtifactKind kind
) {
    if (series.empty()) {
        throw StorageError("Refusing to save empty " + toString(kind) + " series for " + ticker);
    }
    for (const auto& col : series.values) {
        if (col.size() != series.rows()) {
            throw StorageError("Malformed " + toString(kind) + " frame for " + ticker);
        }
    }

    const std::string canonical = TickerIdentity(ticker).ticker();
    const Timestamp data_start = *std::min_element(series.timestamps.begin(), series.timestamps.end());
    const Timestamp data_end = latestTimestamp(series.timestamps);
    const Timestamp naming = as_of ? *as_of : data_end;

    const std::string header = (kind == ArtifactKind::INDICATORS)
        ? "Indicators Data Metadata" : "CrossInfo Data Metadata";

    std::ostringstream body;
    body << buildMetadata(header, canonical, market,
                          toString(kind) + "_" + toCode(timeframe),
                          data_start, data_end, data_end, series.rows());
    body << "Date";
    for (const auto& name : series.columns) {
        body << "," << name;
    }
    body << "\n";
    for (size_t row = 0; row < series.rows(); ++row) {
        body << CsvCodec::formatTimestamp(series.timestamps[row]);
        for (const auto& col : series.values) {
            body << "," << CsvCodec::formatNumber(col[row]);
        }
        body << "\n";
    }

    ArtifactName name;
    name.ticker = canonical;
    name.kind = kind;
    name.timeframe = timeframe;
    name.timestamp = naming;
    name.tz_label = timezoneLabel(market);

    const auto path = marketDir(market) / name.fileName();
    writeAtomically(path, body.str());
    LOG_INFO("Saved {} {} rows -> {}", series.rows(), toString(kind), path.string());
    return path.string();
}

} // namespace storage
} // namespace marketpipe
