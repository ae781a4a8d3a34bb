#include "storage/ArtifactStore.h"
#include "storage/ArtifactReader.h"
#include "analytics/IndicatorEngine.h"
#include "common/Errors.h"

#include <cmath>
#include <filesystem>
#include <iostream>

using namespace marketpipe;
using boost::gregorian::date;
using boost::posix_time::ptime;
using boost::posix_time::time_duration;

namespace {
class FixedClock : public market::IClock {
public:
    explicit FixedClock(ptime now) : now_(now) {}
    ptime nowUtc() const override { return now_; }
private:
    ptime now_;
};

BarSeries weekdays(const date& start, int count) {
    BarSeries bars;
    date d = start;
    int i = 0;
    while (static_cast<int>(bars.size()) < count) {
        const int dow = d.day_of_week().as_number();
        if (dow != 0 && dow != 6) {
            bars.emplace_back(Timestamp(d), 100.0 + i, 110.0 + i, 90.0 + i, 105.0 + i, 1000.5 + i);
            ++i;
        }
        d += boost::gregorian::days(1);
    }
    return bars;
}
}

int main() {
    const auto root = std::filesystem::temp_directory_path() / "marketpipe_test_store";
    std::filesystem::remove_all(root);

    StoreSettings settings;
    settings.data_root = root.string();

    // 2024-02-26 01:00 UTC = 10:00 KST
    auto session = std::make_shared<market::SessionClock>(
        std::make_shared<FixedClock>(ptime(date(2024, 2, 26), time_duration(1, 0, 0))));
    storage::ArtifactStore store(settings, session);

    // 1월 평일 23일 + 2월 17일, 마지막 바 2024-02-23
    const BarSeries daily = weekdays(date(2024, 1, 1), 40);
    const auto saved = store.saveOhlcv("005930.ks", Market::KOSPI, Timeframe::DAILY, daily);

    const auto daily_path = std::filesystem::path(saved.path);
    if (daily_path.filename() != "005930.KS_ohlcv_d_20240223_000000_KST.csv" ||
        daily_path.parent_path().filename() != "KOSPI") {
        std::cerr << "[TEST] unexpected daily path: " << saved.path << "\n";
        return 1;
    }
    if (std::filesystem::path(saved.weekly_path).filename() != "005930.KS_ohlcv_w_20240223_000000_KST.csv" ||
        std::filesystem::path(saved.monthly_path).filename() != "005930.KS_ohlcv_m_20240223_000000_KST.csv") {
        std::cerr << "[TEST] derived artifacts should share the daily timestamp\n";
        return 1;
    }
    if (saved.rows != 40 || saved.monthly_rows != 2 || saved.weekly_rows == 0) {
        std::cerr << "[TEST] row counts wrong\n";
        return 1;
    }

    // 본문 왕복
    const BarSeries loaded = storage::ArtifactReader::readBars(saved.path);
    if (loaded.size() != daily.size()) {
        std::cerr << "[TEST] round trip row count " << loaded.size() << "\n";
        return 1;
    }
    for (size_t i = 0; i < loaded.size(); ++i) {
        if (loaded[i].timestamp != daily[i].timestamp || loaded[i].close != daily[i].close ||
            loaded[i].volume != daily[i].volume) {
            std::cerr << "[TEST] round trip mismatch at row " << i << "\n";
            return 1;
        }
    }

    // 메타데이터
    const auto meta = storage::ArtifactReader::readMetadata(saved.path);
    if (meta.count("ticker") == 0 || meta.at("ticker") != "005930.KS" ||
        meta.at("market_type") != "KOSPI" || meta.at("total_rows") != "40" ||
        meta.at("timezone") != "KST" || meta.at("created_at") != "2024-02-26 10:00:00" ||
        meta.at("data_end_date") != "2024-02-23 00:00:00") {
        std::cerr << "[TEST] metadata header wrong\n";
        return 1;
    }

    const auto quote = storage::ArtifactReader::readLatestQuote(saved.path);
    if (!quote || quote->close != 144.0 || quote->previous_close != 143.0 || quote->change_percent != 0.7) {
        std::cerr << "[TEST] latest quote wrong\n";
        return 1;
    }

    // 지표 테이블 왕복 (NaN 은 빈 셀)
    {
        const auto indicators = analytics::IndicatorEngine::compute(loaded);
        const std::string path = store.saveIndicators("005930.KS", Market::KOSPI, Timeframe::DAILY, indicators);
        if (std::filesystem::path(path).filename() != "005930.KS_indicators_d_20240223_000000_KST.csv") {
            std::cerr << "[TEST] unexpected indicator path: " << path << "\n";
            return 1;
        }
        const auto read_back = storage::ArtifactReader::readIndicators(path);
        if (read_back.rows() != indicators.rows() || read_back.columns != indicators.columns) {
            std::cerr << "[TEST] indicator round trip shape mismatch\n";
            return 1;
        }
        const auto* ema20 = read_back.column("EMA20");
        if (!ema20 || !isMissing((*ema20)[0]) || isMissing(ema20->back()) ||
            std::abs(ema20->back() - indicators.column("EMA20")->back()) > 1e-9) {
            std::cerr << "[TEST] indicator values not preserved\n";
            return 1;
        }
    }

    // as_of 지정: 파생 저장이 없는 단일 파일
    {
        const Timestamp as_of(date(2024, 2, 23), time_duration(15, 30, 0));
        const BarSeries weekly = storage::ArtifactReader::readBars(saved.weekly_path);
        const auto w = store.saveOhlcv("005930.KS", Market::KOSPI, Timeframe::WEEKLY, weekly, as_of);
        if (std::filesystem::path(w.path).filename() != "005930.KS_ohlcv_w_20240223_153000_KST.csv" ||
            !w.weekly_path.empty() || !w.monthly_path.empty()) {
            std::cerr << "[TEST] as_of naming wrong: " << w.path << "\n";
            return 1;
        }
    }

    // 데이터 부족 시 파생 파일 없음
    {
        const auto few = store.saveOhlcv("AAPL", Market::US, Timeframe::DAILY, weekdays(date(2024, 1, 1), 5));
        if (!few.weekly_path.empty() || !few.monthly_path.empty() ||
            std::filesystem::path(few.path).filename() != "AAPL_ohlcv_d_20240105_000000_EST.csv") {
            std::cerr << "[TEST] short series should save daily only\n";
            return 1;
        }
    }

    // 빈 시리즈는 StorageError
    bool threw = false;
    try {
        store.saveOhlcv("AAPL", Market::US, Timeframe::DAILY, BarSeries{});
    } catch (const StorageError&) {
        threw = true;
    }
    if (!threw) {
        std::cerr << "[TEST] empty series must raise StorageError\n";
        return 1;
    }

    // 임시파일이 남지 않아야 함
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        if (entry.path().extension() == ".tmp") {
            std::cerr << "[TEST] leftover temp file: " << entry.path() << "\n";
            return 1;
        }
    }

    std::filesystem::remove_all(root);
    std::cout << "[TEST] ArtifactStore PASSED\n";
    return 0;
}
