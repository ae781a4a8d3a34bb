#include "pipeline/PipelineOrchestrator.h"
#include "storage/FileArtifactLocator.h"
#include "storage/ArtifactReader.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace marketpipe;
using boost::gregorian::date;
using boost::posix_time::ptime;
using boost::posix_time::time_duration;
namespace fs = std::filesystem;

namespace {
class FixedClock : public market::IClock {
public:
    explicit FixedClock(ptime now) : now_(now) {}
    ptime nowUtc() const override { return now_; }
private:
    ptime now_;
};

class FakeProvider : public provider::IMarketDataProvider {
public:
    FakeProvider(std::string name, std::vector<std::string>& calls) : name_(std::move(name)), calls_(calls) {}

    std::string name() const override { return name_; }

    provider::ProviderResult fetchDaily(const std::string& symbol, const date&, const date&) override {
        calls_.push_back(name_ + ":" + symbol);
        auto it = bars_.find(symbol);
        if (it == bars_.end()) {
            return provider::ProviderResult::error("HTTP 503");
        }
        return provider::ProviderResult::success(it->second);
    }

    std::map<std::string, BarSeries> bars_;

private:
    std::string name_;
    std::vector<std::string>& calls_;
};

// last 에서 거꾸로 평일 count 개 (오름차순 반환)
BarSeries weekdaysEnding(const date& last, int count) {
    BarSeries bars;
    date d = last;
    while (static_cast<int>(bars.size()) < count) {
        const int dow = d.day_of_week().as_number();
        if (dow != 0 && dow != 6) {
            const double base = 100.0 + (bars.size() % 7);
            bars.emplace_back(Timestamp(d), base, base + 2.0, base - 2.0, base + 0.5, 1000.0 + bars.size());
        }
        d -= boost::gregorian::days(1);
    }
    std::reverse(bars.begin(), bars.end());
    return bars;
}

size_t fileCount(const fs::path& dir) {
    if (!fs::exists(dir)) return 0;
    return static_cast<size_t>(std::distance(fs::directory_iterator(dir), fs::directory_iterator()));
}
}

int main() {
    const auto root = fs::temp_directory_path() / "marketpipe_test_orchestrator";
    fs::remove_all(root);

    StoreSettings store_settings;
    store_settings.data_root = root.string();

    // 2024-03-04 (월) 22:00 UTC = 17:00 EST (장 마감 후) = 03-05 07:00 KST (개장 전)
    auto session = std::make_shared<market::SessionClock>(
        std::make_shared<FixedClock>(ptime(date(2024, 3, 4), time_duration(22, 0, 0))));
    auto locator = std::make_shared<storage::FileArtifactLocator>(store_settings);
    auto store = std::make_shared<storage::ArtifactStore>(store_settings, session);
    auto freshness = std::make_shared<market::FreshnessPolicy>(locator, session);

    std::vector<std::string> calls;
    auto yahoo = std::make_shared<FakeProvider>("yfinance", calls);
    auto fdr = std::make_shared<FakeProvider>("fdr", calls);
    auto resolver = std::make_shared<provider::ProviderResolver>(
        yahoo, fdr, DownloadSettings(), [](std::chrono::milliseconds) {});

    PipelineSettings pipeline_settings;
    pipeline_settings.min_validation_rows = 20;
    pipeline::PipelineOrchestrator orchestrator(freshness, resolver, store, locator, session, pipeline_settings);

    // 1. 파일 없음 -> 다운로드 -> d/w/m + 지표 3종
    BarSeries aapl = weekdaysEnding(date(2024, 3, 1), 150);
    aapl.push_back(aapl[10]);                  // 중복 행 (정리 대상)
    aapl[20].close = aapl[20].high + 1.0;      // close 범위 이탈 (보정 대상)
    yahoo->bars_["AAPL"] = aapl;

    auto first = orchestrator.processTicker("aapl", Market::US);
    if (!first.success || first.skipped || first.strategy != market::DataStrategy::DOWNLOAD_FRESH) {
        std::cerr << "[TEST] download path failed: " << first.summary() << "\n";
        return 1;
    }
    if (fs::path(first.daily_path).filename() != "AAPL_ohlcv_d_20240301_000000_EST.csv" ||
        first.weekly_path.empty() || first.monthly_path.empty() || first.daily_rows != 150) {
        std::cerr << "[TEST] unexpected OHLCV outputs: " << first.daily_path << " rows=" << first.daily_rows << "\n";
        return 1;
    }
    if (first.indicators_succeeded != 3 || first.indicators_total != 3 || first.indicator_paths.size() != 3) {
        std::cerr << "[TEST] expected 3/3 indicator tables: " << first.summary() << "\n";
        return 1;
    }
    if (fs::path(first.indicator_paths[Timeframe::WEEKLY]).filename() != "AAPL_indicators_w_20240301_000000_EST.csv") {
        std::cerr << "[TEST] derived indicators should share the daily timestamp\n";
        return 1;
    }
    {
        const BarSeries saved = storage::ArtifactReader::readBars(first.daily_path);
        for (const auto& bar : saved) {
            if (bar.close > bar.high || bar.close < bar.low) {
                std::cerr << "[TEST] saved close outside [low, high]\n";
                return 1;
            }
        }
    }
    if (calls.size() != 1 || calls[0] != "yfinance:AAPL") {
        std::cerr << "[TEST] US download should hit yahoo once\n";
        return 1;
    }
    if (first.trace_id.rfind("AAPL-", 0) != 0 || first.trace_id.size() != 13) {
        std::cerr << "[TEST] trace id format wrong: " << first.trace_id << "\n";
        return 1;
    }

    // 2. 장 마감 후 재실행 -> 기존 파일 재사용, 프로바이더 호출 없음, 새 파일 없음
    const size_t files_before = fileCount(root / "US");
    auto second = orchestrator.processTicker("AAPL", Market::US);
    if (!second.success || second.strategy != market::DataStrategy::USE_EXISTING) {
        std::cerr << "[TEST] use-existing path failed: " << second.summary() << "\n";
        return 1;
    }
    if (calls.size() != 1 || fileCount(root / "US") != files_before) {
        std::cerr << "[TEST] use-existing must not download or rewrite artifacts\n";
        return 1;
    }
    if (second.daily_path != first.daily_path || second.indicators_succeeded != 3) {
        std::cerr << "[TEST] use-existing should report existing artifacts\n";
        return 1;
    }

    // 2-1. 장외라도 깨진 일봉 파일은 재다운로드
    {
        std::ofstream(first.daily_path, std::ios::trunc) << "garbage\n";
        calls.clear();
        auto corrupt = orchestrator.processTicker("AAPL", Market::US);
        if (!corrupt.success || corrupt.strategy != market::DataStrategy::DOWNLOAD_FRESH) {
            std::cerr << "[TEST] corrupt daily file should trigger download: " << corrupt.summary() << "\n";
            return 1;
        }
        if (calls.size() != 1 || corrupt.daily_rows != 150 ||
            storage::ArtifactReader::readBars(corrupt.daily_path).size() != 150) {
            std::cerr << "[TEST] corrupt daily file should be replaced by a fresh download\n";
            return 1;
        }
    }

    // 2-2. 행 수가 부족한 일봉 파일도 재다운로드
    {
        store->saveOhlcv("IBM", Market::US, Timeframe::DAILY, weekdaysEnding(date(2024, 3, 1), 3));
        yahoo->bars_["IBM"] = weekdaysEnding(date(2024, 3, 1), 150);
        calls.clear();
        auto short_daily = orchestrator.processTicker("IBM", Market::US);
        if (!short_daily.success || short_daily.strategy != market::DataStrategy::DOWNLOAD_FRESH ||
            short_daily.daily_rows != 150) {
            std::cerr << "[TEST] 3-row daily file should trigger download: " << short_daily.summary() << "\n";
            return 1;
        }
        if (calls.size() != 1 || calls[0] != "yfinance:IBM") {
            std::cerr << "[TEST] short daily file should be refreshed from yahoo\n";
            return 1;
        }
    }

    // 3. 모든 프로바이더 실패 -> download 단계
    calls.clear();
    auto failed = orchestrator.processTicker("ZZZZ", Market::US);
    if (failed.success || failed.failed_stage != pipeline::ProcessingStage::DOWNLOAD || failed.error.empty()) {
        std::cerr << "[TEST] expected download failure: " << failed.summary() << "\n";
        return 1;
    }
    if (calls.size() != 6) {
        std::cerr << "[TEST] expected 3 attempts per provider, got " << calls.size() << "\n";
        return 1;
    }
    if (fs::exists(root / "US" / "ZZZZ_ohlcv_d_20240301_000000_EST.csv")) {
        std::cerr << "[TEST] failed download must not write artifacts\n";
        return 1;
    }

    // 4. 행 수 부족 -> validation 단계
    yahoo->bars_["TINY"] = weekdaysEnding(date(2024, 3, 1), 5);
    auto invalid = orchestrator.processTicker("TINY", Market::US);
    if (invalid.success || invalid.failed_stage != pipeline::ProcessingStage::VALIDATION) {
        std::cerr << "[TEST] expected validation failure: " << invalid.summary() << "\n";
        return 1;
    }

    // 5. 한국 종목: fdr 실패 -> Yahoo .KQ
    calls.clear();
    yahoo->bars_["000660.KQ"] = weekdaysEnding(date(2024, 3, 4), 80);
    auto korean = orchestrator.processTicker("000660", Market::KOSDAQ);
    if (!korean.success) {
        std::cerr << "[TEST] korean fallback failed: " << korean.summary() << "\n";
        return 1;
    }
    if (calls.empty() || calls.front() != "fdr:000660" || calls.back() != "yfinance:000660.KQ") {
        std::cerr << "[TEST] korean provider order wrong\n";
        return 1;
    }
    if (fs::path(korean.daily_path).filename() != "000660_ohlcv_d_20240304_000000_KST.csv" ||
        fs::path(korean.daily_path).parent_path().filename() != "KOSDAQ") {
        std::cerr << "[TEST] korean artifact path wrong: " << korean.daily_path << "\n";
        return 1;
    }
    // 80 평일 -> 주봉 17개, 월봉 5개: 일봉 지표만 계산
    if (korean.indicators_total != 3 || korean.indicators_succeeded != 1 ||
        korean.indicator_paths.count(Timeframe::DAILY) != 1 ||
        korean.indicator_paths.count(Timeframe::WEEKLY) != 0 ||
        korean.indicator_paths.count(Timeframe::MONTHLY) != 0) {
        std::cerr << "[TEST] partial indicator success expected: " << korean.summary() << "\n";
        return 1;
    }

    // 6. 비활성 종목은 건너뜀
    {
        auto allow = std::make_shared<pipeline::ConfigTickerAllowList>(std::vector<std::string>{"AAPL", "005930.KS"});
        pipeline::PipelineOrchestrator filtered(freshness, resolver, store, locator, session,
                                                pipeline_settings, 5, allow);
        calls.clear();
        auto skipped = filtered.processTicker("MSFT", Market::US);
        if (!skipped.success || !skipped.skipped || !calls.empty()) {
            std::cerr << "[TEST] inactive ticker should be skipped without downloads\n";
            return 1;
        }
        if (!allow->isActive("005930", Market::KOSPI) || !allow->isActive("aapl", Market::US)) {
            std::cerr << "[TEST] allow list should match base codes\n";
            return 1;
        }
    }

    // 7. ensureIndicators: 지워진 주봉/지표 재생성
    {
        store->saveOhlcv("MSFT", Market::US, Timeframe::DAILY, weekdaysEnding(date(2024, 3, 1), 150));
        fs::remove(root / "US" / "MSFT_ohlcv_w_20240301_000000_EST.csv");

        calls.clear();
        auto ensured = orchestrator.ensureIndicators("MSFT", Market::US);
        if (!ensured.success || !calls.empty()) {
            std::cerr << "[TEST] ensureIndicators failed: " << ensured.summary() << "\n";
            return 1;
        }
        if (!fs::exists(root / "US" / "MSFT_ohlcv_w_20240301_000000_EST.csv") ||
            ensured.indicators_succeeded != 3) {
            std::cerr << "[TEST] weekly OHLCV and indicators should be regenerated\n";
            return 1;
        }

        auto missing = orchestrator.ensureIndicators("NVDA", Market::US);
        if (missing.success || missing.failed_stage != pipeline::ProcessingStage::EXISTING_PROCESS) {
            std::cerr << "[TEST] ensureIndicators without daily data should fail in existing_process\n";
            return 1;
        }
    }

    fs::remove_all(root);
    std::cout << "[TEST] PipelineOrchestrator PASSED\n";
    return 0;
}
