#include "market/FreshnessPolicy.h"
#include "storage/ArtifactStore.h"
#include "storage/FileArtifactLocator.h"

#include <filesystem>
#include <fstream>
#include <iostream>

using namespace marketpipe;
using boost::gregorian::date;
using boost::posix_time::ptime;
using boost::posix_time::time_duration;
using market::DataStrategy;

namespace {
class FixedClock : public market::IClock {
public:
    explicit FixedClock(ptime now) : now_(now) {}
    ptime nowUtc() const override { return now_; }
    void set(ptime now) { now_ = now; }
private:
    ptime now_;
};

// KST 현지 시각 -> UTC
ptime kst(int y, int m, int d, int hh, int mm) {
    return ptime(date(y, m, d), time_duration(hh, mm, 0)) - boost::posix_time::hours(9);
}

void touch(const std::filesystem::path& path) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path);
    out << "Date,Open,High,Low,Close,Volume\n";
}
}

int main() {
    const auto root = std::filesystem::temp_directory_path() / "marketpipe_test_freshness";
    std::filesystem::remove_all(root);

    StoreSettings store_settings;
    store_settings.data_root = root.string();

    auto fixed = std::make_shared<FixedClock>(kst(2024, 1, 15, 12, 0));  // 월요일 장중
    auto session = std::make_shared<market::SessionClock>(fixed);
    auto locator = std::make_shared<storage::FileArtifactLocator>(store_settings);
    market::FreshnessPolicy policy(locator, session);

    // 파일 없음
    if (policy.decide("005930", Market::KOSPI) != DataStrategy::DOWNLOAD_FRESH) {
        std::cerr << "[TEST] missing artifact should download\n";
        return 1;
    }

    // 장중 2시간 된 파일 -> 재다운로드
    touch(root / "KOSPI" / "005930_ohlcv_d_20240115_100000_KST.csv");
    if (policy.decide("005930", Market::KOSPI) != DataStrategy::DOWNLOAD_FRESH) {
        std::cerr << "[TEST] 2h old artifact during session should download\n";
        return 1;
    }

    // 30분 된 파일이 최신 -> 재사용
    touch(root / "KOSPI" / "005930_ohlcv_d_20240115_113000_KST.csv");
    if (policy.decide("005930", Market::KOSPI) != DataStrategy::USE_EXISTING) {
        std::cerr << "[TEST] 30min old artifact should be reused\n";
        return 1;
    }
    if (policy.decide("005930.KS", Market::KOSPI) != DataStrategy::USE_EXISTING) {
        std::cerr << "[TEST] suffix variant should see the same artifact\n";
        return 1;
    }

    // 장 마감 후에는 오래된 파일도 재사용
    touch(root / "KOSPI" / "000270_ohlcv_d_20230101_000000_KST.csv");
    fixed->set(kst(2024, 1, 15, 17, 0));
    if (policy.decide("000270", Market::KOSPI) != DataStrategy::USE_EXISTING) {
        std::cerr << "[TEST] closed market should reuse existing artifact\n";
        return 1;
    }

    // 주말 장중 시간대도 휴장
    fixed->set(kst(2024, 1, 13, 11, 0));
    if (policy.decide("000270", Market::KOSPI) != DataStrategy::USE_EXISTING) {
        std::cerr << "[TEST] weekend should reuse existing artifact\n";
        return 1;
    }

    // 페이지 캐시 판단 - 장 마감 후: 오늘 마감 이후 생성만 fresh
    fixed->set(kst(2024, 1, 15, 17, 0));
    if (!policy.isPageFresh(ptime(date(2024, 1, 15), time_duration(15, 40, 0)), Market::KOSPI) ||
        policy.isPageFresh(ptime(date(2024, 1, 15), time_duration(15, 0, 0)), Market::KOSPI)) {
        std::cerr << "[TEST] post-close page freshness wrong\n";
        return 1;
    }

    // 장중: 직전 영업일(금) 마감 이후 생성이면 fresh
    fixed->set(kst(2024, 1, 15, 12, 0));
    if (!policy.isPageFresh(ptime(date(2024, 1, 12), time_duration(16, 0, 0)), Market::KOSPI) ||
        policy.isPageFresh(ptime(date(2024, 1, 12), time_duration(15, 0, 0)), Market::KOSPI)) {
        std::cerr << "[TEST] in-session page freshness wrong\n";
        return 1;
    }

    // 메타데이터 created_at 기반 판단
    {
        auto writer_clock = std::make_shared<market::SessionClock>(
            std::make_shared<FixedClock>(kst(2024, 1, 15, 16, 0)));
        storage::ArtifactStore store(store_settings, writer_clock);

        BarSeries bars;
        for (int i = 0; i < 30; ++i) {
            bars.emplace_back(Timestamp(date(2023, 12, 17) + boost::gregorian::days(i)),
                              10, 11, 9, 10, 100);
        }
        store.saveOhlcv("035720", Market::KOSPI, Timeframe::DAILY, bars);

        fixed->set(kst(2024, 1, 15, 17, 0));
        if (!policy.isArtifactPageFresh("035720", ArtifactKind::OHLCV, Market::KOSPI, Timeframe::DAILY)) {
            std::cerr << "[TEST] artifact created after close should be fresh\n";
            return 1;
        }
        fixed->set(kst(2024, 1, 16, 17, 0));
        if (policy.isArtifactPageFresh("035720", ArtifactKind::OHLCV, Market::KOSPI, Timeframe::DAILY)) {
            std::cerr << "[TEST] artifact from yesterday should be stale after today's close\n";
            return 1;
        }
        if (policy.isArtifactPageFresh("999999", ArtifactKind::OHLCV, Market::KOSPI, Timeframe::DAILY)) {
            std::cerr << "[TEST] missing artifact should be stale\n";
            return 1;
        }

        // 30행 정상 파일은 날짜와 무관하게 사용 가능 (장외 재사용)
        fixed->set(kst(2024, 1, 16, 10, 0));
        if (!policy.hasUsableDailyData("035720", Market::KOSPI)) {
            std::cerr << "[TEST] valid 30-row daily data should be usable\n";
            return 1;
        }

        // 헤더만 있는 파일, 행 수 부족, 파일 없음 -> 사용 불가
        if (policy.hasUsableDailyData("005930", Market::KOSPI)) {
            std::cerr << "[TEST] header-only daily file should not be usable\n";
            return 1;
        }
        store.saveOhlcv("068270", Market::KOSPI, Timeframe::DAILY,
                        BarSeries(bars.begin(), bars.begin() + 3));
        if (policy.hasUsableDailyData("068270", Market::KOSPI)) {
            std::cerr << "[TEST] 3-row daily file should not be usable\n";
            return 1;
        }
        if (policy.hasUsableDailyData("999999", Market::KOSPI)) {
            std::cerr << "[TEST] missing daily file should not be usable\n";
            return 1;
        }
    }

    std::filesystem::remove_all(root);
    std::cout << "[TEST] FreshnessPolicy PASSED\n";
    return 0;
}
