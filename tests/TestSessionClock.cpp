#include "market/SessionClock.h"

#include <iostream>
#include <memory>

using namespace marketpipe;
using boost::gregorian::date;
using boost::posix_time::ptime;
using boost::posix_time::time_duration;

namespace {
class FixedClock : public market::IClock {
public:
    explicit FixedClock(ptime now) : now_(now) {}
    ptime nowUtc() const override { return now_; }
    void set(ptime now) { now_ = now; }
private:
    ptime now_;
};
}

int main() {
    auto fixed = std::make_shared<FixedClock>(ptime(date(2024, 1, 15), time_duration(1, 0, 0)));
    market::SessionClock clock(fixed);

    // 2024-01-15 (월) 01:00 UTC = 10:00 KST
    if (clock.nowLocal(Market::KOSPI) != ptime(date(2024, 1, 15), time_duration(10, 0, 0))) {
        std::cerr << "[TEST] KST conversion wrong: " << clock.nowLocal(Market::KOSPI) << "\n";
        return 1;
    }
    if (!clock.isOpen(Market::KOSPI) || clock.phase(Market::KOSDAQ) != market::SessionPhase::OPEN) {
        std::cerr << "[TEST] KOSPI should be open at 10:00 KST\n";
        return 1;
    }

    // 07:00 UTC = 16:00 KST -> 장 마감 후
    fixed->set(ptime(date(2024, 1, 15), time_duration(7, 0, 0)));
    if (clock.isOpen(Market::KOSPI) || clock.phase(Market::KOSPI) != market::SessionPhase::POST) {
        std::cerr << "[TEST] KOSPI should be post-close at 16:00 KST\n";
        return 1;
    }
    if (clock.todayClose(Market::KOSPI) != ptime(date(2024, 1, 15), time_duration(15, 30, 0))) {
        std::cerr << "[TEST] todayClose wrong\n";
        return 1;
    }

    // 일요일 20:00 UTC = 월요일 05:00 KST
    fixed->set(ptime(date(2024, 1, 14), time_duration(20, 0, 0)));
    if (clock.currentDate(Market::KOSPI) != date(2024, 1, 15) ||
        clock.phase(Market::KOSPI) != market::SessionPhase::PRE) {
        std::cerr << "[TEST] date rollover across UTC midnight wrong\n";
        return 1;
    }

    // 토요일은 시간대와 무관하게 휴장
    fixed->set(ptime(date(2024, 1, 13), time_duration(1, 0, 0)));
    if (clock.isOpen(Market::KOSPI)) {
        std::cerr << "[TEST] Saturday must be closed\n";
        return 1;
    }

    // 미국: 서머타임 (EDT, UTC-4)
    fixed->set(ptime(date(2024, 7, 15), time_duration(14, 0, 0)));
    if (clock.nowLocal(Market::US) != ptime(date(2024, 7, 15), time_duration(10, 0, 0)) ||
        !clock.isOpen(Market::US)) {
        std::cerr << "[TEST] US summer time conversion wrong: " << clock.nowLocal(Market::US) << "\n";
        return 1;
    }

    // 미국: 표준시 (EST, UTC-5) 09:00 -> 개장 전
    fixed->set(ptime(date(2024, 1, 15), time_duration(14, 0, 0)));
    if (clock.phase(Market::US) != market::SessionPhase::PRE) {
        std::cerr << "[TEST] US winter 09:00 should be pre-open\n";
        return 1;
    }

    if (market::SessionClock::toUtc(ptime(date(2024, 7, 15), time_duration(10, 0, 0)), Market::US) !=
        ptime(date(2024, 7, 15), time_duration(14, 0, 0))) {
        std::cerr << "[TEST] toUtc summer wrong\n";
        return 1;
    }
    if (market::SessionClock::toUtc(ptime(date(2024, 1, 15), time_duration(10, 0, 0)), Market::US) !=
        ptime(date(2024, 1, 15), time_duration(15, 0, 0))) {
        std::cerr << "[TEST] toUtc winter wrong\n";
        return 1;
    }

    // 월요일의 직전 영업일은 금요일
    const auto prev = market::SessionClock::previousBusinessCloseAt(
        ptime(date(2024, 1, 15), time_duration(10, 0, 0)), Market::KOSPI);
    if (prev != ptime(date(2024, 1, 12), time_duration(15, 30, 0))) {
        std::cerr << "[TEST] previous business close should be Friday 15:30, got " << prev << "\n";
        return 1;
    }

    const auto hours = market::SessionClock::marketHours(Market::US);
    if (hours.first != "09:30" || hours.second != "16:00") {
        std::cerr << "[TEST] US market hours wrong\n";
        return 1;
    }

    std::cout << "[TEST] SessionClock PASSED\n";
    return 0;
}
