#pragma once

#include "common/Types.h"
#include "market/IClock.h"
#include <boost/date_time/local_time/local_time.hpp>
#include <memory>
#include <string>
#include <utility>

namespace marketpipe {
namespace market {

enum class SessionPhase { PRE, OPEN, POST };

std::string toString(SessionPhase phase);

// 장 운영 시간 (현지 기준)
struct TradingHours {
    int open_hour;
    int open_minute;
    int close_hour;
    int close_minute;

    boost::posix_time::time_duration openTime() const {
        return boost::posix_time::hours(open_hour) + boost::posix_time::minutes(open_minute);
    }
    boost::posix_time::time_duration closeTime() const {
        return boost::posix_time::hours(close_hour) + boost::posix_time::minutes(close_minute);
    }
};

// Session Clock - 시장별 현지 시각과 장 단계 계산
// 휴장일 캘린더는 없음 (주말만 제외)
class SessionClock {
public:
    explicit SessionClock(std::shared_ptr<IClock> clock = nullptr);

    // 현재 현지 시각
    Timestamp nowLocal(Market market) const;
    boost::gregorian::date currentDate(Market market) const;

    SessionPhase phase(Market market) const;
    // 평일 + OPEN 단계일 때만 true
    bool isOpen(Market market) const;

    // 오늘 장 마감 시각 (현지)
    Timestamp todayClose(Market market) const;
    // 직전 영업일 장 마감 시각 (현지)
    Timestamp previousBusinessClose(Market market) const;

    // 순수 계산 버전
    static SessionPhase phaseAt(const Timestamp& local, Market market);
    static bool isOpenAt(const Timestamp& local, Market market);
    static Timestamp previousBusinessCloseAt(const Timestamp& local, Market market);
    static bool isWeekend(const boost::gregorian::date& d);

    static TradingHours tradingHours(Market market);
    // {"09:00", "15:30"}
    static std::pair<std::string, std::string> marketHours(Market market);

    // UTC <-> 현지 변환
    static Timestamp toLocal(const boost::posix_time::ptime& utc, Market market);
    static boost::posix_time::ptime toUtc(const Timestamp& local, Market market);

private:
    static boost::local_time::time_zone_ptr zoneFor(Market market);

    std::shared_ptr<IClock> clock_;
};

} // namespace market
} // namespace marketpipe
