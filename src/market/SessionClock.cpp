#include "market/SessionClock.h"

#include <iomanip>
#include <sstream>

namespace marketpipe {
namespace market {

namespace {
std::string formatHourMinute(int hour, int minute) {
    std::ostringstream oss;
    oss << std::setw(2) << std::setfill('0') << hour << ":"
        << std::setw(2) << std::setfill('0') << minute;
    return oss.str();
}
}

std::string toString(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::PRE: return "pre";
        case SessionPhase::OPEN: return "open";
        case SessionPhase::POST: default: return "post";
    }
}

SessionClock::SessionClock(std::shared_ptr<IClock> clock)
    : clock_(clock ? std::move(clock) : std::make_shared<SystemClock>())
{
}

boost::local_time::time_zone_ptr SessionClock::zoneFor(Market market) {
    // Boost posix_time_zone 은 오프셋 부호가 POSIX 표준과 반대 (UTC 기준 그대로)
    static const boost::local_time::time_zone_ptr kSeoul(
        new boost::local_time::posix_time_zone("KST+09"));
    static const boost::local_time::time_zone_ptr kNewYork(
        new boost::local_time::posix_time_zone("EST-05EDT,M3.2.0,M11.1.0"));
    return isKoreanMarket(market) ? kSeoul : kNewYork;
}

TradingHours SessionClock::tradingHours(Market market) {
    if (isKoreanMarket(market)) {
        return TradingHours{9, 0, 15, 30};
    }
    return TradingHours{9, 30, 16, 0};
}

std::pair<std::string, std::string> SessionClock::marketHours(Market market) {
    const TradingHours hours = tradingHours(market);
    return {formatHourMinute(hours.open_hour, hours.open_minute),
            formatHourMinute(hours.close_hour, hours.close_minute)};
}

Timestamp SessionClock::toLocal(const boost::posix_time::ptime& utc, Market market) {
    boost::local_time::local_date_time ldt(utc, zoneFor(market));
    return ldt.local_time();
}

boost::posix_time::ptime SessionClock::toUtc(const Timestamp& local, Market market) {
    auto zone = zoneFor(market);
    boost::local_time::local_date_time ldt(
        local.date(), local.time_of_day(), zone,
        boost::local_time::local_date_time::NOT_DATE_TIME_ON_ERROR);
    if (ldt.is_not_a_date_time()) {
        // DST 전환 구간(없는 시각/중복 시각)은 표준시 오프셋으로 환산
        return local - zone->base_utc_offset();
    }
    return ldt.utc_time();
}

Timestamp SessionClock::nowLocal(Market market) const {
    return toLocal(clock_->nowUtc(), market);
}

boost::gregorian::date SessionClock::currentDate(Market market) const {
    return nowLocal(market).date();
}

SessionPhase SessionClock::phaseAt(const Timestamp& local, Market market) {
    const TradingHours hours = tradingHours(market);
    const auto tod = local.time_of_day();
    if (tod < hours.openTime()) {
        return SessionPhase::PRE;
    }
    if (tod <= hours.closeTime()) {
        return SessionPhase::OPEN;
    }
    return SessionPhase::POST;
}

bool SessionClock::isWeekend(const boost::gregorian::date& d) {
    const auto dow = d.day_of_week().as_number();  // 0 = Sunday
    return dow == 0 || dow == 6;
}

bool SessionClock::isOpenAt(const Timestamp& local, Market market) {
    if (isWeekend(local.date())) {
        return false;
    }
    return phaseAt(local, market) == SessionPhase::OPEN;
}

Timestamp SessionClock::previousBusinessCloseAt(const Timestamp& local, Market market) {
    boost::gregorian::date day = local.date() - boost::gregorian::days(1);
    while (isWeekend(day)) {
        day -= boost::gregorian::days(1);
    }
    return Timestamp(day, tradingHours(market).closeTime());
}

SessionPhase SessionClock::phase(Market market) const {
    return phaseAt(nowLocal(market), market);
}

bool SessionClock::isOpen(Market market) const {
    return isOpenAt(nowLocal(market), market);
}

Timestamp SessionClock::todayClose(Market market) const {
    return Timestamp(currentDate(market), tradingHours(market).closeTime());
}

Timestamp SessionClock::previousBusinessClose(Market market) const {
    return previousBusinessCloseAt(nowLocal(market), market);
}

} // namespace market
} // namespace marketpipe
