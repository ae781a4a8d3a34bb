#pragma once

#include <boost/date_time/posix_time/posix_time.hpp>

namespace marketpipe {
namespace market {

// 현재 시각 공급자 (테스트에서 고정 시각 주입)
class IClock {
public:
    virtual ~IClock() = default;

    virtual boost::posix_time::ptime nowUtc() const = 0;
};

class SystemClock : public IClock {
public:
    boost::posix_time::ptime nowUtc() const override {
        return boost::posix_time::second_clock::universal_time();
    }
};

} // namespace market
} // namespace marketpipe
