#pragma once

#include <string>
#include <vector>
#include <limits>
#include <cmath>
#include <optional>
#include <boost/date_time/posix_time/posix_time.hpp>

namespace marketpipe {

// 시장 현지 기준 naive 시각 (타임존 정보 없음)
using Timestamp = boost::posix_time::ptime;
using Price = double;
using Volume = double;

enum class Market { US, KOSPI, KOSDAQ };
enum class Timeframe { DAILY, WEEKLY, MONTHLY };
enum class ArtifactKind { OHLCV, INDICATORS, CROSSINFO };

// 한 기간의 OHLCV
struct Bar {
    Timestamp timestamp;
    Price open;
    Price high;
    Price low;
    Price close;
    Volume volume;

    Bar() : open(0), high(0), low(0), close(0), volume(0) {}

    Bar(const Timestamp& t, double o, double h, double l, double c, double v)
        : timestamp(t), open(o), high(h), low(l), close(c), volume(v) {}
};

// timestamp 오름차순, 중복 없음 (QualityGate 통과 후 기준)
using BarSeries = std::vector<Bar>;

// 결측값은 NaN
inline double missingValue() { return std::numeric_limits<double>::quiet_NaN(); }
inline bool isMissing(double v) { return std::isnan(v); }

// Bar 1행당 1행, 컬럼 순서 유지
struct IndicatorSeries {
    std::vector<Timestamp> timestamps;
    std::vector<std::string> columns;
    std::vector<std::vector<double>> values;  // values[column][row]

    size_t rows() const { return timestamps.size(); }
    bool empty() const { return timestamps.empty(); }

    void addColumn(const std::string& name, std::vector<double> data);
    const std::vector<double>* column(const std::string& name) const;
};

std::string toString(Market market);
// KOSPI / KOSDAQ / US (NASDAQ, NYSE, AMEX 포함). 그 외는 nullopt
std::optional<Market> parseMarket(const std::string& text);
bool isKoreanMarket(Market market);
// 파일명/메타데이터용 타임존 라벨 (KST / EST)
std::string timezoneLabel(Market market);

std::string toCode(Timeframe timeframe);       // d / w / m
std::string toLongName(Timeframe timeframe);   // daily / weekly / monthly
std::optional<Timeframe> parseTimeframe(const std::string& text);

std::string toString(ArtifactKind kind);
std::optional<ArtifactKind> parseArtifactKind(const std::string& text);

} // namespace marketpipe
