#include "common/Types.h"

#include <algorithm>
#include <cctype>

namespace marketpipe {

namespace {
std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
}

void IndicatorSeries::addColumn(const std::string& name, std::vector<double> data) {
    data.resize(timestamps.size(), missingValue());
    columns.push_back(name);
    values.push_back(std::move(data));
}

const std::vector<double>* IndicatorSeries::column(const std::string& name) const {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i] == name) {
            return &values[i];
        }
    }
    return nullptr;
}

std::string toString(Market market) {
    switch (market) {
        case Market::KOSPI: return "KOSPI";
        case Market::KOSDAQ: return "KOSDAQ";
        case Market::US: default: return "US";
    }
}

std::optional<Market> parseMarket(const std::string& text) {
    const std::string lower = toLowerCopy(text);
    if (lower == "kospi") return Market::KOSPI;
    if (lower == "kosdaq") return Market::KOSDAQ;
    if (lower == "us" || lower == "nasdaq" || lower == "nyse" || lower == "amex") return Market::US;
    return std::nullopt;
}

bool isKoreanMarket(Market market) {
    return market == Market::KOSPI || market == Market::KOSDAQ;
}

std::string timezoneLabel(Market market) {
    return isKoreanMarket(market) ? "KST" : "EST";
}

std::string toCode(Timeframe timeframe) {
    switch (timeframe) {
        case Timeframe::WEEKLY: return "w";
        case Timeframe::MONTHLY: return "m";
        case Timeframe::DAILY: default: return "d";
    }
}

std::string toLongName(Timeframe timeframe) {
    switch (timeframe) {
        case Timeframe::WEEKLY: return "weekly";
        case Timeframe::MONTHLY: return "monthly";
        case Timeframe::DAILY: default: return "daily";
    }
}

std::optional<Timeframe> parseTimeframe(const std::string& text) {
    const std::string lower = toLowerCopy(text);
    if (lower == "d" || lower == "daily") return Timeframe::DAILY;
    if (lower == "w" || lower == "weekly") return Timeframe::WEEKLY;
    if (lower == "m" || lower == "monthly") return Timeframe::MONTHLY;
    return std::nullopt;
}

std::string toString(ArtifactKind kind) {
    switch (kind) {
        case ArtifactKind::INDICATORS: return "indicators";
        case ArtifactKind::CROSSINFO: return "crossinfo";
        case ArtifactKind::OHLCV: default: return "ohlcv";
    }
}

std::optional<ArtifactKind> parseArtifactKind(const std::string& text) {
    const std::string lower = toLowerCopy(text);
    if (lower == "ohlcv") return ArtifactKind::OHLCV;
    if (lower == "indicators") return ArtifactKind::INDICATORS;
    if (lower == "crossinfo") return ArtifactKind::CROSSINFO;
    return std::nullopt;
}

} // namespace marketpipe
