#include "storage/ArtifactName.h"

#include <iomanip>
#include <regex>
#include <sstream>

namespace marketpipe {
namespace storage {

std::string ArtifactName::fileName() const {
    const auto d = timestamp.date();
    const auto tod = timestamp.time_of_day();

    std::ostringstream oss;
    oss << ticker << "_" << toString(kind) << "_" << toCode(timeframe) << "_"
        << std::setfill('0')
        << std::setw(4) << static_cast<int>(d.year())
        << std::setw(2) << d.month().as_number()
        << std::setw(2) << d.day().as_number() << "_"
        << std::setw(2) << tod.hours()
        << std::setw(2) << tod.minutes()
        << std::setw(2) << tod.seconds() << "_"
        << tz_label << ".csv";
    return oss.str();
}

std::optional<ArtifactName> ArtifactName::parse(const std::string& file_name) {
    static const std::regex kPattern(
        R"(^(.+?)_(ohlcv|indicators|crossinfo)_(d|w|m)_(\d{4})(\d{2})(\d{2})_(\d{2})(\d{2})(\d{2})_(KST|EST)\.csv$)",
        std::regex::icase);

    std::smatch m;
    if (!std::regex_match(file_name, m, kPattern)) {
        return std::nullopt;
    }

    auto kind = parseArtifactKind(m[2].str());
    auto timeframe = parseTimeframe(m[3].str());
    if (!kind || !timeframe) {
        return std::nullopt;
    }

    try {
        const int hh = std::stoi(m[7]);
        const int mi = std::stoi(m[8]);
        const int ss = std::stoi(m[9]);
        if (hh > 23 || mi > 59 || ss > 59) {
            return std::nullopt;
        }

        ArtifactName name;
        name.ticker = m[1].str();
        name.kind = *kind;
        name.timeframe = *timeframe;
        name.timestamp = Timestamp(
            boost::gregorian::date(std::stoi(m[4]), std::stoi(m[5]), std::stoi(m[6])),
            boost::posix_time::time_duration(hh, mi, ss));
        name.tz_label = m[10].str();
        return name;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace storage
} // namespace marketpipe
