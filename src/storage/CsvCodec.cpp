#include "storage/CsvCodec.h"

#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <locale>
#include <regex>
#include <sstream>

namespace marketpipe {
namespace storage {

namespace {
std::string formatWithPrecision(double value, int precision) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::setprecision(precision) << value;
    return oss.str();
}

std::string twoDigits(long v) {
    std::ostringstream oss;
    oss << std::setw(2) << std::setfill('0') << v;
    return oss.str();
}
}

std::string CsvCodec::formatNumber(double value) {
    if (isMissing(value)) {
        return "";
    }
    std::string text = formatWithPrecision(value, 15);
    if (std::strtod(text.c_str(), nullptr) != value) {
        text = formatWithPrecision(value, 17);
    }
    return text;
}

std::string CsvCodec::formatDate(const Timestamp& ts) {
    const auto d = ts.date();
    std::ostringstream oss;
    oss << std::setw(4) << std::setfill('0') << static_cast<int>(d.year()) << "-"
        << twoDigits(d.month().as_number()) << "-" << twoDigits(d.day());
    return oss.str();
}

std::string CsvCodec::formatTime(const Timestamp& ts) {
    const auto tod = ts.time_of_day();
    return twoDigits(tod.hours()) + ":" + twoDigits(tod.minutes()) + ":" + twoDigits(tod.seconds());
}

std::string CsvCodec::formatDateTime(const Timestamp& ts) {
    return formatDate(ts) + " " + formatTime(ts);
}

std::string CsvCodec::formatTimestamp(const Timestamp& ts) {
    if (ts.time_of_day() == boost::posix_time::time_duration(0, 0, 0)) {
        return formatDate(ts);
    }
    return formatDateTime(ts);
}

std::optional<Timestamp> CsvCodec::parseTimestamp(const std::string& text) {
    static const std::regex kPattern(
        R"(^\s*(\d{4})-(\d{1,2})-(\d{1,2})(?:[ T](\d{1,2}):(\d{2})(?::(\d{2}))?)?)");
    std::smatch m;
    if (!std::regex_search(text, m, kPattern)) {
        return std::nullopt;
    }
    try {
        boost::gregorian::date d(std::stoi(m[1]), std::stoi(m[2]), std::stoi(m[3]));
        boost::posix_time::time_duration tod(0, 0, 0);
        if (m[4].matched) {
            const int h = std::stoi(m[4]);
            const int mi = std::stoi(m[5]);
            const int s = m[6].matched ? std::stoi(m[6]) : 0;
            if (h > 23 || mi > 59 || s > 59) {
                return std::nullopt;
            }
            tod = boost::posix_time::time_duration(h, mi, s);
        }
        return Timestamp(d, tod);
    } catch (const std::out_of_range&) {
        // 존재하지 않는 날짜 (2월 30일 등)
        return std::nullopt;
    }
}

std::optional<double> CsvCodec::parseNumber(const std::string& text) {
    const std::string s = trim(text);
    if (s.empty()) {
        return missingValue();
    }
    const char* begin = s.c_str();
    char* end = nullptr;
    const double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0') {
        return std::nullopt;
    }
    return value;
}

std::vector<std::string> CsvCodec::splitLine(const std::string& line) {
    std::vector<std::string> cells;
    std::string cell;
    std::stringstream ss(line);
    while (std::getline(ss, cell, ',')) {
        cell = trim(std::move(cell));
        if (cell.size() >= 2 && cell.front() == '"' && cell.back() == '"') {
            cell = cell.substr(1, cell.size() - 2);
        }
        cells.push_back(cell);
    }
    // "a,b," 처럼 끝이 빈 셀이면 getline이 버리므로 보충
    if (!line.empty() && line.back() == ',') {
        cells.emplace_back();
    }
    return cells;
}

std::string CsvCodec::trim(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.erase(s.begin());
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.pop_back();
    }
    return s;
}

} // namespace storage
} // namespace marketpipe
