#include "storage/ArtifactReader.h"
#include "storage/CsvCodec.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <vector>

namespace marketpipe {
namespace storage {

namespace {
const char* const kEndMetadata = "# End Metadata";

std::string toLowerCopy(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::optional<std::vector<std::string>> readLines(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_WARN("Failed to open artifact: {}", path.string());
        return std::nullopt;
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    // 첫 줄 UTF-8 BOM 제거
    if (!lines.empty() && lines.front().size() >= 3 &&
        static_cast<unsigned char>(lines.front()[0]) == 0xEF &&
        static_cast<unsigned char>(lines.front()[1]) == 0xBB &&
        static_cast<unsigned char>(lines.front()[2]) == 0xBF) {
        lines.front() = lines.front().substr(3);
    }
    return lines;
}

// 헤더 라인 위치: 메타데이터 이후 "Date," 로 시작하는 첫 줄
// 없으면 주석이 아닌 첫 줄
std::optional<size_t> findHeader(const std::vector<std::string>& lines) {
    size_t start = 0;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].rfind(kEndMetadata, 0) == 0) {
            start = i + 1;
            break;
        }
    }
    for (size_t i = start; i < lines.size(); ++i) {
        if (toLowerCopy(CsvCodec::trim(lines[i])).rfind("date,", 0) == 0) {
            return i;
        }
    }
    for (size_t i = start; i < lines.size(); ++i) {
        const std::string trimmed = CsvCodec::trim(lines[i]);
        if (!trimmed.empty() && trimmed.front() != '#') {
            return i;
        }
    }
    return std::nullopt;
}
}

BarSeries ArtifactReader::readBars(const std::filesystem::path& path) {
    BarSeries bars;
    auto lines = readLines(path);
    if (!lines) {
        return bars;
    }

    auto header_index = findHeader(*lines);
    if (!header_index) {
        LOG_WARN("No CSV header in {}", path.string());
        return bars;
    }

    const auto header = CsvCodec::splitLine((*lines)[*header_index]);
    auto columnOf = [&](const std::string& name) -> std::optional<size_t> {
        for (size_t i = 0; i < header.size(); ++i) {
            if (toLowerCopy(header[i]) == name) return i;
        }
        return std::nullopt;
    };

    const auto open_col = columnOf("open");
    const auto high_col = columnOf("high");
    const auto low_col = columnOf("low");
    const auto close_col = columnOf("close");
    const auto volume_col = columnOf("volume");
    if (!open_col || !high_col || !low_col || !close_col || !volume_col) {
        LOG_WARN("Missing OHLCV columns in {}", path.string());
        return bars;
    }

    size_t skipped = 0;
    for (size_t i = *header_index + 1; i < lines->size(); ++i) {
        const std::string& line = (*lines)[i];
        if (CsvCodec::trim(line).empty() || line.front() == '#') {
            continue;
        }
        const auto row = CsvCodec::splitLine(line);
        const size_t needed = std::max({*open_col, *high_col, *low_col, *close_col, *volume_col}) + 1;
        if (row.size() < needed) {
            ++skipped;
            continue;
        }

        auto ts = CsvCodec::parseTimestamp(row[0]);
        auto o = CsvCodec::parseNumber(row[*open_col]);
        auto h = CsvCodec::parseNumber(row[*high_col]);
        auto l = CsvCodec::parseNumber(row[*low_col]);
        auto c = CsvCodec::parseNumber(row[*close_col]);
        auto v = CsvCodec::parseNumber(row[*volume_col]);
        if (!ts || !o || !h || !l || !c || !v) {
            ++skipped;
            continue;
        }
        bars.emplace_back(*ts, *o, *h, *l, *c, *v);
    }

    if (skipped > 0) {
        LOG_WARN("Skipped {} malformed rows in {}", skipped, path.string());
    }
    return bars;
}

IndicatorSeries ArtifactReader::readIndicators(const std::filesystem::path& path) {
    IndicatorSeries series;
    auto lines = readLines(path);
    if (!lines) {
        return series;
    }

    auto header_index = findHeader(*lines);
    if (!header_index) {
        LOG_WARN("No CSV header in {}", path.string());
        return series;
    }

    const auto header = CsvCodec::splitLine((*lines)[*header_index]);
    std::vector<size_t> source_cols;
    for (size_t i = 1; i < header.size(); ++i) {
        if (header[i] == "Date_Index" || header[i] == "Time_Index" || header[i].empty()) {
            continue;
        }
        source_cols.push_back(i);
        series.columns.push_back(header[i]);
    }
    series.values.assign(series.columns.size(), std::vector<double>());

    size_t skipped = 0;
    for (size_t i = *header_index + 1; i < lines->size(); ++i) {
        const std::string& line = (*lines)[i];
        if (CsvCodec::trim(line).empty() || line.front() == '#') {
            continue;
        }
        const auto row = CsvCodec::splitLine(line);
        auto ts = CsvCodec::parseTimestamp(row.empty() ? std::string() : row[0]);
        if (!ts) {
            ++skipped;
            continue;
        }

        std::vector<double> parsed;
        parsed.reserve(source_cols.size());
        bool ok = true;
        for (size_t col : source_cols) {
            auto value = (col < row.size()) ? CsvCodec::parseNumber(row[col]) : std::optional<double>(missingValue());
            if (!value) {
                ok = false;
                break;
            }
            parsed.push_back(*value);
        }
        if (!ok) {
            ++skipped;
            continue;
        }

        series.timestamps.push_back(*ts);
        for (size_t c = 0; c < parsed.size(); ++c) {
            series.values[c].push_back(parsed[c]);
        }
    }

    if (skipped > 0) {
        LOG_WARN("Skipped {} malformed rows in {}", skipped, path.string());
    }
    return series;
}

std::map<std::string, std::string> ArtifactReader::readMetadata(const std::filesystem::path& path) {
    std::map<std::string, std::string> metadata;
    std::ifstream file(path);
    if (!file.is_open()) {
        return metadata;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.rfind(kEndMetadata, 0) == 0) {
            break;
        }
        if (line.rfind("# ", 0) != 0) {
            // 메타데이터 블록이 없는 파일
            if (!CsvCodec::trim(line).empty()) break;
            continue;
        }
        const auto sep = line.find(": ", 2);
        if (sep == std::string::npos) {
            continue;
        }
        metadata[CsvCodec::trim(line.substr(2, sep - 2))] = CsvCodec::trim(line.substr(sep + 2));
    }
    return metadata;
}

std::optional<LatestQuote> ArtifactReader::readLatestQuote(const std::filesystem::path& path) {
    const BarSeries bars = readBars(path);
    if (bars.empty()) {
        return std::nullopt;
    }

    LatestQuote quote;
    quote.timestamp = bars.back().timestamp;
    quote.close = bars.back().close;
    quote.previous_close = bars.size() > 1 ? bars[bars.size() - 2].close : quote.close;
    if (quote.previous_close != 0.0) {
        quote.change_percent = analytics::TechnicalIndicators::roundTo(
            (quote.close - quote.previous_close) / quote.previous_close * 100.0, 2);
    }
    return quote;
}

} // namespace storage
} // namespace marketpipe
