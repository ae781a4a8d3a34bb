#include "provider/FinanceDataProvider.h"
#include "storage/CsvCodec.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

namespace marketpipe {
namespace provider {

namespace {
const char* const kNaverChartUrl = "https://fchart.stock.naver.com/sise.nhn";
const char* const kStooqUrl = "https://stooq.com/q/d/l/";

std::string compactDate(const boost::gregorian::date& d) {
    return boost::gregorian::to_iso_string(d);  // YYYYMMDD
}

bool inRange(const boost::gregorian::date& d,
             const boost::gregorian::date& start, const boost::gregorian::date& end) {
    return !(d < start) && !(d > end);
}

// BRK.B -> brk-b.us
std::string stooqSymbol(const std::string& symbol) {
    std::string s = symbol;
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    std::replace(s.begin(), s.end(), '.', '-');
    return s + ".us";
}
}

FinanceDataProvider::FinanceDataProvider(std::shared_ptr<network::IHttpClient> http)
    : http_(std::move(http))
{
}

bool FinanceDataProvider::isKrxCode(const std::string& symbol) {
    return symbol.size() == 6 &&
           std::all_of(symbol.begin(), symbol.end(), [](unsigned char c) { return std::isdigit(c); });
}

ProviderResult FinanceDataProvider::fetchDaily(
    const std::string& symbol,
    const boost::gregorian::date& start,
    const boost::gregorian::date& end
) {
    try {
        if (isKrxCode(symbol)) {
            return fetchNaver(symbol, start, end);
        }
        return fetchStooq(symbol, start, end);
    } catch (const std::exception& e) {
        return ProviderResult::error(e.what());
    }
}

ProviderResult FinanceDataProvider::fetchNaver(
    const std::string& code,
    const boost::gregorian::date& start,
    const boost::gregorian::date& end
) {
    // fchart 는 최신 N개를 반환하므로 오늘까지의 달력 일수로 넉넉히 요청
    const auto today = boost::gregorian::day_clock::universal_day() + boost::gregorian::days(1);
    const auto last = (end > today) ? end : today;
    const long count = std::max<long>(1, (last - start).days() + 1);

    std::map<std::string, std::string> params;
    params["symbol"] = code;
    params["timeframe"] = "day";
    params["count"] = std::to_string(count);
    params["requestType"] = "0";

    const auto response = http_->get(kNaverChartUrl, params);
    if (!response.isSuccess()) {
        return ProviderResult::error("HTTP " + std::to_string(response.status_code));
    }

    BarSeries bars = parseNaverChart(response.body, start, end);
    if (bars.empty()) {
        return ProviderResult::empty("no rows for " + code);
    }
    return ProviderResult::success(std::move(bars));
}

ProviderResult FinanceDataProvider::fetchStooq(
    const std::string& symbol,
    const boost::gregorian::date& start,
    const boost::gregorian::date& end
) {
    std::map<std::string, std::string> params;
    params["s"] = stooqSymbol(symbol);
    params["i"] = "d";
    params["d1"] = compactDate(start);
    params["d2"] = compactDate(end);

    const auto response = http_->get(kStooqUrl, params);
    if (!response.isSuccess()) {
        return ProviderResult::error("HTTP " + std::to_string(response.status_code));
    }

    BarSeries bars = parseStooqCsv(response.body, start, end);
    if (bars.empty()) {
        return ProviderResult::empty("no rows for " + symbol);
    }
    return ProviderResult::success(std::move(bars));
}

BarSeries FinanceDataProvider::parseNaverChart(
    const std::string& xml,
    const boost::gregorian::date& start,
    const boost::gregorian::date& end
) {
    static const std::regex kItem("<item\\s+data=\"([^\"]+)\"");

    BarSeries bars;
    for (auto it = std::sregex_iterator(xml.begin(), xml.end(), kItem); it != std::sregex_iterator(); ++it) {
        std::vector<std::string> fields;
        std::stringstream ss((*it)[1].str());
        std::string field;
        while (std::getline(ss, field, '|')) {
            fields.push_back(field);
        }
        if (fields.size() < 6 || fields[0].size() != 8) {
            continue;
        }

        boost::gregorian::date day;
        try {
            day = boost::gregorian::from_undelimited_string(fields[0]);
        } catch (const std::exception&) {
            continue;
        }
        if (!inRange(day, start, end)) {
            continue;
        }

        double values[5];
        bool ok = true;
        for (size_t i = 0; i < 5; ++i) {
            auto parsed = storage::CsvCodec::parseNumber(fields[i + 1]);
            if (!parsed || isMissing(*parsed)) {
                ok = false;
                break;
            }
            values[i] = *parsed;
        }
        if (!ok) {
            continue;
        }
        bars.emplace_back(Timestamp(day), values[0], values[1], values[2], values[3], values[4]);
    }
    return bars;
}

BarSeries FinanceDataProvider::parseStooqCsv(
    const std::string& csv,
    const boost::gregorian::date& start,
    const boost::gregorian::date& end
) {
    BarSeries bars;
    std::istringstream in(csv);
    std::string line;
    bool header = true;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (header) {
            // "No data" 응답은 헤더가 없음
            if (line.rfind("Date,", 0) != 0) {
                return bars;
            }
            header = false;
            continue;
        }

        const auto cells = storage::CsvCodec::splitLine(line);
        if (cells.size() < 6) {
            continue;
        }
        auto ts = storage::CsvCodec::parseTimestamp(cells[0]);
        if (!ts || !inRange(ts->date(), start, end)) {
            continue;
        }

        double values[5];
        bool ok = true;
        for (size_t i = 0; i < 5; ++i) {
            auto parsed = storage::CsvCodec::parseNumber(cells[i + 1]);
            if (!parsed || isMissing(*parsed)) {
                ok = false;
                break;
            }
            values[i] = *parsed;
        }
        if (!ok) {
            continue;
        }
        bars.emplace_back(Timestamp(ts->date()), values[0], values[1], values[2], values[3], values[4]);
    }
    return bars;
}

} // namespace provider
} // namespace marketpipe
