#include "provider/YahooChartProvider.h"
#include "common/Logger.h"

#include <cmath>

namespace marketpipe {
namespace provider {

namespace {
long long epochSeconds(const boost::gregorian::date& d) {
    static const boost::posix_time::ptime kEpoch(boost::gregorian::date(1970, 1, 1));
    return (boost::posix_time::ptime(d) - kEpoch).total_seconds();
}

bool readNumber(const nlohmann::json& arr, size_t i, double& out) {
    if (!arr.is_array() || i >= arr.size() || !arr[i].is_number()) {
        return false;
    }
    out = arr[i].get<double>();
    return std::isfinite(out);
}
}

YahooChartProvider::YahooChartProvider(std::shared_ptr<network::IHttpClient> http, std::string base_url)
    : http_(std::move(http))
    , base_url_(std::move(base_url))
{
}

ProviderResult YahooChartProvider::fetchDaily(
    const std::string& symbol,
    const boost::gregorian::date& start,
    const boost::gregorian::date& end
) {
    std::map<std::string, std::string> params;
    params["period1"] = std::to_string(epochSeconds(start));
    // period2 는 배타 구간
    params["period2"] = std::to_string(epochSeconds(end + boost::gregorian::days(1)));
    params["interval"] = "1d";
    params["events"] = "history";
    params["includeAdjustedClose"] = "true";

    network::HttpResponse response;
    try {
        response = http_->get(base_url_ + "/v8/finance/chart/" + symbol, params);
    } catch (const std::exception& e) {
        return ProviderResult::error(e.what());
    }

    if (response.isNotFound()) {
        return ProviderResult::empty("symbol not found: " + symbol);
    }
    if (!response.isSuccess()) {
        return ProviderResult::error("HTTP " + std::to_string(response.status_code));
    }

    try {
        return parseChart(response.json(), start, end);
    } catch (const nlohmann::json::exception& e) {
        return ProviderResult::error(std::string("invalid chart response: ") + e.what());
    }
}

ProviderResult YahooChartProvider::parseChart(
    const nlohmann::json& body,
    const boost::gregorian::date& start,
    const boost::gregorian::date& end
) {
    const auto& chart = body.at("chart");
    if (chart.contains("error") && !chart["error"].is_null()) {
        const std::string code = chart["error"].value("code", std::string());
        const std::string desc = chart["error"].value("description", std::string());
        if (code == "Not Found") {
            return ProviderResult::empty(desc);
        }
        return ProviderResult::error(code + ": " + desc);
    }

    const auto& results = chart.at("result");
    if (!results.is_array() || results.empty()) {
        return ProviderResult::empty("no result");
    }
    const auto& result = results[0];
    if (!result.contains("timestamp") || !result["timestamp"].is_array()) {
        return ProviderResult::empty("no timestamps");
    }

    const long long gmtoffset = result.contains("meta") ? result["meta"].value("gmtoffset", 0LL) : 0LL;
    const auto& timestamps = result["timestamp"];
    if (!result.contains("indicators") || !result["indicators"].contains("quote") ||
        !result["indicators"]["quote"].is_array() || result["indicators"]["quote"].empty()) {
        return ProviderResult::empty("no quote");
    }
    const auto& indicators = result["indicators"];
    const auto& quote = indicators["quote"][0];
    // 가격 필드가 빠진 quote ({}) 도 있으므로 const operator[] 대신 value()
    const nlohmann::json opens = quote.value("open", nlohmann::json());
    const nlohmann::json highs = quote.value("high", nlohmann::json());
    const nlohmann::json lows = quote.value("low", nlohmann::json());
    const nlohmann::json closes = quote.value("close", nlohmann::json());
    const nlohmann::json volumes = quote.value("volume", nlohmann::json());

    nlohmann::json adjclose;
    if (indicators.contains("adjclose") && indicators["adjclose"].is_array() &&
        !indicators["adjclose"].empty()) {
        adjclose = indicators["adjclose"][0].value("adjclose", nlohmann::json());
    }

    BarSeries bars;
    bars.reserve(timestamps.size());
    for (size_t i = 0; i < timestamps.size(); ++i) {
        if (!timestamps[i].is_number()) {
            continue;
        }
        double o = 0, h = 0, l = 0, c = 0, v = 0;
        if (!readNumber(opens, i, o) || !readNumber(highs, i, h) ||
            !readNumber(lows, i, l) || !readNumber(closes, i, c) ||
            !readNumber(volumes, i, v)) {
            // 거래 정지 등으로 비어 있는 행
            continue;
        }

        // 수정주가 보정 (auto adjust)
        double adj = 0;
        if (readNumber(adjclose, i, adj) && c != 0.0) {
            const double factor = adj / c;
            o *= factor;
            h *= factor;
            l *= factor;
            c = adj;
        }

        const auto local = boost::posix_time::from_time_t(
            static_cast<std::time_t>(timestamps[i].get<long long>() + gmtoffset));
        const auto day = local.date();
        if (day < start || day > end) {
            continue;
        }
        bars.emplace_back(Timestamp(day), o, h, l, c, v);
    }

    return ProviderResult::success(std::move(bars));
}

} // namespace provider
} // namespace marketpipe
