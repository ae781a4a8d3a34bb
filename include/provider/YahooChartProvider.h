#pragma once

#include "provider/IMarketDataProvider.h"
#include "network/IHttpClient.h"
#include <memory>

namespace marketpipe {
namespace provider {

// Yahoo chart API (v8) 일봉. 수정주가(adjclose) 기준으로 OHLC 보정
class YahooChartProvider : public IMarketDataProvider {
public:
    explicit YahooChartProvider(std::shared_ptr<network::IHttpClient> http,
                                std::string base_url = "https://query1.finance.yahoo.com");

    std::string name() const override { return "yfinance"; }

    ProviderResult fetchDaily(const std::string& symbol,
                              const boost::gregorian::date& start,
                              const boost::gregorian::date& end) override;

    // chart 응답 JSON -> BarSeries (테스트에서 직접 사용)
    static ProviderResult parseChart(const nlohmann::json& body,
                                     const boost::gregorian::date& start,
                                     const boost::gregorian::date& end);

private:
    std::shared_ptr<network::IHttpClient> http_;
    std::string base_url_;
};

} // namespace provider
} // namespace marketpipe
