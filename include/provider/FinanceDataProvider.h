#pragma once

#include "provider/IMarketDataProvider.h"
#include "network/IHttpClient.h"
#include <memory>

namespace marketpipe {
namespace provider {

// 보조 프로바이더
// 6자리 한국 종목코드 -> Naver fchart (XML), 그 외 -> Stooq 일봉 CSV
class FinanceDataProvider : public IMarketDataProvider {
public:
    explicit FinanceDataProvider(std::shared_ptr<network::IHttpClient> http);

    std::string name() const override { return "fdr"; }

    ProviderResult fetchDaily(const std::string& symbol,
                              const boost::gregorian::date& start,
                              const boost::gregorian::date& end) override;

    // <item data="YYYYMMDD|o|h|l|c|v" /> 목록 파싱
    static BarSeries parseNaverChart(const std::string& xml,
                                     const boost::gregorian::date& start,
                                     const boost::gregorian::date& end);

    // "Date,Open,High,Low,Close,Volume" CSV 파싱
    static BarSeries parseStooqCsv(const std::string& csv,
                                   const boost::gregorian::date& start,
                                   const boost::gregorian::date& end);

    static bool isKrxCode(const std::string& symbol);

private:
    ProviderResult fetchNaver(const std::string& code,
                              const boost::gregorian::date& start,
                              const boost::gregorian::date& end);
    ProviderResult fetchStooq(const std::string& symbol,
                              const boost::gregorian::date& start,
                              const boost::gregorian::date& end);

    std::shared_ptr<network::IHttpClient> http_;
};

} // namespace provider
} // namespace marketpipe
