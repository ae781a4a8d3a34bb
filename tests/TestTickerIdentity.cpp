#include "common/TickerIdentity.h"
#include "common/Types.h"

#include <iostream>
#include <string>
#include <vector>

using marketpipe::Market;
using marketpipe::TickerIdentity;

namespace {
std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ",";
        out += item;
    }
    return out;
}
}

int main() {
    {
        TickerIdentity id(" 005930.ks ");
        if (id.ticker() != "005930.KS" || id.baseCode() != "005930" || !id.hasExchangeSuffix()) {
            std::cerr << "[TEST] normalization failed: " << id.ticker() << " / " << id.baseCode() << "\n";
            return 1;
        }
        if (!id.isNumericCode()) {
            std::cerr << "[TEST] 005930.KS should be a numeric code\n";
            return 1;
        }
    }

    {
        const auto cands = TickerIdentity("000660").candidates(Market::KOSDAQ);
        if (join(cands) != "000660,000660.KQ,000660.KS") {
            std::cerr << "[TEST] KOSDAQ candidates: " << join(cands) << "\n";
            return 1;
        }
    }

    {
        const auto cands = TickerIdentity("005930.KS").candidates(Market::KOSPI);
        if (join(cands) != "005930.KS,005930,005930.KQ") {
            std::cerr << "[TEST] KOSPI suffixed candidates: " << join(cands) << "\n";
            return 1;
        }
    }

    {
        const auto cands = TickerIdentity("aapl").candidates(Market::US);
        if (join(cands) != "AAPL") {
            std::cerr << "[TEST] US candidates: " << join(cands) << "\n";
            return 1;
        }
    }

    // Yahoo 심볼 순서는 시장 기준
    if (join(TickerIdentity("000660").yahooSymbols(Market::KOSDAQ)) != "000660.KQ,000660.KS") {
        std::cerr << "[TEST] KOSDAQ yahoo order wrong\n";
        return 1;
    }
    if (join(TickerIdentity("005930").yahooSymbols(Market::KOSPI)) != "005930.KS,005930.KQ") {
        std::cerr << "[TEST] KOSPI yahoo order wrong\n";
        return 1;
    }
    if (join(TickerIdentity("005930.KQ").yahooSymbols(Market::KOSPI)) != "005930.KQ") {
        std::cerr << "[TEST] explicit suffix should be kept as-is\n";
        return 1;
    }

    if (TickerIdentity("005930.KS").secondarySymbol(Market::KOSPI) != "005930") {
        std::cerr << "[TEST] secondary symbol should be the 6-digit code\n";
        return 1;
    }
    if (TickerIdentity("BRK.B").secondarySymbol(Market::US) != "BRK.B") {
        std::cerr << "[TEST] US secondary symbol should be unchanged\n";
        return 1;
    }

    // 숫자 코드는 시장 라벨이 US 여도 한국 종목
    if (!TickerIdentity("005930").isKorean(Market::US) || TickerIdentity("AAPL").isKorean(Market::US)) {
        std::cerr << "[TEST] isKorean classification wrong\n";
        return 1;
    }

    if (marketpipe::parseMarket("kosdaq") != Market::KOSDAQ || marketpipe::parseMarket("NASDAQ") != Market::US ||
        marketpipe::parseMarket("us") != Market::US) {
        std::cerr << "[TEST] parseMarket failed\n";
        return 1;
    }
    // 오타는 US 로 흘러가지 않아야 함
    if (marketpipe::parseMarket("KOSPII").has_value() || marketpipe::parseMarket("").has_value()) {
        std::cerr << "[TEST] unknown market should not parse\n";
        return 1;
    }
    if (marketpipe::timezoneLabel(Market::KOSPI) != "KST" || marketpipe::timezoneLabel(Market::US) != "EST") {
        std::cerr << "[TEST] timezoneLabel failed\n";
        return 1;
    }

    std::cout << "[TEST] TickerIdentity PASSED\n";
    return 0;
}
