#pragma once

#include "common/Types.h"
#include <string>
#include <vector>

namespace marketpipe {

// 종목 코드 별칭 규칙 (6자리 코드 <-> .KS/.KQ)은 여기서만 다룬다
class TickerIdentity {
public:
    explicit TickerIdentity(const std::string& raw_ticker);

    const std::string& ticker() const { return ticker_; }

    // .KS / .KQ 접미사 제거한 코드
    std::string baseCode() const;
    bool hasExchangeSuffix() const;
    bool isNumericCode() const;

    // 접미사, 숫자 코드, 시장 중 하나라도 한국이면 true
    bool isKorean(Market market) const;

    // 로케이터용 파일명 후보. 먼저 나온 것이 우선
    std::vector<std::string> candidates(Market market) const;

    // Yahoo 스타일 심볼 후보 (KOSDAQ: .KQ 먼저, KOSPI: .KS 먼저)
    std::vector<std::string> yahooSymbols(Market market) const;

    // 보조 프로바이더용 심볼 (한국은 6자리 코드)
    std::string secondarySymbol(Market market) const;

private:
    std::string ticker_;
};

} // namespace marketpipe
