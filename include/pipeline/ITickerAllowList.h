#pragma once

#include "common/Types.h"
#include <string>
#include <vector>

namespace marketpipe {
namespace pipeline {

// 처리 대상 종목 필터 (예: 활성 종목만)
class ITickerAllowList {
public:
    virtual ~ITickerAllowList() = default;

    virtual bool isActive(const std::string& ticker, Market market) const = 0;
};

// config 의 pipeline.active_tickers 기반. 목록이 비어 있으면 전부 허용
// 005930 과 005930.KS 는 같은 종목으로 취급
class ConfigTickerAllowList : public ITickerAllowList {
public:
    explicit ConfigTickerAllowList(std::vector<std::string> tickers);

    bool isActive(const std::string& ticker, Market market) const override;

private:
    std::vector<std::string> base_codes_;
};

} // namespace pipeline
} // namespace marketpipe
