#include "pipeline/ITickerAllowList.h"
#include "common/TickerIdentity.h"

#include <algorithm>

namespace marketpipe {
namespace pipeline {

ConfigTickerAllowList::ConfigTickerAllowList(std::vector<std::string> tickers) {
    for (const auto& t : tickers) {
        const std::string base = TickerIdentity(t).baseCode();
        if (!base.empty()) {
            base_codes_.push_back(base);
        }
    }
}

bool ConfigTickerAllowList::isActive(const std::string& ticker, Market /*market*/) const {
    if (base_codes_.empty()) {
        return true;
    }
    const std::string base = TickerIdentity(ticker).baseCode();
    return std::find(base_codes_.begin(), base_codes_.end(), base) != base_codes_.end();
}

} // namespace pipeline
} // namespace marketpipe
