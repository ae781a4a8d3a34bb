#include "common/TickerIdentity.h"

#include <algorithm>
#include <cctype>

namespace marketpipe {

namespace {
std::string trimCopy(std::string s) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
    s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
    return s;
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool allDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(),
                                     [](unsigned char c) { return std::isdigit(c) != 0; });
}

void pushUnique(std::vector<std::string>& out, const std::string& value) {
    if (value.empty()) return;
    if (std::find(out.begin(), out.end(), value) == out.end()) {
        out.push_back(value);
    }
}
}

TickerIdentity::TickerIdentity(const std::string& raw_ticker)
    : ticker_(trimCopy(raw_ticker))
{
    std::transform(ticker_.begin(), ticker_.end(), ticker_.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
}

std::string TickerIdentity::baseCode() const {
    if (hasExchangeSuffix()) {
        return ticker_.substr(0, ticker_.size() - 3);
    }
    return ticker_;
}

bool TickerIdentity::hasExchangeSuffix() const {
    return endsWith(ticker_, ".KS") || endsWith(ticker_, ".KQ");
}

bool TickerIdentity::isNumericCode() const {
    return allDigits(baseCode());
}

bool TickerIdentity::isKorean(Market market) const {
    return hasExchangeSuffix() || allDigits(ticker_) || isKoreanMarket(market);
}

std::vector<std::string> TickerIdentity::candidates(Market market) const {
    std::vector<std::string> out;
    pushUnique(out, ticker_);
    if (!isKoreanMarket(market)) {
        return out;
    }

    const std::string base = baseCode();
    pushUnique(out, base);
    if (market == Market::KOSDAQ) {
        pushUnique(out, base + ".KQ");
        pushUnique(out, base + ".KS");
    } else {
        pushUnique(out, base + ".KS");
        pushUnique(out, base + ".KQ");
    }
    return out;
}

std::vector<std::string> TickerIdentity::yahooSymbols(Market market) const {
    if (!isKorean(market) || hasExchangeSuffix()) {
        return {ticker_};
    }
    const std::string base = baseCode();
    if (market == Market::KOSDAQ) {
        return {base + ".KQ", base + ".KS"};
    }
    return {base + ".KS", base + ".KQ"};
}

std::string TickerIdentity::secondarySymbol(Market market) const {
    if (isKorean(market)) {
        return baseCode();
    }
    return ticker_;
}

} // namespace marketpipe
