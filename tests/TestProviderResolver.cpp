#include "provider/ProviderResolver.h"
#include "common/Errors.h"

#include <functional>
#include <iostream>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

using namespace marketpipe;
using namespace marketpipe::provider;
using boost::gregorian::date;

namespace {
BarSeries sampleBars(size_t count) {
    BarSeries bars;
    for (size_t i = 0; i < count; ++i) {
        bars.emplace_back(Timestamp(date(2024, 1, 1) + boost::gregorian::days(static_cast<long>(i))),
                          10, 11, 9, 10, 100);
    }
    return bars;
}

// 심볼별로 정해진 결과를 돌려주는 fake. 호출 기록은 calls 에 "name:symbol"
class ScriptedProvider : public IMarketDataProvider {
public:
    ScriptedProvider(std::string name, std::vector<std::string>& calls)
        : name_(std::move(name)), calls_(calls) {}

    std::string name() const override { return name_; }

    ProviderResult fetchDaily(const std::string& symbol, const date&, const date&) override {
        calls_.push_back(name_ + ":" + symbol);
        auto it = script_.find(symbol);
        if (it == script_.end()) {
            return ProviderResult::error("unscripted symbol");
        }
        return it->second();
    }

    void on(const std::string& symbol, std::function<ProviderResult()> fn) { script_[symbol] = std::move(fn); }

private:
    std::string name_;
    std::vector<std::string>& calls_;
    std::map<std::string, std::function<ProviderResult()>> script_;
};

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ",";
        out += item;
    }
    return out;
}

DownloadSettings testSettings() {
    DownloadSettings s;
    s.primary = RetryPolicy{3, std::chrono::milliseconds(5000)};
    s.secondary = RetryPolicy{2, std::chrono::milliseconds(2000)};
    return s;
}
}

int main() {
    const date start(2024, 1, 1);
    const date end(2024, 3, 1);

    std::vector<std::string> calls;
    std::vector<long long> sleeps;
    auto sleeper = [&](std::chrono::milliseconds d) { sleeps.push_back(d.count()); };

    auto yahoo = std::make_shared<ScriptedProvider>("yfinance", calls);
    auto fdr = std::make_shared<ScriptedProvider>("fdr", calls);
    ProviderResolver resolver(yahoo, fdr, testSettings(), sleeper);

    // 계획 순서
    {
        std::vector<std::string> steps;
        for (const auto& step : resolver.plan("005930", Market::KOSPI)) {
            steps.push_back(step.provider->name() + ":" + step.symbol);
        }
        if (join(steps) != "fdr:005930,yfinance:005930.KS,yfinance:005930.KQ") {
            std::cerr << "[TEST] KOSPI plan wrong: " << join(steps) << "\n";
            return 1;
        }
        steps.clear();
        for (const auto& step : resolver.plan("msft", Market::US)) {
            steps.push_back(step.provider->name() + ":" + step.symbol);
        }
        if (join(steps) != "yfinance:MSFT,fdr:MSFT") {
            std::cerr << "[TEST] US plan wrong: " << join(steps) << "\n";
            return 1;
        }
    }

    // KOSDAQ: fdr 빈 결과(재시도 없음) -> .KQ 오류 3회 -> .KS 성공
    {
        fdr->on("000660", [] { return ProviderResult::empty("no rows"); });
        yahoo->on("000660.KQ", [] { return ProviderResult::error("HTTP 500"); });
        yahoo->on("000660.KS", [] { return ProviderResult::success(sampleBars(25)); });

        const BarSeries bars = resolver.download("000660", Market::KOSDAQ, start, end, "000660-test");
        if (bars.size() != 25) {
            std::cerr << "[TEST] expected 25 bars, got " << bars.size() << "\n";
            return 1;
        }
        const std::string expected =
            "fdr:000660,yfinance:000660.KQ,yfinance:000660.KQ,yfinance:000660.KQ,yfinance:000660.KS";
        if (join(calls) != expected) {
            std::cerr << "[TEST] KOSDAQ call order wrong: " << join(calls) << "\n";
            return 1;
        }
        if (sleeps.size() != 2 || sleeps[0] != 5000 || sleeps[1] != 5000) {
            std::cerr << "[TEST] expected two 5s retry delays, got " << sleeps.size() << "\n";
            return 1;
        }
    }

    // 미국: Yahoo 성공이면 보조 호출 없음
    {
        calls.clear();
        sleeps.clear();
        yahoo->on("AAPL", [] { return ProviderResult::success(sampleBars(30)); });
        const BarSeries bars = resolver.download("aapl", Market::US, start, end);
        if (bars.size() != 30 || join(calls) != "yfinance:AAPL" || !sleeps.empty()) {
            std::cerr << "[TEST] US primary success path wrong: " << join(calls) << "\n";
            return 1;
        }
    }

    // 예외는 오류로 취급되어 재시도, 전부 실패하면 DownloadError
    {
        calls.clear();
        sleeps.clear();
        yahoo->on("ZZZZ", []() -> ProviderResult { throw std::runtime_error("connection reset"); });
        fdr->on("ZZZZ", [] { return ProviderResult::error("HTTP 503"); });

        bool threw = false;
        try {
            resolver.download("ZZZZ", Market::US, start, end);
        } catch (const DownloadError& e) {
            threw = true;
            if (std::string(e.what()).find("ZZZZ") == std::string::npos) {
                std::cerr << "[TEST] DownloadError should name the ticker\n";
                return 1;
            }
        }
        if (!threw) {
            std::cerr << "[TEST] exhausted providers must raise DownloadError\n";
            return 1;
        }
        if (calls.size() != 5) {
            std::cerr << "[TEST] expected 3 yahoo + 2 fdr attempts, got " << join(calls) << "\n";
            return 1;
        }
        // Yahoo 재시도 2회(5s) + fdr 재시도 1회(2s)
        if (sleeps.size() != 3 || sleeps[0] != 5000 || sleeps[2] != 2000) {
            std::cerr << "[TEST] retry delays wrong\n";
            return 1;
        }
    }

    // 성공 상태여도 빈 바는 EMPTY
    if (ProviderResult::success(BarSeries{}).status != ProviderStatus::EMPTY ||
        ProviderResult::success(BarSeries{}).ok()) {
        std::cerr << "[TEST] success with no bars must be EMPTY\n";
        return 1;
    }

    std::cout << "[TEST] ProviderResolver PASSED\n";
    return 0;
}
