#include "analytics/IndicatorEngine.h"
#include "analytics/TechnicalIndicators.h"

namespace marketpipe {
namespace analytics {

const std::vector<std::string>& IndicatorEngine::columnNames() {
    static const std::vector<std::string> kColumns = {
        "Close", "Change_Percent",
        "EMA5", "EMA20", "EMA40",
        "MACD", "MACD_Signal", "MACD_Histogram",
        "RSI",
        "Stoch_K", "Stoch_D",
        "BB_Upper", "BB_Middle", "BB_Lower",
        "Ichimoku_Tenkan", "Ichimoku_Kijun", "Ichimoku_Senkou_A", "Ichimoku_Senkou_B",
        "Volume_MA5", "Volume_MA20", "Volume_MA40",
        "Volume_Ratio_5d", "Volume_Ratio_20d", "Volume_Ratio_40d"
    };
    return kColumns;
}

size_t IndicatorEngine::minimumRows(Timeframe timeframe) {
    switch (timeframe) {
        case Timeframe::WEEKLY: return 20;
        case Timeframe::MONTHLY: return 6;
        case Timeframe::DAILY: default: return 50;
    }
}

IndicatorSeries IndicatorEngine::compute(const BarSeries& bars) {
    IndicatorSeries out;
    const size_t n = bars.size();

    std::vector<double> high(n), low(n), close(n), volume(n);
    out.timestamps.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        out.timestamps.push_back(bars[i].timestamp);
        high[i] = bars[i].high;
        low[i] = bars[i].low;
        close[i] = bars[i].close;
        volume[i] = bars[i].volume;
    }

    // 등락률 (첫 행 0)
    std::vector<double> change(n, missingValue());
    for (size_t i = 0; i < n; ++i) {
        if (i == 0) {
            change[i] = 0.0;
        } else if (close[i - 1] != 0.0) {
            change[i] = TechnicalIndicators::roundTo((close[i] - close[i - 1]) / close[i - 1] * 100.0, 2);
        }
    }

    auto macd = TechnicalIndicators::calculateMACDSeries(close, 12, 26, 9);
    auto stoch = TechnicalIndicators::calculateStochasticSeries(high, low, close, 14, 3);
    auto bb = TechnicalIndicators::calculateBollingerSeries(close, 20, 2.0);
    auto ichimoku = TechnicalIndicators::calculateIchimokuSeries(high, low, 9, 26, 52);

    auto volumeRatio = [&](const std::vector<double>& ma) {
        std::vector<double> ratio(n, missingValue());
        for (size_t i = 0; i < n; ++i) {
            if (!isMissing(ma[i]) && ma[i] != 0.0) {
                ratio[i] = TechnicalIndicators::roundTo(volume[i] / ma[i] * 100.0, 2);
            }
        }
        return ratio;
    };
    auto vol_ma5 = TechnicalIndicators::rollingMean(volume, 5);
    auto vol_ma20 = TechnicalIndicators::rollingMean(volume, 20);
    auto vol_ma40 = TechnicalIndicators::rollingMean(volume, 40);
    auto vol_ratio5 = volumeRatio(vol_ma5);
    auto vol_ratio20 = volumeRatio(vol_ma20);
    auto vol_ratio40 = volumeRatio(vol_ma40);

    // columnNames() 순서와 동일하게 추가
    out.addColumn("Close", close);
    out.addColumn("Change_Percent", std::move(change));
    out.addColumn("EMA5", TechnicalIndicators::calculateEMASeries(close, 5));
    out.addColumn("EMA20", TechnicalIndicators::calculateEMASeries(close, 20));
    out.addColumn("EMA40", TechnicalIndicators::calculateEMASeries(close, 40));
    out.addColumn("MACD", std::move(macd.macd));
    out.addColumn("MACD_Signal", std::move(macd.signal));
    out.addColumn("MACD_Histogram", std::move(macd.histogram));
    out.addColumn("RSI", TechnicalIndicators::calculateRSISeries(close, 14));
    out.addColumn("Stoch_K", std::move(stoch.k));
    out.addColumn("Stoch_D", std::move(stoch.d));
    out.addColumn("BB_Upper", std::move(bb.upper));
    out.addColumn("BB_Middle", std::move(bb.middle));
    out.addColumn("BB_Lower", std::move(bb.lower));
    out.addColumn("Ichimoku_Tenkan", std::move(ichimoku.tenkan));
    out.addColumn("Ichimoku_Kijun", std::move(ichimoku.kijun));
    out.addColumn("Ichimoku_Senkou_A", std::move(ichimoku.senkou_a));
    out.addColumn("Ichimoku_Senkou_B", std::move(ichimoku.senkou_b));
    out.addColumn("Volume_MA5", std::move(vol_ma5));
    out.addColumn("Volume_MA20", std::move(vol_ma20));
    out.addColumn("Volume_MA40", std::move(vol_ma40));
    out.addColumn("Volume_Ratio_5d", std::move(vol_ratio5));
    out.addColumn("Volume_Ratio_20d", std::move(vol_ratio20));
    out.addColumn("Volume_Ratio_40d", std::move(vol_ratio40));
    return out;
}

std::map<std::string, double> IndicatorEngine::latestValues(const IndicatorSeries& series) {
    std::map<std::string, double> latest;
    if (series.empty()) {
        return latest;
    }
    const size_t last = series.rows() - 1;
    for (size_t c = 0; c < series.columns.size(); ++c) {
        if (last < series.values[c].size() && !isMissing(series.values[c][last])) {
            latest[series.columns[c]] = series.values[c][last];
        }
    }
    return latest;
}

std::optional<double> IndicatorEngine::latestChangePercent(const IndicatorSeries& series) {
    const auto* change = series.column("Change_Percent");
    if (!change || change->empty() || isMissing(change->back())) {
        return std::nullopt;
    }
    return change->back();
}

} // namespace analytics
} // namespace marketpipe
