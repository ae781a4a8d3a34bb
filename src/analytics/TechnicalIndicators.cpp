#include "analytics/TechnicalIndicators.h"
#include <algorithm>
#include <cmath>

namespace marketpipe {
namespace analytics {

namespace {
// 창 [i-window+1, i] 에 NaN 없이 꽉 찼는지
bool windowReady(const std::vector<double>& values, size_t i, int window) {
    if (window <= 0 || i + 1 < static_cast<size_t>(window)) {
        return false;
    }
    for (size_t j = i + 1 - window; j <= i; ++j) {
        if (isMissing(values[j])) return false;
    }
    return true;
}
}

std::vector<double> TechnicalIndicators::exponentialMean(
    const std::vector<double>& values,
    double alpha,
    int min_periods
) {
    std::vector<double> out(values.size(), missingValue());
    double mean = missingValue();
    int observations = 0;

    for (size_t i = 0; i < values.size(); ++i) {
        const double x = values[i];
        if (!isMissing(x)) {
            if (isMissing(mean)) {
                mean = x;  // 첫 유효값으로 시작
            } else {
                mean = (1.0 - alpha) * mean + alpha * x;
            }
            ++observations;
        }
        if (observations >= min_periods && !isMissing(mean)) {
            out[i] = mean;
        }
    }
    return out;
}

std::vector<double> TechnicalIndicators::calculateEMASeries(const std::vector<double>& prices, int period) {
    return exponentialMean(prices, 2.0 / (period + 1.0), period);
}

std::vector<double> TechnicalIndicators::rollingMean(const std::vector<double>& values, int window) {
    std::vector<double> out(values.size(), missingValue());
    for (size_t i = 0; i < values.size(); ++i) {
        if (!windowReady(values, i, window)) continue;
        double sum = 0.0;
        for (size_t j = i + 1 - window; j <= i; ++j) sum += values[j];
        out[i] = sum / window;
    }
    return out;
}

std::vector<double> TechnicalIndicators::rollingStdDev(const std::vector<double>& values, int window) {
    std::vector<double> out(values.size(), missingValue());
    for (size_t i = 0; i < values.size(); ++i) {
        if (!windowReady(values, i, window)) continue;
        double sum = 0.0;
        for (size_t j = i + 1 - window; j <= i; ++j) sum += values[j];
        const double mean = sum / window;
        double sq = 0.0;
        for (size_t j = i + 1 - window; j <= i; ++j) {
            const double diff = values[j] - mean;
            sq += diff * diff;
        }
        out[i] = std::sqrt(sq / window);
    }
    return out;
}

std::vector<double> TechnicalIndicators::rollingMax(const std::vector<double>& values, int window) {
    std::vector<double> out(values.size(), missingValue());
    for (size_t i = 0; i < values.size(); ++i) {
        if (!windowReady(values, i, window)) continue;
        out[i] = *std::max_element(values.begin() + (i + 1 - window), values.begin() + i + 1);
    }
    return out;
}

std::vector<double> TechnicalIndicators::rollingMin(const std::vector<double>& values, int window) {
    std::vector<double> out(values.size(), missingValue());
    for (size_t i = 0; i < values.size(); ++i) {
        if (!windowReady(values, i, window)) continue;
        out[i] = *std::min_element(values.begin() + (i + 1 - window), values.begin() + i + 1);
    }
    return out;
}

// MACD 계산
TechnicalIndicators::MACDSeries TechnicalIndicators::calculateMACDSeries(
    const std::vector<double>& prices,
    int fast,
    int slow,
    int signal_period
) {
    MACDSeries result;
    const auto fast_ema = calculateEMASeries(prices, fast);
    const auto slow_ema = calculateEMASeries(prices, slow);

    result.macd.assign(prices.size(), missingValue());
    for (size_t i = 0; i < prices.size(); ++i) {
        if (!isMissing(fast_ema[i]) && !isMissing(slow_ema[i])) {
            result.macd[i] = fast_ema[i] - slow_ema[i];
        }
    }

    // Signal = MACD 히스토리의 EMA (앞쪽 NaN 이후부터 카운트)
    result.signal = calculateEMASeries(result.macd, signal_period);

    result.histogram.assign(prices.size(), missingValue());
    for (size_t i = 0; i < prices.size(); ++i) {
        if (!isMissing(result.macd[i]) && !isMissing(result.signal[i])) {
            result.histogram[i] = result.macd[i] - result.signal[i];
        }
    }
    return result;
}

// RSI 계산 (Wilder's Smoothing 방식)
std::vector<double> TechnicalIndicators::calculateRSISeries(const std::vector<double>& prices, int period) {
    const size_t n = prices.size();
    std::vector<double> gains(n, 0.0);
    std::vector<double> losses(n, 0.0);

    // 첫 행의 변화량은 0으로 취급
    for (size_t i = 1; i < n; ++i) {
        const double change = prices[i] - prices[i - 1];
        if (isMissing(change)) {
            gains[i] = missingValue();
            losses[i] = missingValue();
        } else if (change > 0) {
            gains[i] = change;
        } else if (change < 0) {
            losses[i] = -change;
        }
    }

    const double alpha = 1.0 / period;
    const auto avg_gain = exponentialMean(gains, alpha, period);
    const auto avg_loss = exponentialMean(losses, alpha, period);

    std::vector<double> rsi(n, missingValue());
    for (size_t i = 0; i < n; ++i) {
        if (isMissing(avg_gain[i]) || isMissing(avg_loss[i])) continue;

        if (avg_loss[i] == 0.0) {
            // 하락 없음: 상승만 있으면 100, 변화 자체가 없으면 중립
            rsi[i] = (avg_gain[i] == 0.0) ? 50.0 : 100.0;
        } else {
            const double rs = avg_gain[i] / avg_loss[i];
            rsi[i] = 100.0 - (100.0 / (1.0 + rs));
        }
    }
    return rsi;
}

// Stochastic 계산
TechnicalIndicators::StochasticSeries TechnicalIndicators::calculateStochasticSeries(
    const std::vector<double>& high,
    const std::vector<double>& low,
    const std::vector<double>& close,
    int k_period,
    int d_period
) {
    StochasticSeries result;
    const auto highest = rollingMax(high, k_period);
    const auto lowest = rollingMin(low, k_period);

    result.k.assign(close.size(), missingValue());
    for (size_t i = 0; i < close.size(); ++i) {
        if (isMissing(highest[i]) || isMissing(lowest[i]) || isMissing(close[i])) continue;
        const double range = highest[i] - lowest[i];
        if (range == 0.0) continue;  // 고가=저가 구간은 정의되지 않음
        result.k[i] = 100.0 * (close[i] - lowest[i]) / range;
    }

    result.d = rollingMean(result.k, d_period);
    return result;
}

// Bollinger Bands 계산
TechnicalIndicators::BollingerSeries TechnicalIndicators::calculateBollingerSeries(
    const std::vector<double>& prices,
    int period,
    double std_dev_mult
) {
    BollingerSeries result;
    result.middle = rollingMean(prices, period);
    const auto std_dev = rollingStdDev(prices, period);

    result.upper.assign(prices.size(), missingValue());
    result.lower.assign(prices.size(), missingValue());
    for (size_t i = 0; i < prices.size(); ++i) {
        if (isMissing(result.middle[i]) || isMissing(std_dev[i])) continue;
        result.upper[i] = result.middle[i] + std_dev[i] * std_dev_mult;
        result.lower[i] = result.middle[i] - std_dev[i] * std_dev_mult;
    }
    return result;
}

// 일목균형표 계산
TechnicalIndicators::IchimokuSeries TechnicalIndicators::calculateIchimokuSeries(
    const std::vector<double>& high,
    const std::vector<double>& low,
    int conversion,
    int base,
    int span_b
) {
    auto midpoint = [&](int window) {
        const auto hi = rollingMax(high, window);
        const auto lo = rollingMin(low, window);
        std::vector<double> mid(high.size(), missingValue());
        for (size_t i = 0; i < high.size(); ++i) {
            if (!isMissing(hi[i]) && !isMissing(lo[i])) {
                mid[i] = 0.5 * (hi[i] + lo[i]);
            }
        }
        return mid;
    };

    IchimokuSeries result;
    result.tenkan = midpoint(conversion);
    result.kijun = midpoint(base);
    result.senkou_b = midpoint(span_b);

    result.senkou_a.assign(high.size(), missingValue());
    for (size_t i = 0; i < high.size(); ++i) {
        if (!isMissing(result.tenkan[i]) && !isMissing(result.kijun[i])) {
            result.senkou_a[i] = 0.5 * (result.tenkan[i] + result.kijun[i]);
        }
    }
    return result;
}

double TechnicalIndicators::roundTo(double value, int decimals) {
    if (isMissing(value) || std::isinf(value)) {
        return value;
    }
    const double scale = std::pow(10.0, decimals);
    return std::nearbyint(value * scale) / scale;
}

} // namespace analytics
} // namespace marketpipe
