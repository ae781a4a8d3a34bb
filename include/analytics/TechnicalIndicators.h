#pragma once

#include <vector>
#include "common/Types.h"

namespace marketpipe {
namespace analytics {

// Technical Indicators - 전체 시계열 버전
// 창이 채워지기 전 구간은 NaN (0 아님)
class TechnicalIndicators {
public:
    // 지수 이동평균 (adjust=false, 첫 유효값으로 시작)
    // 앞쪽 NaN은 건너뛰고, 유효 관측치가 min_periods 미만이면 NaN
    static std::vector<double> exponentialMean(const std::vector<double>& values,
                                               double alpha, int min_periods);

    // EMA - span 기준 (alpha = 2 / (span + 1))
    static std::vector<double> calculateEMASeries(const std::vector<double>& prices, int period);

    // 단순 롤링 통계 (창 안에 NaN 있으면 NaN)
    static std::vector<double> rollingMean(const std::vector<double>& values, int window);
    static std::vector<double> rollingStdDev(const std::vector<double>& values, int window);  // 모집단 표준편차
    static std::vector<double> rollingMax(const std::vector<double>& values, int window);
    static std::vector<double> rollingMin(const std::vector<double>& values, int window);

    // MACD (Moving Average Convergence Divergence)
    struct MACDSeries {
        std::vector<double> macd;       // EMA(fast) - EMA(slow)
        std::vector<double> signal;     // MACD의 EMA
        std::vector<double> histogram;  // MACD - Signal
    };
    static MACDSeries calculateMACDSeries(const std::vector<double>& prices,
                                          int fast = 12, int slow = 26, int signal_period = 9);

    // RSI (Wilder's Smoothing 방식)
    // 움직임이 전혀 없으면 50 (중립)
    static std::vector<double> calculateRSISeries(const std::vector<double>& prices, int period = 14);

    // Stochastic Oscillator
    struct StochasticSeries {
        std::vector<double> k;  // %K
        std::vector<double> d;  // %D = %K 의 단순이동평균
    };
    static StochasticSeries calculateStochasticSeries(const std::vector<double>& high,
                                                      const std::vector<double>& low,
                                                      const std::vector<double>& close,
                                                      int k_period = 14,
                                                      int d_period = 3);

    // Bollinger Bands
    struct BollingerSeries {
        std::vector<double> upper;
        std::vector<double> middle;
        std::vector<double> lower;
    };
    static BollingerSeries calculateBollingerSeries(const std::vector<double>& prices,
                                                    int period = 20,
                                                    double std_dev_mult = 2.0);

    // 일목균형표 (선행스팬 시프트 없음)
    struct IchimokuSeries {
        std::vector<double> tenkan;    // 전환선
        std::vector<double> kijun;     // 기준선
        std::vector<double> senkou_a;  // 선행스팬 A
        std::vector<double> senkou_b;  // 선행스팬 B
    };
    static IchimokuSeries calculateIchimokuSeries(const std::vector<double>& high,
                                                  const std::vector<double>& low,
                                                  int conversion = 9,
                                                  int base = 26,
                                                  int span_b = 52);

    // 소수점 반올림 (짝수 반올림, NaN 유지)
    static double roundTo(double value, int decimals);
};

} // namespace analytics
} // namespace marketpipe
