#pragma once

#include "ind/candle.h"

#include <optional>
#include <vector>

// Undefined positions (warm-up, 0/0 ratios) are std::nullopt, never NaN.
using Value = std::optional<double>;
using ValueSeries = std::vector<Value>;

std::vector<double> closes_of(const std::vector<Candle>& candles) noexcept;
std::vector<double> highs_of(const std::vector<Candle>& candles) noexcept;
std::vector<double> lows_of(const std::vector<Candle>& candles) noexcept;

struct EMA {
  std::vector<double> values;

  EMA() noexcept = default;
  EMA(const std::vector<double>& prices, int period);
};

struct RSI {
  static constexpr double flat_value = 50.0;

  ValueSeries values;

  RSI(const std::vector<double>& prices, int period = 14);
};

struct MACD {
  std::vector<double> macd_line;
  EMA signal_ema;
  std::vector<double> histogram;

 private:
  EMA fast_ema;
  EMA slow_ema;

 public:
  MACD(const std::vector<double>& prices,
       int fast = 12,
       int slow = 26,
       int signal = 9);

  double signal(size_t idx) const { return signal_ema.values[idx]; }
};
