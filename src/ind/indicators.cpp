#include "ind/indicators.h"

#include <format>
#include <stdexcept>

inline void check_period(const char* name, int period) {
  if (period <= 0)
    throw std::invalid_argument(
        std::format("{} period must be positive, got {}", name, period));
}

std::vector<double> closes_of(const std::vector<Candle>& candles) noexcept {
  std::vector<double> out;
  out.reserve(candles.size());
  for (auto& c : candles)
    out.push_back(c.close);
  return out;
}

std::vector<double> highs_of(const std::vector<Candle>& candles) noexcept {
  std::vector<double> out;
  out.reserve(candles.size());
  for (auto& c : candles)
    out.push_back(c.high);
  return out;
}

std::vector<double> lows_of(const std::vector<Candle>& candles) noexcept {
  std::vector<double> out;
  out.reserve(candles.size());
  for (auto& c : candles)
    out.push_back(c.low);
  return out;
}

EMA::EMA(const std::vector<double>& prices, int period)
    : values(prices.size()) {
  check_period("EMA", period);
  if (prices.empty())
    return;

  auto alpha = 2.0 / (period + 1);
  values[0] = prices[0];
  for (size_t i = 1; i < prices.size(); i++)
    values[i] = alpha * prices[i] + (1 - alpha) * values[i - 1];
}

inline Value to_rsi(double avg_gain, double avg_loss) {
  if (avg_loss == 0.0)
    return avg_gain > 0.0 ? 100.0 : RSI::flat_value;

  double rs = avg_gain / avg_loss;
  return 100.0 - (100.0 / (1.0 + rs));
}

RSI::RSI(const std::vector<double>& prices, int period)
    : values(prices.size()) {
  check_period("RSI", period);

  size_t n = prices.size();
  size_t len = period;
  if (n <= len)
    return;

  double avg_gain = 0.0;
  double avg_loss = 0.0;

  // seed with the plain mean over the first `period` deltas
  for (size_t i = 1; i <= len; ++i) {
    double change = prices[i] - prices[i - 1];
    avg_gain += change > 0 ? change : 0.0;
    avg_loss += change < 0 ? -change : 0.0;
  }
  avg_gain /= period;
  avg_loss /= period;
  values[len] = to_rsi(avg_gain, avg_loss);

  auto alpha = 1.0 / period;
  for (size_t i = len + 1; i < n; ++i) {
    double change = prices[i] - prices[i - 1];
    double gain = change > 0 ? change : 0.0;
    double loss = change < 0 ? -change : 0.0;

    avg_gain = alpha * gain + (1 - alpha) * avg_gain;
    avg_loss = alpha * loss + (1 - alpha) * avg_loss;
    values[i] = to_rsi(avg_gain, avg_loss);
  }
}

MACD::MACD(const std::vector<double>& prices, int fast, int slow, int signal)
    : macd_line(prices.size()),
      fast_ema{prices, fast},
      slow_ema{prices, slow}  //
{
  size_t n = prices.size();
  for (size_t i = 0; i < n; ++i)
    macd_line[i] = fast_ema.values[i] - slow_ema.values[i];

  signal_ema = EMA(macd_line, signal);
  auto& signal_line = signal_ema.values;

  histogram.reserve(n);
  for (size_t i = 0; i < n; ++i)
    histogram.push_back(macd_line[i] - signal_line[i]);
}
