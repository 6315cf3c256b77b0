#include "ind/extrema.h"

#include <stdexcept>

inline bool comparable(double) {
  return true;
}

inline bool comparable(const Value& v) {
  return v.has_value();
}

inline double value_of(double v) {
  return v;
}

inline double value_of(const Value& v) {
  return *v;
}

template <typename Series>
inline Extrema extrema_of(const Series& series, size_t lookback) {
  if (lookback == 0)
    throw std::invalid_argument("extrema lookback must be positive");

  Extrema ext;

  size_t N = series.size();
  if (N < 2 * lookback)
    return ext;

  for (size_t i = lookback; i < N - lookback; ++i) {
    if (!comparable(series[i]))
      continue;

    double cur = value_of(series[i]);
    bool peak = true;
    bool valley = true;

    for (size_t j = 1; j <= lookback && (peak || valley); ++j) {
      auto& before = series[i - j];
      auto& after = series[i + j];
      if (!comparable(before) || !comparable(after)) {
        peak = valley = false;
        break;
      }

      double l = value_of(before);
      double r = value_of(after);
      peak = peak && cur > l && cur > r;
      valley = valley && cur < l && cur < r;
    }

    if (peak)
      ext.peaks.push_back(i);
    if (valley)
      ext.valleys.push_back(i);
  }

  return ext;
}

Extrema find_extrema(const std::vector<double>& series, size_t lookback) {
  return extrema_of(series, lookback);
}

Extrema find_extrema(const ValueSeries& series, size_t lookback) {
  return extrema_of(series, lookback);
}

SwingPoints::SwingPoints(const std::vector<Candle>& candles, size_t lookback)
    : peaks{find_extrema(highs_of(candles), lookback).peaks},
      valleys{find_extrema(lows_of(candles), lookback).valleys}  //
{}
