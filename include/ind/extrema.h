#pragma once

#include "ind/candle.h"
#include "ind/indicators.h"

#include <vector>

struct Extrema {
  std::vector<size_t> peaks;
  std::vector<size_t> valleys;
};

// An index i in [lookback, N - lookback) is a peak (valley) when it is
// strictly above (below) every value within `lookback` bars on both sides.
Extrema find_extrema(const std::vector<double>& series, size_t lookback = 5);

// Windows touching an undefined value yield neither a peak nor a valley.
Extrema find_extrema(const ValueSeries& series, size_t lookback = 5);

// Swing points of a candle series: valleys of the lows, peaks of the highs.
struct SwingPoints {
  std::vector<size_t> peaks;
  std::vector<size_t> valleys;

  SwingPoints() = default;
  SwingPoints(const std::vector<Candle>& candles, size_t lookback = 5);
};
