#pragma once

#include "util/times.h"

#include <vector>

struct Candle {
  SysTimePoint datetime;
  double open = 0.0;
  double high = 0.0;
  double low = 0.0;
  double close = 0.0;
  double volume = 0.0;

  SysTimePoint time() const { return datetime; }
};

using TimeSeriesRes = std::vector<Candle>;
