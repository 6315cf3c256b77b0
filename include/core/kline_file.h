#pragma once

#include "ind/candle.h"

#include <string>

// Offline source: {dir}/{symbol}_{interval}.json holding a saved klines payload.
class KlineFile {
  const std::string dir;

 public:
  explicit KlineFile(const std::string& dir) noexcept;

  std::string path(const std::string& symbol,
                   const std::string& interval) const;

  TimeSeriesRes klines(const std::string& symbol,
                       const std::string& interval,
                       size_t limit) const noexcept;
};
