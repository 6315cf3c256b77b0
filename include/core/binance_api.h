#pragma once

#include "ind/candle.h"
#include "util/config.h"

#include <string>
#include <string_view>

bool is_valid_interval(std::string_view interval);

// Decodes the kline array-of-arrays payload of /api/v3/klines. Rows whose
// prices do not parse are dropped; the result is ascending and unique in time.
TimeSeriesRes parse_klines(std::string_view json) noexcept;

class BinanceAPI {
  const APIConfig config;

 public:
  explicit BinanceAPI(const APIConfig& config) noexcept;

  TimeSeriesRes klines(const std::string& symbol,
                       const std::string& interval,
                       size_t limit) const noexcept;
};
