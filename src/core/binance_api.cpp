#include "core/binance_api.h"

#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <charconv>
#include <cstdint>
#include <glaze/glaze.hpp>
#include <optional>
#include <tuple>

bool is_valid_interval(std::string_view interval) {
  constexpr std::string_view intervals[] = {
      "1m", "3m", "5m", "15m", "30m", "1h", "2h",  "4h",
      "6h", "8h", "12h", "1d", "3d", "1w", "1M",
  };
  return std::ranges::find(intervals, interval) != std::end(intervals);
}

// open time, open, high, low, close, volume, close time, quote volume,
// trades, taker base volume, taker quote volume, ignore
using kline_row_t = std::tuple<int64_t,
                               std::string,
                               std::string,
                               std::string,
                               std::string,
                               std::string,
                               int64_t,
                               std::string,
                               int64_t,
                               std::string,
                               std::string,
                               std::string>;

inline std::optional<double> to_double(std::string_view str) {
  double v = 0.0;
  auto end = str.data() + str.size();
  auto [ptr, ec] = std::from_chars(str.data(), end, v);
  if (ec != std::errc{} || ptr != end)
    return std::nullopt;
  return v;
}

inline std::optional<Candle> to_candle(const kline_row_t& row) {
  auto& [open_time, o, h, l, c, v, _ct, _qv, _n, _tb, _tq, _ig] = row;

  auto open = to_double(o);
  auto high = to_double(h);
  auto low = to_double(l);
  auto close = to_double(c);
  auto volume = to_double(v);
  if (!open || !high || !low || !close || !volume)
    return std::nullopt;

  return Candle{from_unix_ms(open_time), *open, *high, *low, *close, *volume};
}

TimeSeriesRes parse_klines(std::string_view json) noexcept {
  std::vector<kline_row_t> rows;
  std::string buffer{json};

  auto ec = glz::read_json(rows, buffer);
  if (ec) {
    spdlog::error("[klines] json error: {}", glz::format_error(ec, buffer));
    return {};
  }

  TimeSeriesRes candles;
  candles.reserve(rows.size());

  size_t dropped = 0;
  for (auto& row : rows) {
    if (auto candle = to_candle(row))
      candles.push_back(*candle);
    else
      dropped++;
  }

  if (dropped > 0)
    spdlog::warn("[klines] dropped {} malformed rows", dropped);

  auto by_time = [](const Candle& a, const Candle& b) {
    return a.datetime < b.datetime;
  };
  auto same_time = [](const Candle& a, const Candle& b) {
    return a.datetime == b.datetime;
  };

  std::ranges::stable_sort(candles, by_time);
  auto dups = std::ranges::unique(candles, same_time);
  candles.erase(dups.begin(), dups.end());

  return candles;
}

BinanceAPI::BinanceAPI(const APIConfig& config) noexcept : config{config} {
  spdlog::info("[binance] using {}", config.base_url);
}

TimeSeriesRes BinanceAPI::klines(const std::string& symbol,
                                 const std::string& interval,
                                 size_t limit) const noexcept {
  cpr::Parameters params{{"symbol", symbol},
                         {"interval", interval},
                         {"limit", std::to_string(limit)}};

  auto res = cpr::Get(cpr::Url{config.base_url + "/api/v3/klines"}, params,
                      cpr::Timeout{config.timeout_ms});

  if (res.error) {
    spdlog::error("[binance] ({} {}) request error: {}",  //
                  symbol, interval, res.error.message);
    return {};
  }

  if (res.status_code != 200) {
    spdlog::error("[binance] ({} {}) klines http error {}",  //
                  symbol, interval, res.status_code);
    return {};
  }

  auto candles = parse_klines(res.text);
  spdlog::debug("[binance] ({} {}) {} candles", symbol, interval,
                candles.size());
  return candles;
}
