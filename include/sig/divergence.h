#pragma once

#include "ind/candle.h"
#include "ind/extrema.h"
#include "ind/indicators.h"

#include <optional>
#include <vector>

enum class Divergence {
  None,  // neutral
  Bullish,
  Bearish,
};

enum class Confirmation {
  NotApplicable,
  Confirmed,
  NotConfirmed,
};

struct DivergenceDetails {
  size_t prev_idx = 0;
  size_t last_idx = 0;

  double prev_price = 0.0;
  double last_price = 0.0;

  double prev_momentum = 0.0;
  double last_momentum = 0.0;
};

struct Signal {
  Divergence type = Divergence::None;
  std::optional<DivergenceDetails> details = std::nullopt;
  Confirmation confirmation = Confirmation::NotApplicable;

  bool exists() const { return type != Divergence::None; }
  bool confirmed() const { return confirmation == Confirmation::Confirmed; }
};

inline constexpr size_t DEFAULT_FRESHNESS_BARS = 15;

/*
 * Compares the two most recent swing lows (bullish) and swing highs
 * (bearish) against the momentum series. The bearish check runs last and
 * replaces a bullish result when both patterns are present. A divergence is
 * confirmed by the slope of the last two histogram values.
 */
Signal classify_divergence(const std::vector<Candle>& candles,
                           const ValueSeries& momentum,
                           const std::vector<double>& histogram,
                           const SwingPoints& swings,
                           size_t freshness_bars = DEFAULT_FRESHNESS_BARS);
