#include "sig/divergence.h"

#include <spdlog/spdlog.h>

template <Divergence dir>
inline std::optional<Signal> check_divergence(
    const std::vector<Candle>& candles,
    const ValueSeries& momentum,
    const std::vector<double>& histogram,
    const std::vector<size_t>& idxs,
    size_t freshness_bars) {
  constexpr bool bullish = dir == Divergence::Bullish;

  if (idxs.size() < 2)
    return std::nullopt;

  size_t N = candles.size();
  size_t last = idxs.back();
  size_t prev = idxs[idxs.size() - 2];

  if (N < 2 || last >= N || prev >= last)
    return std::nullopt;

  // stale extremum
  if (N - last >= freshness_bars)
    return std::nullopt;

  auto price = [&candles](size_t idx) {
    return bullish ? candles[idx].low : candles[idx].high;
  };

  auto& m_prev = momentum[prev];
  auto& m_last = momentum[last];
  if (!m_prev || !m_last) {
    spdlog::debug("[div] momentum undefined at {} or {}", prev, last);
    return std::nullopt;
  }

  double p_prev = price(prev);
  double p_last = price(last);

  bool diverges = bullish ? (p_last < p_prev && *m_last > *m_prev)
                          : (p_last > p_prev && *m_last < *m_prev);
  if (!diverges)
    return std::nullopt;

  double curr_hist = histogram[N - 1];
  double prev_hist = histogram[N - 2];
  bool confirmed = bullish ? curr_hist > prev_hist : curr_hist < prev_hist;

  return Signal{
      dir,
      DivergenceDetails{prev, last, p_prev, p_last, *m_prev, *m_last},
      confirmed ? Confirmation::Confirmed : Confirmation::NotConfirmed,
  };
}

Signal classify_divergence(const std::vector<Candle>& candles,
                           const ValueSeries& momentum,
                           const std::vector<double>& histogram,
                           const SwingPoints& swings,
                           size_t freshness_bars) {
  if (momentum.size() != candles.size() ||
      histogram.size() != candles.size()) {
    spdlog::error("[div] misaligned series: {} candles, {} momentum, {} hist",
                  candles.size(), momentum.size(), histogram.size());
    return {};
  }

  Signal signal;

  if (auto bull = check_divergence<Divergence::Bullish>(
          candles, momentum, histogram, swings.valleys, freshness_bars))
    signal = *bull;

  if (auto bear = check_divergence<Divergence::Bearish>(
          candles, momentum, histogram, swings.peaks, freshness_bars))
    signal = *bear;

  return signal;
}
