#include "core/scanner.h"
#include "ind/extrema.h"
#include "ind/indicators.h"
#include "util/format.h"

#include <spdlog/spdlog.h>
#include <thread>

std::optional<Report> evaluate(const std::vector<Candle>& candles,
                               const AnalysisConfig& config) {
  config.validate();

  if (candles.size() <= static_cast<size_t>(config.slow_period)) {
    spdlog::debug("[scan] insufficient data: {} candles", candles.size());
    return std::nullopt;
  }

  auto closes = closes_of(candles);

  RSI rsi{closes, config.momentum_period};
  MACD macd{closes, config.fast_period, config.slow_period,
            config.signal_period};
  SwingPoints swings{candles, config.extrema_lookback};

  auto signal = classify_divergence(candles, rsi.values, macd.histogram,
                                    swings, config.freshness_bars);

  return Report{candles.back().close, signal};
}

void sleep_for(milliseconds ms) {
  std::this_thread::sleep_for(ms);
}

Scanner::Scanner(const AnalysisConfig& analysis,
                 const ScanConfig& scan,
                 fetch_f fetch,
                 sleep_f sleep)
    : analysis{analysis},
      scan{scan},
      fetch{std::move(fetch)},
      sleep{std::move(sleep)}  //
{
  analysis.validate();
  scan.validate();
}

std::optional<ScanRow> Scanner::scan_timeframe(
    const std::string& timeframe) const {
  auto candles = fetch(scan.symbol, timeframe, scan.limit);
  if (candles.empty()) {
    spdlog::warn("[scan] ({} {}) no candles", scan.symbol, timeframe);
    return std::nullopt;
  }

  auto report = evaluate(candles, analysis);
  if (!report) {
    spdlog::warn("[scan] ({} {}) skipped, only {} candles",  //
                 scan.symbol, timeframe, candles.size());
    return std::nullopt;
  }

  auto& signal = report->signal;
  spdlog::info("[scan] ({} {}) close {:.2f} {} conf {}", scan.symbol,
               timeframe, report->last_close, to_str(signal.type),
               to_str(signal));

  return ScanRow{timeframe, *report};
}

std::vector<ScanRow> Scanner::run() const {
  std::vector<ScanRow> rows;

  Timer timer;
  for (size_t i = 0; i < scan.timeframes.size(); ++i) {
    if (i > 0)
      sleep(milliseconds{scan.pacing_ms});

    if (auto row = scan_timeframe(scan.timeframes[i]))
      rows.push_back(std::move(*row));
  }

  spdlog::info("[scan] ({}) {}/{} timeframes in {:.2f}ms", scan.symbol,
               rows.size(), scan.timeframes.size(), timer.diff_ms());

  return rows;
}
