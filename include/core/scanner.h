#pragma once

#include "ind/candle.h"
#include "sig/divergence.h"
#include "util/config.h"
#include "util/times.h"

#include <functional>
#include <optional>
#include <string>
#include <vector>

struct Report {
  double last_close = 0.0;
  Signal signal;
};

struct ScanRow {
  std::string timeframe;
  Report report;
};

// std::nullopt when the series is too short for the slow EMA to settle.
// Throws std::invalid_argument on a malformed config.
std::optional<Report> evaluate(const std::vector<Candle>& candles,
                               const AnalysisConfig& config);

using fetch_f = std::function<TimeSeriesRes(const std::string& symbol,
                                            const std::string& interval,
                                            size_t limit)>;
using sleep_f = std::function<void(milliseconds)>;

void sleep_for(milliseconds ms);

class Scanner {
  const AnalysisConfig analysis;
  const ScanConfig scan;

  fetch_f fetch;
  sleep_f sleep;

 public:
  Scanner(const AnalysisConfig& analysis,
          const ScanConfig& scan,
          fetch_f fetch,
          sleep_f sleep = sleep_for);

  std::optional<ScanRow> scan_timeframe(const std::string& timeframe) const;
  std::vector<ScanRow> run() const;
};
