#pragma once

#include <string>
#include <vector>

struct AnalysisConfig {
  static constexpr const char* name = "analysis";

  int momentum_period = 14;

  int fast_period = 12;
  int slow_period = 26;
  int signal_period = 9;

  size_t extrema_lookback = 5;
  size_t freshness_bars = 15;  // the last extremum must be newer than this

  void validate() const;
};

struct ScanConfig {
  static constexpr const char* name = "scan";
  static constexpr size_t MAX_LIMIT = 1000;

  std::string symbol = "BTCUSDT";
  std::vector<std::string> timeframes = {"15m", "1h", "4h", "1d"};
  size_t limit = 100;
  int pacing_ms = 250;

  void validate() const;
};

struct APIConfig {
  static constexpr const char* name = "api";

  std::string base_url = "https://api.binance.com";
  int timeout_ms = 10000;
};

struct Config {
  static constexpr const char* CONFIG_PATH_DEFAULT = "config/divscan.json";

  bool debug_en = false;
  bool color_en = true;

  std::string config_path = CONFIG_PATH_DEFAULT;
  std::string offline_dir = "";

  AnalysisConfig analysis;
  ScanConfig scan;
  APIConfig api;

  void read_args(int argc, char* argv[]);
  bool read_file(const std::string& path);
  void validate() const;

  bool offline() const { return !offline_dir.empty(); }
};
