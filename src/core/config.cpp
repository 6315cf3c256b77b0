#include "util/config.h"
#include "core/binance_api.h"

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <filesystem>
#include <format>
#include <glaze/glaze.hpp>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

inline void require_positive(const char* field, long long value) {
  if (value <= 0)
    throw std::invalid_argument(
        std::format("[config] {} must be positive, got {}", field, value));
}

void AnalysisConfig::validate() const {
  require_positive("momentum_period", momentum_period);
  require_positive("fast_period", fast_period);
  require_positive("slow_period", slow_period);
  require_positive("signal_period", signal_period);
  require_positive("extrema_lookback", static_cast<long long>(extrema_lookback));
  require_positive("freshness_bars", static_cast<long long>(freshness_bars));
}

void ScanConfig::validate() const {
  if (symbol.empty())
    throw std::invalid_argument("[config] symbol is empty");

  if (timeframes.empty())
    throw std::invalid_argument("[config] no timeframes given");

  for (auto& tf : timeframes)
    if (!is_valid_interval(tf))
      throw std::invalid_argument(
          std::format("[config] unknown timeframe '{}'", tf));

  if (limit == 0 || limit > MAX_LIMIT)
    throw std::invalid_argument(std::format(
        "[config] limit must be within 1..{}, got {}", MAX_LIMIT, limit));

  if (pacing_ms < 0)
    throw std::invalid_argument("[config] pacing_ms must not be negative");
}

void Config::validate() const {
  analysis.validate();
  scan.validate();
  require_positive("timeout_ms", api.timeout_ms);
}

struct ConfigFile {
  AnalysisConfig analysis;
  ScanConfig scan;
  APIConfig api;
};

template <typename T>
inline void log_section(const T& t) {
  std::string buffer;
  auto ec = glz::write<glz::opts{.prettify = true}>(t, buffer);
  if (!ec)
    spdlog::debug("[config] \"{}\": {}", T::name, buffer);
}

bool Config::read_file(const std::string& path) {
  if (!fs::exists(path)) {
    spdlog::warn("[config] {} not found, using defaults", path);
    return false;
  }

  ConfigFile file{analysis, scan, api};

  constexpr auto opts = glz::opts{.error_on_unknown_keys = false};
  auto ec = glz::read_file_json<opts>(file, path, std::string{});
  if (ec) {
    spdlog::error("[config] {} error {}", path, glz::format_error(ec));
    return false;
  }

  analysis = file.analysis;
  scan = file.scan;
  api = file.api;

  log_section(analysis);
  log_section(scan);
  log_section(api);

  return true;
}

void Config::read_args(int argc, char* argv[]) {
  argparse::ArgumentParser program("divscan");

  program.add_argument("-d", "--debug")
      .default_value(false)
      .implicit_value(true)
      .help("Enable debug logging");

  program.add_argument("-c", "--config")
      .default_value(std::string{CONFIG_PATH_DEFAULT})
      .help("Path of the JSON config file");

  program.add_argument("-s", "--symbol").help("Trading pair, e.g. BTCUSDT");

  program.add_argument("-t", "--timeframes")
      .nargs(argparse::nargs_pattern::at_least_one)
      .help("Timeframes to scan, e.g. 15m 1h 4h 1d");

  program.add_argument("-l", "--limit")
      .help("Number of candles fetched per timeframe")
      .scan<'d', size_t>();

  program.add_argument("-o", "--offline")
      .help("Read kline files from this directory instead of the API");

  program.add_argument("--pacing")
      .help("Delay between timeframes in milliseconds")
      .scan<'d', int>();

  program.add_argument("--no-color")
      .default_value(false)
      .implicit_value(true)
      .help("Disable colored output");

  try {
    program.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << "\n" << program << "\n";
    throw std::invalid_argument(err.what());
  }

  debug_en = program.get<bool>("--debug");
  color_en = !program.get<bool>("--no-color");
  config_path = program.get<std::string>("--config");

  read_file(config_path);

  if (program.is_used("--symbol"))
    scan.symbol = program.get<std::string>("--symbol");
  if (program.is_used("--timeframes"))
    scan.timeframes = program.get<std::vector<std::string>>("--timeframes");
  if (program.is_used("--limit"))
    scan.limit = program.get<size_t>("--limit");
  if (program.is_used("--pacing"))
    scan.pacing_ms = program.get<int>("--pacing");
  if (program.is_used("--offline"))
    offline_dir = program.get<std::string>("--offline");

  validate();
}
