#include "core/binance_api.h"
#include "core/kline_file.h"
#include "core/scanner.h"
#include "util/config.h"
#include "util/format.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace fs = std::filesystem;

inline void init_logging(bool debug_en) {
  auto file_logger = spdlog::basic_logger_mt("file_logger", "logs/divscan.log");
  spdlog::set_default_logger(file_logger);

  auto level = debug_en ? spdlog::level::debug : spdlog::level::info;
  spdlog::set_level(level);
  spdlog::flush_on(level);

  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");
}

inline void ensure_directories_exist(const std::vector<std::string>& dirs) {
  for (const auto& dir : dirs) {
    fs::path path{dir};
    if (fs::exists(path))
      continue;
    if (!fs::create_directories(path))
      std::cerr << "Failed to create: " << dir << '\n';
  }
}

int main(int argc, char* argv[]) {
  ensure_directories_exist({"logs"});

  Config config;
  try {
    config.read_args(argc, argv);
  } catch (const std::invalid_argument& err) {
    std::cerr << err.what() << '\n';
    return 1;
  }

  init_logging(config.debug_en);

  fetch_f fetch;
  if (config.offline()) {
    fetch = [src = KlineFile{config.offline_dir}](
                const std::string& symbol, const std::string& interval,
                size_t limit) { return src.klines(symbol, interval, limit); };
  } else {
    fetch = [api = BinanceAPI{config.api}](
                const std::string& symbol, const std::string& interval,
                size_t limit) { return api.klines(symbol, interval, limit); };
  }

  std::cout << "Starting scanner (RSI divergence + MACD confirmation)...\n\n";

  Scanner scanner{config.analysis, config.scan, fetch};
  auto rows = scanner.run();

  std::cout << render_report(config.scan.symbol, rows, config.color_en)
            << std::endl;

  spdlog::info("[exit] main");
  return 0;
}
