#include "core/kline_file.h"
#include "core/binance_api.h"

#include <spdlog/spdlog.h>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

KlineFile::KlineFile(const std::string& dir) noexcept : dir{dir} {
  spdlog::info("[klines] offline mode, reading from {}", dir);
}

std::string KlineFile::path(const std::string& symbol,
                            const std::string& interval) const {
  return std::format("{}/{}_{}.json", dir, symbol, interval);
}

TimeSeriesRes KlineFile::klines(const std::string& symbol,
                                const std::string& interval,
                                size_t limit) const noexcept {
  auto file = path(symbol, interval);
  if (!fs::exists(file)) {
    spdlog::error("[klines] ({} {}) missing {}", symbol, interval, file);
    return {};
  }

  std::ifstream ifs{file};
  if (!ifs) {
    spdlog::error("[klines] ({} {}) cannot open {}", symbol, interval, file);
    return {};
  }

  std::stringstream buffer;
  buffer << ifs.rdbuf();

  auto candles = parse_klines(buffer.str());
  if (candles.size() > limit)
    candles.erase(candles.begin(), candles.end() - limit);

  return candles;
}
