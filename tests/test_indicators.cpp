#include <gtest/gtest.h>
#include "ind/indicators.h"

#include <random>
#include <stdexcept>
#include <vector>

static std::vector<double> random_walk(size_t n, unsigned seed = 42) {
  std::mt19937 gen{seed};
  std::normal_distribution<double> step{0.0, 1.5};

  std::vector<double> prices;
  double price = 100.0;
  for (size_t i = 0; i < n; ++i) {
    price += step(gen);
    prices.push_back(price);
  }
  return prices;
}

// === EMA ===
TEST(EMATest, SeededWithFirstValue) {
  EMA ema{{2.0, 4.0, 4.0}, 3};  // alpha = 0.5
  ASSERT_EQ(ema.values.size(), 3u);
  EXPECT_DOUBLE_EQ(ema.values[0], 2.0);
  EXPECT_DOUBLE_EQ(ema.values[1], 3.0);
  EXPECT_DOUBLE_EQ(ema.values[2], 3.5);
}

TEST(EMATest, PeriodOneTracksInput) {
  std::vector<double> prices = {5, 7, 1, 9};
  EMA ema{prices, 1};
  for (size_t i = 0; i < prices.size(); ++i)
    EXPECT_DOUBLE_EQ(ema.values[i], prices[i]);
}

TEST(EMATest, EmptyInput) {
  EMA ema{{}, 12};
  EXPECT_TRUE(ema.values.empty());
}

TEST(EMATest, RejectsNonPositivePeriod) {
  EXPECT_THROW(EMA({1.0, 2.0}, 0), std::invalid_argument);
  EXPECT_THROW(EMA({1.0, 2.0}, -3), std::invalid_argument);
}

// === RSI ===
TEST(RSITest, WarmupIsUndefined) {
  auto prices = random_walk(30);
  RSI rsi{prices, 14};

  ASSERT_EQ(rsi.values.size(), prices.size());
  for (size_t i = 0; i < 14; ++i)
    EXPECT_FALSE(rsi.values[i].has_value()) << "index " << i;
  for (size_t i = 14; i < prices.size(); ++i)
    EXPECT_TRUE(rsi.values[i].has_value()) << "index " << i;
}

TEST(RSITest, ShortSeriesIsAllUndefined) {
  std::vector<double> prices(14, 100.0);
  RSI rsi{prices, 14};

  ASSERT_EQ(rsi.values.size(), 14u);
  for (auto& v : rsi.values)
    EXPECT_FALSE(v.has_value());
}

TEST(RSITest, EmptySeries) {
  RSI rsi{{}, 14};
  EXPECT_TRUE(rsi.values.empty());
}

TEST(RSITest, HandComputedWilderSmoothing) {
  // deltas +1 -1 +1, seed gain = loss = 0.5 -> 50, then 0.75 / 0.25 -> 75
  RSI rsi{{1.0, 2.0, 1.0, 2.0}, 2};
  EXPECT_FALSE(rsi.values[1].has_value());
  ASSERT_TRUE(rsi.values[2].has_value());
  EXPECT_NEAR(*rsi.values[2], 50.0, 1e-9);
  ASSERT_TRUE(rsi.values[3].has_value());
  EXPECT_NEAR(*rsi.values[3], 75.0, 1e-9);
}

TEST(RSITest, ValueStaysInRange) {
  for (unsigned seed : {1u, 7u, 99u}) {
    auto prices = random_walk(300, seed);
    RSI rsi{prices};
    for (auto& v : rsi.values) {
      if (!v)
        continue;
      EXPECT_GE(*v, 0.0);
      EXPECT_LE(*v, 100.0);
    }
  }
}

TEST(RSITest, RisingPricesReach100) {
  std::vector<double> prices;
  for (int i = 0; i < 40; ++i)
    prices.push_back(100.0 + i);

  RSI rsi{prices};
  for (size_t i = 14; i < prices.size(); ++i) {
    ASSERT_TRUE(rsi.values[i].has_value());
    EXPECT_DOUBLE_EQ(*rsi.values[i], 100.0);
  }
}

TEST(RSITest, FallingPricesReach0) {
  std::vector<double> prices;
  for (int i = 0; i < 40; ++i)
    prices.push_back(200.0 - i);

  RSI rsi{prices};
  ASSERT_TRUE(rsi.values.back().has_value());
  EXPECT_NEAR(*rsi.values.back(), 0.0, 1e-9);
}

TEST(RSITest, FlatMarketFallsBackToNeutral) {
  std::vector<double> prices(30, 42.0);
  RSI rsi{prices};
  for (size_t i = 14; i < prices.size(); ++i) {
    ASSERT_TRUE(rsi.values[i].has_value());
    EXPECT_DOUBLE_EQ(*rsi.values[i], RSI::flat_value);
  }
}

TEST(RSITest, RejectsNonPositivePeriod) {
  EXPECT_THROW(RSI({1.0, 2.0, 3.0}, 0), std::invalid_argument);
}

// === MACD ===
TEST(MACDTest, HistogramIsTrendMinusSignal) {
  auto prices = random_walk(120);
  MACD macd{prices};

  ASSERT_EQ(macd.macd_line.size(), prices.size());
  ASSERT_EQ(macd.histogram.size(), prices.size());
  for (size_t i = 0; i < prices.size(); ++i)
    EXPECT_NEAR(macd.histogram[i], macd.macd_line[i] - macd.signal(i), 1e-12);
}

TEST(MACDTest, TrendLineIsFastMinusSlowEMA) {
  auto prices = random_walk(80, 3);
  MACD macd{prices, 12, 26, 9};
  EMA fast{prices, 12};
  EMA slow{prices, 26};

  for (size_t i = 0; i < prices.size(); ++i)
    EXPECT_NEAR(macd.macd_line[i], fast.values[i] - slow.values[i], 1e-12);
}

TEST(MACDTest, DefinedFromFirstBar) {
  MACD macd{{100.0, 101.0}};
  ASSERT_EQ(macd.histogram.size(), 2u);
  EXPECT_DOUBLE_EQ(macd.histogram[0], 0.0);
}

TEST(MACDTest, ConstantPriceHasFlatHistogram) {
  std::vector<double> prices(50, 10.0);
  MACD macd{prices};
  for (double h : macd.histogram)
    EXPECT_DOUBLE_EQ(h, 0.0);
}

TEST(MACDTest, EmptySeries) {
  MACD macd{{}};
  EXPECT_TRUE(macd.macd_line.empty());
  EXPECT_TRUE(macd.histogram.empty());
}

TEST(MACDTest, RejectsNonPositivePeriods) {
  std::vector<double> prices = {1, 2, 3};
  EXPECT_THROW(MACD(prices, 0, 26, 9), std::invalid_argument);
  EXPECT_THROW(MACD(prices, 12, 26, -1), std::invalid_argument);
}
