#include "util/format.h"
#include "core/scanner.h"
#include "sig/divergence.h"
#include "util/colors.h"

#include <algorithm>
#include <array>
#include <format>

template <>
std::string to_str(const Divergence& type) {
  switch (type) {
    case Divergence::Bullish:
      return "BULLISH DIV";
    case Divergence::Bearish:
      return "BEARISH DIV";
    default:
      return "Neutral";
  }
}

template <>
std::string to_str(const DivergenceDetails& d) {
  return std::format("P:{:.0f}->{:.0f} RSI:{:.0f}->{:.0f}",  //
                     d.prev_price, d.last_price, d.prev_momentum,
                     d.last_momentum);
}

template <>
std::string to_str(const Signal& signal) {
  switch (signal.confirmation) {
    case Confirmation::Confirmed:
      return signal.type == Divergence::Bullish ? "YES (rising)"
                                                : "YES (falling)";
    case Confirmation::NotConfirmed:
      return "NO";
    default:
      return "-";
  }
}

std::string colored(std::string_view str, std::string_view color) {
  return std::format("{}{}{}", color, str, RESET);
}

inline constexpr size_t N_COLUMNS = 5;
using Cells = std::array<std::string, N_COLUMNS>;

inline Cells to_cells(const ScanRow& row) {
  auto& [timeframe, report] = row;
  auto& signal = report.signal;
  return {
      timeframe,
      std::format("${:.2f}", report.last_close),
      to_str(signal.type),
      to_str(signal),
      signal.details ? to_str(*signal.details) : "-",
  };
}

inline std::string_view color_of(Divergence type) {
  switch (type) {
    case Divergence::Bullish:
      return BRIGHT_GREEN;
    case Divergence::Bearish:
      return BRIGHT_RED;
    default:
      return "";
  }
}

inline std::string repeat(std::string_view s, size_t n) {
  std::string out;
  for (size_t i = 0; i < n; i++)
    out += s;
  return out;
}

inline std::string rule(const std::array<size_t, N_COLUMNS>& widths,
                        std::string_view left,
                        std::string_view mid,
                        std::string_view right) {
  std::string line{left};
  for (size_t c = 0; c < N_COLUMNS; c++) {
    line += repeat("─", widths[c] + 2);
    line += c + 1 < N_COLUMNS ? mid : right;
  }
  return line + "\n";
}

// Cell text is plain ASCII, so byte length is the display width.
std::string render_report(const std::string& symbol,
                          const std::vector<ScanRow>& rows,
                          bool color_en) {
  const Cells headers = {"Timeframe", "Price", "Signal", "MACD Conf.",
                         "Details"};

  std::vector<Cells> body;
  for (auto& row : rows)
    body.push_back(to_cells(row));

  std::array<size_t, N_COLUMNS> widths{};
  for (size_t c = 0; c < N_COLUMNS; c++) {
    widths[c] = headers[c].size();
    for (auto& cells : body)
      widths[c] = std::max(widths[c], cells[c].size());
  }

  auto line = [&](const Cells& cells, std::string_view color) {
    std::string out = "│";
    for (size_t c = 0; c < N_COLUMNS; c++) {
      auto cell = std::format(" {:<{}} ", cells[c], widths[c]);
      // only the signal column is colored
      if (c == 2 && color_en && !color.empty())
        cell = colored(cell, color);
      out += cell + "│";
    }
    return out + "\n";
  };

  std::string banner = std::string(75, '=');
  std::string title = std::format("DIVERGENCE REPORT ({})", symbol);

  std::string out;
  out += banner + "\n";
  out += (color_en ? colored(title, BOLD) : title) + "\n";
  out += banner + "\n";

  out += rule(widths, "┌", "┬", "┐");
  out += line(headers, "");
  for (size_t r = 0; r < body.size(); r++) {
    out += rule(widths, "├", "┼", "┤");
    out += line(body[r], color_of(rows[r].report.signal.type));
  }
  out += rule(widths, "└", "┴", "┘");

  if (rows.empty())
    out += "no timeframe had enough data\n";

  return out;
}
