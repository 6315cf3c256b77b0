#pragma once

#include "sig/divergence.h"

#include <string>
#include <string_view>
#include <vector>

struct ScanRow;

template <typename T>
std::string to_str(const T& t);

template <>
std::string to_str(const Divergence& type);

template <>
std::string to_str(const DivergenceDetails& details);

// Text of the confirmation column.
template <>
std::string to_str(const Signal& signal);

std::string colored(std::string_view str, std::string_view color);

std::string render_report(const std::string& symbol,
                          const std::vector<ScanRow>& rows,
                          bool color_en = true);
