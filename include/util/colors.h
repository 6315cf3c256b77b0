#pragma once

#include <string_view>

// Reset code
inline constexpr std::string_view RESET = "\033[0m";

inline constexpr std::string_view BOLD = "\033[1m";

// Foreground colors
inline constexpr std::string_view BRIGHT_RED = "\033[91m";
inline constexpr std::string_view BRIGHT_GREEN = "\033[92m";
