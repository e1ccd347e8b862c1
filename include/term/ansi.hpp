#pragma once
#include <string_view>

namespace ansi
{
inline constexpr std::string_view RESET  = "\x1b[0m";
inline constexpr std::string_view RED    = "\x1b[31m";
inline constexpr std::string_view GREEN  = "\x1b[32m";
inline constexpr std::string_view YELLOW = "\x1b[33m";

inline constexpr std::string_view DIM       = "\x1b[2;37m";   // dim, white
inline constexpr std::string_view BOLD_BLUE = "\x1b[1;34m";   // bold, blue
inline constexpr std::string_view NORMAL    = "\x1b[22;39m";  // normal, default

// erase to start of line, carriage return
inline constexpr std::string_view CLEAR_LINE = "\x1b[1K\r";
}  // namespace ansi
