#pragma once
#include <cstddef>

namespace term
{

// Width of the terminal on stdout: TIOCGWINSZ, then $COLUMNS, then 80
std::size_t term_columns();

bool stdout_is_terminal();

}  // namespace term
