#pragma once
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace term
{

// Separator between columns; quoting adds the same amount again
inline constexpr std::size_t COLUMN_GAP = 2;

struct ColumnLayout
{
    std::vector<std::size_t> columns;  // per-column width, true maxima
    bool                     fits = false;  // false => one entry per line
};

// ============================================================================
// Function: layout_columns
// - In: print widths of every entry, line width, extra chars per column
//       (gap plus quoting)
// - Out: the largest column count whose row fits in max_width, entries
//        assigned to column (index % count)
// - Note: no entries, or a longest entry that cannot fit even alone, gives
//         a single column with fits == false
// ============================================================================
ColumnLayout layout_columns(const std::vector<std::size_t> &widths,
                            std::size_t                     max_width,
                            std::size_t                     extra_per_column);

// Writes cells row by row. widths[i] is the print width of cells[i] without
// any quoting or color, which is how the cell is padded to its column.
void render_columns(std::ostream                   &out,
                    const std::vector<std::string> &cells,
                    const std::vector<std::size_t> &widths,
                    const ColumnLayout             &layout);

}  // namespace term
