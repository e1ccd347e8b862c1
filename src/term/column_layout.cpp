#include <algorithm>

#include "term/column_layout.hpp"
#include "util/log.hpp"

namespace term
{

ColumnLayout layout_columns(const std::vector<std::size_t> &widths,
                            std::size_t                     max_width,
                            std::size_t                     extra_per_column)
{
    ColumnLayout single;
    if (widths.empty())
        return single;

    const auto [shortest_it, longest_it] = std::minmax_element(widths.begin(), widths.end());
    single.columns.push_back(*longest_it);

    const std::size_t n     = widths.size();
    std::size_t       lower = max_width / (*longest_it + extra_per_column);
    std::size_t       upper = max_width / (*shortest_it + extra_per_column);
    lower                   = std::min(lower, n);
    upper                   = std::min(upper, n);
    if (lower == 0)
    {
        LOG_DEBUG("longest entry (%zu) does not fit in %zu, one per line", *longest_it,
                  max_width);
        return single;
    }

    // candidate k has k columns; every candidate is fed all entries at once
    struct Candidate
    {
        std::vector<std::size_t> cols;
        std::size_t              total = 0;
        bool                     alive = true;
    };
    std::vector<Candidate> cand;
    cand.reserve(upper - lower + 1);
    for (std::size_t k = lower; k <= upper; ++k)
    {
        Candidate c;
        c.cols.assign(k, 0);
        cand.push_back(std::move(c));
    }

    for (std::size_t i = 0; i < n; ++i)
    {
        const std::size_t w = widths[i] + extra_per_column;
        for (auto &c : cand)
        {
            if (!c.alive)
                continue;
            std::size_t &slot = c.cols[i % c.cols.size()];
            if (w > slot)
            {
                c.total += w - slot;
                slot = w;
            }
            if (c.total > max_width)
                c.alive = false;
        }
    }

    for (auto it = cand.rbegin(); it != cand.rend(); ++it)
    {
        if (!it->alive)
            continue;
        ColumnLayout out;
        out.fits = true;
        out.columns.reserve(it->cols.size());
        for (std::size_t w : it->cols)
            out.columns.push_back(w - extra_per_column);
        return out;
    }

    // lower never exceeds the width budget of its longest entries
    LOG_WARN("no column count survived for %zu entries in %zu", n, max_width);
    return single;
}

void render_columns(std::ostream                   &out,
                    const std::vector<std::string> &cells,
                    const std::vector<std::size_t> &widths,
                    const ColumnLayout             &layout)
{
    const std::size_t ncols = layout.fits ? layout.columns.size() : 1;
    std::string       line;
    for (std::size_t i = 0; i < cells.size(); ++i)
    {
        const std::size_t col = i % ncols;
        line += cells[i];
        if (col + 1 < ncols && i + 1 < cells.size())
        {
            const std::size_t cw = layout.columns[col];
            const std::size_t w  = i < widths.size() ? widths[i] : cw;
            line.append(cw > w ? cw - w : 0, ' ');
            line.append(COLUMN_GAP, ' ');
        }
        else
        {
            while (!line.empty() && line.back() == ' ')
                line.pop_back();
            out << line << '\n';
            line.clear();
        }
    }
}

}  // namespace term
